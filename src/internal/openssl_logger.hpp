#pragma once

#include <plog/Log.h>

/*
* @brief Logs the operation that failed together with every error queued by OpenSSL on the
* current thread, then clears the queue.
*/
#define NOSTD_LOG_OPENSSL_ERROR(operation) _printOpenSslError(operation, __func__, __LINE__)

void _printOpenSslError(const char *operation, const char *func, int line);
