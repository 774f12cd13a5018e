#pragma once

#include <plog/Log.h>
#include <noscrypt.h>

/*
* @brief Logs the noscrypt call that failed, the reason noscrypt gives for the failure, and the
* position of the offending argument.
*/
#define NOSTD_LOG_NC_ERROR(operation, result) _printNoscryptError(operation, result, __func__, __LINE__)

const char* _describeNoscryptError(int code);

void _printNoscryptError(const char *operation, NCResult result, const char *func, int line);
