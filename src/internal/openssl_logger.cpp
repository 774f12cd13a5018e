#include <openssl/err.h>

#include "openssl_logger.hpp"

void _printOpenSslError(const char *operation, const char *func, int line)
{
    unsigned long code = ERR_get_error();
    if (code == 0)
    {
        PLOG_ERROR << "openssl - error: " << operation << " failed in " << func << " at line " << line;
        return;
    }

    char message[256];
    while (code != 0)
    {
        ERR_error_string_n(code, message, sizeof(message));
        PLOG_ERROR << "openssl - error: " << operation << " failed in " << func << " at line " << line << ": " << message;
        code = ERR_get_error();
    }
}
