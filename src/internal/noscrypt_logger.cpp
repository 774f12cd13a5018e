#include "noscrypt_logger.hpp"

const char* _describeNoscryptError(int code)
{
    switch (code)
    {
    case E_NULL_PTR:
        return "null pointer";
    case E_INVALID_ARG:
        return "invalid argument";
    case E_INVALID_CONTEXT:
        return "invalid context";
    case E_ARGUMENT_OUT_OF_RANGE:
        return "argument out of range";
    case E_OPERATION_FAILED:
        return "operation failed";
    default:
        return "unknown error";
    }
}

void _printNoscryptError(const char *operation, NCResult result, const char *func, int line)
{
    uint8_t argPosition = 0;
    int code = NCParseErrorCode(result, &argPosition);

    // The position is promoted so plog prints a number rather than a character.
    PLOG_ERROR << "noscrypt - error: " << operation << " failed in " << func << " at line " << line
               << ": " << _describeNoscryptError(code) << " (result " << result << ", argument "
               << +argPosition << ")";
}
