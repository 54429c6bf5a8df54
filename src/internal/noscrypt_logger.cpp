#include "noscrypt_logger.hpp"

namespace relaysync
{
namespace internal
{
void logNoscryptResult(NCResult result, const char* func, int line)
{
    uint8_t argPosition = 0;
    int errorCode = NCParseErrorCode(result, &argPosition);
    int position = argPosition;

    switch (errorCode)
    {
    case E_NULL_PTR:
        PLOG_ERROR << "noscrypt: Null argument " << position << " in " << func << ":" << line;
        break;

    case E_INVALID_ARG:
        PLOG_ERROR << "noscrypt: Invalid argument " << position << " in " << func << ":" << line;
        break;

    case E_INVALID_CONTEXT:
        PLOG_ERROR << "noscrypt: Invalid context in " << func << ":" << line;
        break;

    case E_ARGUMENT_OUT_OF_RANGE:
        PLOG_ERROR << "noscrypt: Argument " << position << " out of range in " << func << ":" << line;
        break;

    case E_OPERATION_FAILED:
        // Failed MAC checks land here, which is routine for payloads addressed to someone else.
        PLOG_DEBUG << "noscrypt: Operation failed in " << func << ":" << line;
        break;

    default:
        PLOG_ERROR << "noscrypt: Unknown result " << result << " in " << func << ":" << line;
        break;
    }
}
} // namespace internal
} // namespace relaysync
