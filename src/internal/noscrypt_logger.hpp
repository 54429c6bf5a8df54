#pragma once

#include <plog/Log.h>
#include <noscrypt.h>

namespace relaysync
{
namespace internal
{
/**
 * @brief Logs a failed noscrypt result code.
 * @param result The result returned by the noscrypt call.
 * @param func The calling function.
 * @param line The line of the failed call.
 * @remark Failed operations, such as MAC mismatches on payloads meant for another key, are
 * logged at debug level; every other failure is an error.
 */
void logNoscryptResult(NCResult result, const char* func, int line);
} // namespace internal
} // namespace relaysync

#define RELAYSYNC_LOG_NC_ERROR(result) ::relaysync::internal::logNoscryptResult(result, __func__, __LINE__)
