#pragma once

#include <memory>

#include <plog/Init.h>
#include <plog/Log.h>

namespace relaysync
{
namespace internal
{
/**
 * @brief Routes the default plog instance to the given appender.
 * @remark Only the first call takes effect, so services sharing a process share one logger.  plog
 * keeps a raw pointer to the appender, which must outlive all logging.
 */
inline void initLogging(const std::shared_ptr<plog::IAppender>& appender, plog::Severity severity = plog::debug)
{
    if (appender != nullptr && plog::get() == nullptr)
    {
        plog::init(severity, appender.get());
    }
};
} // namespace internal
} // namespace relaysync
