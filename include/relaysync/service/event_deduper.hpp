#pragma once

#include <mutex>
#include <string>
#include <unordered_set>

#include "relaysync/data/data.hpp"

namespace relaysync
{
namespace service
{
/**
 * @brief Admits each event ID at most once.
 * @remark A deduper belongs to a single fan-out operation and is discarded with it, so its
 * memory is bounded by that operation's result.  It is safe to share across relay callbacks.
 */
class EventDeduper
{
public:
    /**
     * @brief Records the event as seen.
     * @returns True the first time an event ID is seen, false afterwards.  Events without an ID
     * are never admitted.
     */
    bool admit(const data::Event& event);

    /**
     * @brief Gets the number of distinct event IDs admitted so far.
     */
    size_t size() const;

private:
    mutable std::mutex _propertyMutex;

    std::unordered_set<std::string> _seenIds;
};
} // namespace service
} // namespace relaysync
