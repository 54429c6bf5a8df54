#pragma once

#include <ctime>
#include <memory>
#include <mutex>
#include <string>

#include "relaysync/storage/persistence.hpp"

namespace relaysync
{
namespace storage
{
/**
 * @brief Durable last-viewed timestamps used for unread accounting.
 * @remark Watermarks only move forward.  An absent or unreadable watermark reads as zero, so
 * everything counts as unread until the user first acknowledges it.
 */
class WatermarkStore
{
public:
    inline static const std::string MESSAGES = "messages";
    inline static const std::string NOTIFICATIONS = "notifications";

    WatermarkStore(std::shared_ptr<IPersistence> persistence);

    /**
     * @brief Gets the watermark for the given feed name.
     */
    std::time_t get(const std::string& name) const;

    /**
     * @brief Advances the watermark for the given feed name.
     * @returns True if the stored watermark moved, false if the given timestamp was not newer.
     */
    bool advance(const std::string& name, std::time_t timestamp);

    /**
     * @brief Builds the feed name of the watermark for a single conversation.
     */
    static std::string peerKey(const std::string& peerPubkey);

private:
    inline static const std::string KEY_PREFIX = "watermark:";

    mutable std::mutex _propertyMutex;

    std::shared_ptr<IPersistence> _persistence;

    std::time_t _read(const std::string& name) const;
};
} // namespace storage
} // namespace relaysync
