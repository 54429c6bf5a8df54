#pragma once

#include <ctime>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <plog/Log.h>

#include "relaysync/data/data.hpp"

namespace relaysync
{
namespace data
{
/**
 * @brief Profile metadata published by a user in a kind 0 event.
 */
struct Profile
{
    std::string pubkey;
    std::string name; ///< Falls back to the display name, then to "Unknown".
    std::string displayName;
    std::string picture;
    std::string about;
    std::string nip05;
    std::time_t updatedAt = 0; ///< Creation time of the metadata event the profile was read from.

    /**
     * @brief Parses a profile from a kind 0 event.
     * @throws `std::invalid_argument` if the event is not a metadata event, or if its content is
     * not a JSON object.
     * @throws `nlohmann::json::exception` if the event content is not valid JSON.
     */
    static Profile fromEvent(const Event& event);
};

/**
 * @brief An owned cache of profiles keyed by public key.
 * @remark The newest metadata event for a public key wins.  All methods are thread-safe.
 */
class ProfileCache
{
public:
    /**
     * @brief Adds the profile carried by the given metadata event to the cache.
     * @returns True if the cache changed, false if the event was older, malformed, or not a
     * metadata event.
     */
    bool ingest(const Event& event);

    /**
     * @brief Looks up the cached profile for the given public key.
     * @returns The profile, or `nullptr` if none is cached.
     */
    std::shared_ptr<const Profile> find(const std::string& pubkey) const;

    /**
     * @brief Gets the subset of the given public keys that have no cached profile.
     * @remark Duplicates in the input appear once in the output.
     */
    std::vector<std::string> missing(const std::vector<std::string>& pubkeys) const;

    size_t size() const;

private:
    mutable std::mutex _propertyMutex;

    std::unordered_map<std::string, std::shared_ptr<const Profile>> _profiles;
};
} // namespace data
} // namespace relaysync
