#pragma once

#include <chrono>
#include <ctime>
#include <filesystem>
#include <set>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include <plog/Severity.h>

#include "relaysync/notifications/notification_type.hpp"

namespace relaysync
{
namespace config
{
/**
 * @brief Tunable settings for the messaging and notification services.
 * @remark Every field has a usable default, so an empty JSON object is a valid configuration.
 * Unknown JSON keys are ignored.
 */
struct ClientConfig
{
    std::vector<std::string> readRelays; ///< Relays queried for messages and notifications.
    std::vector<std::string> writeRelays; ///< Relays messages are published to.  Defaults to the read relays.
    std::string wrappedRelay; ///< An extra relay dedicated to gift-wrapped messages, or empty.

    bool useWrappedScheme = false; ///< Send with NIP-17 gift wraps, falling back to NIP-04.

    std::chrono::milliseconds backlogTimeout{ 3000 }; ///< Bound on the message backlog fan-out.
    std::chrono::milliseconds notificationTimeout{ 8000 }; ///< Bound on the notification fan-out.
    std::chrono::milliseconds profileTimeout{ 5000 }; ///< Bound on profile and note lookups.
    std::chrono::milliseconds publishTimeout{ 5000 }; ///< How long to wait for relay OK messages.

    std::time_t messageLookbackSeconds = 30 * 24 * 60 * 60; ///< Window of the broad gift wrap query.
    std::time_t recentFollowerWindowSeconds = 7 * 24 * 60 * 60; ///< How long a follower stays "recent".
    std::time_t initialFollowerBackdateSeconds = 30 * 24 * 60 * 60; ///< Age given to first-run followers.

    int messageQueryLimit = 500;
    int wrappedWindowLimit = 100;
    int notificationQueryLimit = 100;
    size_t maxNotifications = 100; ///< The feed keeps at most this many non-follow items.

    std::set<notifications::NotificationType> enabledNotifications = notifications::allNotificationTypes();

    plog::Severity logSeverity = plog::info;

    /**
     * @brief Gets the relays messages are published to.
     */
    std::vector<std::string> publishRelays() const;

    /**
     * @brief Gets the read relays together with the dedicated gift wrap relay, without duplicates.
     */
    std::vector<std::string> subscriptionRelays() const;

    /**
     * @brief Checks the configuration for values the services cannot work with.
     * @throws `std::invalid_argument` describing the first invalid value.
     */
    void validate() const;

    /**
     * @brief Serializes the configuration to a JSON object using the same keys `fromJson` reads.
     */
    nlohmann::json toJson() const;

    /**
     * @brief Reads a configuration from a JSON object.
     * @throws `std::invalid_argument` if a value has the wrong type or fails validation.
     */
    static ClientConfig fromJson(const nlohmann::json& j);

    /**
     * @brief Reads a configuration from a JSON file.
     * @throws `std::runtime_error` if the file cannot be read or parsed.
     * @throws `std::invalid_argument` if a value has the wrong type or fails validation.
     */
    static ClientConfig fromFile(const std::filesystem::path& path);
};
} // namespace config
} // namespace relaysync
