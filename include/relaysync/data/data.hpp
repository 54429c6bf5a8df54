#pragma once

#include <ctime>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>
#include <openssl/evp.h>
#include <openssl/sha.h>

namespace relaysync
{
namespace data
{
/**
 * @brief The event kinds the client understands.
 * @remark Every kind number outside this set maps to `Unknown`, which consumers ignore.
 */
enum class EventKind
{
    Unknown,
    Metadata, ///< Kind 0, profile metadata.
    TextNote, ///< Kind 1, short text note.
    ContactList, ///< Kind 3, follow list.
    EncryptedDirectMessage, ///< Kind 4, NIP-04 direct message.
    Repost, ///< Kind 6.
    Reaction, ///< Kind 7.
    Seal, ///< Kind 13, NIP-59 seal.
    PrivateDirectMessage, ///< Kind 14, NIP-17 rumor.
    GiftWrap, ///< Kind 1059, NIP-59 gift wrap.
    ZapReceipt, ///< Kind 9735.
    TipDisclosure ///< Kind 9736.
};

/**
 * @brief Maps a kind number to its `EventKind`.
 */
EventKind kindOf(int kind);

/**
 * @brief Maps an `EventKind` to its kind number.
 * @throws `std::invalid_argument` if the kind is `EventKind::Unknown`.
 */
int kindNumber(EventKind kind);

/**
 * @brief Checks that a string is a public key in the hex form used on the wire: 64 lowercase hex
 * characters.
 */
bool isValidPublicKey(const std::string& pubkey);

/**
 * @brief A Nostr event.
 * @remark All data transmitted over the Nostr protocol is encoded in JSON blobs.  This struct
 * is common to every Nostr event kind.  The significance of each event is determined by the
 * `tags` and `content` fields.
*/
struct Event
{
    std::string id; ///< SHA-256 hash of the event data.
    std::string pubkey; ///< Public key of the event creator.
    std::time_t createdAt = 0; ///< Unix timestamp of the event creation.
    int kind = 0; ///< Event kind.
    std::vector<std::vector<std::string>> tags; ///< Arbitrary event metadata.
    std::string content; ///< Event content.
    std::string sig; ///< Hex-encoded Schnorr signature over the event ID.

    /**
     * @brief Serializes the event to a JSON object.
     * @returns A stringified JSON object representing the event.
     * @throws `std::invalid_argument` if the event object is invalid.
     * @remark The event ID is regenerated from the event data on each call.
     */
    std::string serialize();

    /**
     * @brief Deserializes the event from a JSON string.
     * @param jsonString A stringified JSON object representing the event.
     * @returns An event instance created from the JSON string.
     * @throws `nlohmann::json::exception` if the string is not a valid event object.
     */
    static Event fromString(std::string jsonString);

    /**
     * @brief Deserializes the event from a JSON object.
     * @param j A JSON object representing the event.
     * @returns An event instance created from the JSON object.
     * @remark The `id` and `sig` fields may be absent, as they are on unsigned rumors.
     */
    static Event fromJson(nlohmann::json j);

    /**
     * @brief Gets the first non-empty value of the first tag with the given name.
     * @returns The tag value, or an empty string if the event has no such tag.
     */
    std::string firstTagValue(const std::string& name) const;

    /**
     * @brief Gets the values of every tag with the given name.
     */
    std::vector<std::string> taggedValues(const std::string& name) const;

    /**
     * @brief Indicates whether the event carries a tag with the given name and value.
     */
    bool hasTag(const std::string& name, const std::string& value) const;

    /**
     * @brief Compares two events for equality.
     * @remark Two events are considered equal if they have the same ID, since the ID is uniquely
     * generated from the event data.  If the `id` field is empty for either event, the comparison
     * function will throw an exception.
     */
    bool operator==(const Event& other) const;

private:
    /**
     * @brief Validates the event.
     * @throws `std::invalid_argument` if the event object is invalid.
     * @remark The `createdAt` field defaults to the present if it is not already set.
     */
    void validate();

    /**
     * @brief Generates an ID for the event and assigns it to the `id` field.
     * @remark The ID is a 32-bytes lowercase hex-encoded sha256 of the serialized event data.
     */
    void generateId();
};

/**
 * @brief A set of filters for querying Nostr relays.
 * @remark The `limit` field should always be included to keep the response size reasonable.
 * The `since` and `until` fields are only sent when set.  At least one of the other fields must
 * be set for a valid filter.
 */
struct Filters
{
    std::vector<std::string> ids; ///< Event IDs.
    std::vector<std::string> authors; ///< Event author pubkeys.
    std::vector<int> kinds; ///< Kind numbers.
    std::unordered_map<std::string, std::vector<std::string>> tags; ///< Tag names mapped to lists of tag values.
    std::time_t since = 0; ///< Unix timestamp.  Matching events must be newer than this.
    std::time_t until = 0; ///< Unix timestamp.  Matching events must be older than this.
    int limit = 0; ///< The maximum number of events the relay should return on the initial query.

    /**
     * @brief Serializes the filters to a REQ message.
     * @param subscriptionId A string up to 64 chars in length that is unique per relay connection.
     * @returns A stringified JSON array of the form `["REQ", subscriptionId, filters]`.
     * @throws `std::invalid_argument` if the filter object is invalid.
     * @remarks The Nostr client is responsible for managing subscription IDs.  Responses from the
     * relay will be organized by subscription ID.
     */
    std::string serialize(const std::string& subscriptionId) const;

    /**
     * @brief Serializes several filter sets into a single REQ message.
     * @returns A stringified JSON array of the form `["REQ", subscriptionId, f1, f2, ...]`.
     * @throws `std::invalid_argument` if the list is empty or any filter object is invalid.
     * @remark A relay returns the union of the events matched by each filter set.
     */
    static std::string serialize(
        const std::string& subscriptionId,
        const std::vector<std::shared_ptr<Filters>>& filters);

    /**
     * @brief Validates the filters.
     * @throws `std::invalid_argument` if the filter object is invalid.
     */
    void validate() const;
};
} // namespace data
} // namespace relaysync

namespace nlohmann
{
template <>
struct adl_serializer<relaysync::data::Event>
{
    static void to_json(json& j, const relaysync::data::Event& event);
    static void from_json(const json& j, relaysync::data::Event& event);
};

template <>
struct adl_serializer<relaysync::data::Filters>
{
    static void to_json(json& j, const relaysync::data::Filters& filters);
};
} // namespace nlohmann
