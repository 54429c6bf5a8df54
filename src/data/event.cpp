#include <algorithm>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include "relaysync/data/data.hpp"

using namespace nlohmann;
using namespace relaysync::data;
using namespace std;

string Event::serialize()
{
    this->validate();

    // Generate the event ID from the serialized data.
    this->generateId();

    json j = *this;
    return j.dump();
};

Event Event::fromString(string jstr)
{
    json j = json::parse(jstr);
    return Event::fromJson(j);
};

Event Event::fromJson(json j)
{
    Event event = j.get<Event>();
    return event;
};

string Event::firstTagValue(const string& name) const
{
    for (const auto& tag : this->tags)
    {
        if (tag.size() > 1 && tag[0] == name && !tag[1].empty())
        {
            return tag[1];
        }
    }

    return string();
};

vector<string> Event::taggedValues(const string& name) const
{
    vector<string> values;
    for (const auto& tag : this->tags)
    {
        if (tag.size() > 1 && tag[0] == name)
        {
            values.push_back(tag[1]);
        }
    }

    return values;
};

bool Event::hasTag(const string& name, const string& value) const
{
    return any_of(this->tags.begin(), this->tags.end(), [&name, &value](const vector<string>& tag)
    {
        return tag.size() > 1 && tag[0] == name && tag[1] == value;
    });
};

void Event::validate()
{
    bool hasPubkey = this->pubkey.length() > 0;
    if (!hasPubkey)
    {
        throw invalid_argument("Event::validate: The pubkey of the event author is required.");
    }

    bool hasCreatedAt = this->createdAt > 0;
    if (!hasCreatedAt)
    {
        this->createdAt = time(nullptr);
    }

    bool hasKind = this->kind >= 0 && this->kind <= 65535;
    if (!hasKind)
    {
        throw invalid_argument("Event::validate: A valid event kind is required.");
    }
};

void Event::generateId()
{
    // Create a JSON array of values used to generate the event ID.
    json arr = { 0, this->pubkey, this->createdAt, this->kind, this->tags, this->content };
    string serializedData = arr.dump();

    unsigned char hash[SHA256_DIGEST_LENGTH];
    EVP_Digest(serializedData.c_str(), serializedData.length(), hash, NULL, EVP_sha256(), NULL);

    stringstream ss;
    for (int i = 0; i < SHA256_DIGEST_LENGTH; i++)
    {
        ss << hex << setw(2) << setfill('0') << (int)hash[i];
    }

    this->id = ss.str();
};

bool Event::operator==(const Event& other) const
{
    if (this->id.empty())
    {
        throw invalid_argument("Event::operator==: Cannot check equality, the left-side argument is undefined.");
    }
    if (other.id.empty())
    {
        throw invalid_argument("Event::operator==: Cannot check equality, the right-side argument is undefined.");
    }

    return this->id == other.id;
};

EventKind relaysync::data::kindOf(int kind)
{
    switch (kind)
    {
    case 0:
        return EventKind::Metadata;
    case 1:
        return EventKind::TextNote;
    case 3:
        return EventKind::ContactList;
    case 4:
        return EventKind::EncryptedDirectMessage;
    case 6:
        return EventKind::Repost;
    case 7:
        return EventKind::Reaction;
    case 13:
        return EventKind::Seal;
    case 14:
        return EventKind::PrivateDirectMessage;
    case 1059:
        return EventKind::GiftWrap;
    case 9735:
        return EventKind::ZapReceipt;
    case 9736:
        return EventKind::TipDisclosure;
    default:
        return EventKind::Unknown;
    }
};

int relaysync::data::kindNumber(EventKind kind)
{
    switch (kind)
    {
    case EventKind::Metadata:
        return 0;
    case EventKind::TextNote:
        return 1;
    case EventKind::ContactList:
        return 3;
    case EventKind::EncryptedDirectMessage:
        return 4;
    case EventKind::Repost:
        return 6;
    case EventKind::Reaction:
        return 7;
    case EventKind::Seal:
        return 13;
    case EventKind::PrivateDirectMessage:
        return 14;
    case EventKind::GiftWrap:
        return 1059;
    case EventKind::ZapReceipt:
        return 9735;
    case EventKind::TipDisclosure:
        return 9736;
    default:
        throw invalid_argument("kindNumber: The unknown kind has no kind number.");
    }
};

bool relaysync::data::isValidPublicKey(const string& pubkey)
{
    return pubkey.size() == 64
        && all_of(pubkey.begin(), pubkey.end(), [](char c)
        {
            return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
        });
};

void adl_serializer<Event>::to_json(json& j, const Event& event)
{
    j = {
        { "id", event.id },
        { "pubkey", event.pubkey },
        { "created_at", event.createdAt },
        { "kind", event.kind },
        { "tags", event.tags },
        { "content", event.content },
        { "sig", event.sig },
    };
}

void adl_serializer<Event>::from_json(const json& j, Event& event)
{
    // Rumors are unsigned, and so carry no signature and possibly no ID.
    event.id = j.value("id", string());
    event.pubkey = j.at("pubkey").get<string>();
    event.createdAt = j.at("created_at").get<time_t>();
    event.kind = j.at("kind").get<int>();
    event.tags = j.at("tags").get<vector<vector<string>>>();
    event.content = j.at("content").get<string>();
    event.sig = j.value("sig", string());
}
