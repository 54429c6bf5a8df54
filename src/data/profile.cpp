#include <stdexcept>
#include <unordered_set>

#include "relaysync/data/profile.hpp"

using namespace nlohmann;
using namespace relaysync::data;
using namespace std;

Profile Profile::fromEvent(const Event& event)
{
    if (kindOf(event.kind) != EventKind::Metadata)
    {
        throw invalid_argument("Profile::fromEvent: The event is not a metadata event.");
    }

    json j = json::parse(event.content);
    if (!j.is_object())
    {
        throw invalid_argument("Profile::fromEvent: The profile metadata is not a JSON object.");
    }

    auto stringField = [&j](const char* key)
    {
        auto it = j.find(key);
        return it != j.end() && it->is_string() ? it->get<string>() : string();
    };

    Profile profile;
    profile.pubkey = event.pubkey;
    profile.displayName = stringField("display_name");
    profile.name = stringField("name");
    profile.picture = stringField("picture");
    profile.about = stringField("about");
    profile.nip05 = stringField("nip05");
    profile.updatedAt = event.createdAt;

    if (profile.name.empty())
    {
        profile.name = profile.displayName.empty() ? "Unknown" : profile.displayName;
    }

    return profile;
};

bool ProfileCache::ingest(const Event& event)
{
    if (kindOf(event.kind) != EventKind::Metadata)
    {
        PLOG_DEBUG << "Ignoring non-metadata event " << event.id;
        return false;
    }

    Profile profile;
    try
    {
        profile = Profile::fromEvent(event);
    }
    catch (const invalid_argument& ia)
    {
        PLOG_WARNING << "Malformed profile metadata in event " << event.id << ": " << ia.what();
        return false;
    }
    catch (const json::exception& je)
    {
        PLOG_WARNING << "Malformed profile metadata in event " << event.id << ": " << je.what();
        return false;
    }

    lock_guard<mutex> lock(this->_propertyMutex);
    auto it = this->_profiles.find(profile.pubkey);
    if (it != this->_profiles.end() && it->second->updatedAt >= profile.updatedAt)
    {
        return false;
    }

    this->_profiles[profile.pubkey] = make_shared<const Profile>(move(profile));
    return true;
};

shared_ptr<const Profile> ProfileCache::find(const string& pubkey) const
{
    lock_guard<mutex> lock(this->_propertyMutex);
    auto it = this->_profiles.find(pubkey);

    return it == this->_profiles.end() ? nullptr : it->second;
};

vector<string> ProfileCache::missing(const vector<string>& pubkeys) const
{
    lock_guard<mutex> lock(this->_propertyMutex);
    unordered_set<string> seen;
    vector<string> result;
    for (const string& pubkey : pubkeys)
    {
        if (this->_profiles.count(pubkey) == 0 && seen.insert(pubkey).second)
        {
            result.push_back(pubkey);
        }
    }

    return result;
};

size_t ProfileCache::size() const
{
    lock_guard<mutex> lock(this->_propertyMutex);
    return this->_profiles.size();
};
