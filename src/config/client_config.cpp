#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>

#include <plog/Log.h>

#include "relaysync/config/client_config.hpp"

using namespace nlohmann;
using namespace relaysync::config;
using namespace relaysync::notifications;
using namespace std;

#pragma region Local Statics

static bool isRelayUrl(const string& relay)
{
    return relay.rfind("wss://", 0) == 0 && relay.size() > 6;
};

static void appendUnique(vector<string>& relays, const string& relay)
{
    if (!relay.empty() && find(relays.begin(), relays.end(), relay) == relays.end())
    {
        relays.push_back(relay);
    }
};

template <typename T>
static void readField(const json& j, const char* key, T& field)
{
    auto it = j.find(key);
    if (it == j.end())
    {
        return;
    }

    try
    {
        field = it->get<T>();
    }
    catch (const json::exception& je)
    {
        throw invalid_argument(string("ClientConfig::fromJson: Invalid value for '") + key + "': " + je.what());
    }
};

static void readMilliseconds(const json& j, const char* key, chrono::milliseconds& field)
{
    long long count = field.count();
    readField(j, key, count);
    field = chrono::milliseconds(count);
};

#pragma endregion

vector<string> ClientConfig::publishRelays() const
{
    return this->writeRelays.empty() ? this->readRelays : this->writeRelays;
};

vector<string> ClientConfig::subscriptionRelays() const
{
    vector<string> relays;
    for (const string& relay : this->readRelays)
    {
        appendUnique(relays, relay);
    }
    appendUnique(relays, this->wrappedRelay);

    return relays;
};

void ClientConfig::validate() const
{
    vector<string> relays = this->readRelays;
    relays.insert(relays.end(), this->writeRelays.begin(), this->writeRelays.end());
    if (!this->wrappedRelay.empty())
    {
        relays.push_back(this->wrappedRelay);
    }

    for (const string& relay : relays)
    {
        if (!isRelayUrl(relay))
        {
            throw invalid_argument("ClientConfig::validate: '" + relay + "' is not a secure WebSocket URL.");
        }
    }

    bool hasTimeouts = this->backlogTimeout.count() > 0
        && this->notificationTimeout.count() > 0
        && this->profileTimeout.count() > 0
        && this->publishTimeout.count() > 0;
    if (!hasTimeouts)
    {
        throw invalid_argument("ClientConfig::validate: Timeouts must be positive.");
    }

    bool hasWindows = this->messageLookbackSeconds > 0
        && this->recentFollowerWindowSeconds > 0
        && this->initialFollowerBackdateSeconds > 0;
    if (!hasWindows)
    {
        throw invalid_argument("ClientConfig::validate: Time windows must be positive.");
    }

    // First-run followers must start outside the recent window, or they would surface at once.
    if (this->initialFollowerBackdateSeconds <= this->recentFollowerWindowSeconds)
    {
        throw invalid_argument("ClientConfig::validate: The initial follower backdate must exceed the recent follower window.");
    }

    bool hasLimits = this->messageQueryLimit > 0
        && this->wrappedWindowLimit > 0
        && this->notificationQueryLimit > 0
        && this->maxNotifications > 0;
    if (!hasLimits)
    {
        throw invalid_argument("ClientConfig::validate: Query limits must be positive.");
    }
};

json ClientConfig::toJson() const
{
    json enabled = json::array();
    for (NotificationType type : this->enabledNotifications)
    {
        enabled.push_back(toString(type));
    }

    string severity = plog::severityToString(this->logSeverity);
    transform(severity.begin(), severity.end(), severity.begin(), [](unsigned char c) { return tolower(c); });

    return {
        { "readRelays", this->readRelays },
        { "writeRelays", this->writeRelays },
        { "wrappedRelay", this->wrappedRelay },
        { "useWrappedScheme", this->useWrappedScheme },
        { "backlogTimeoutMs", this->backlogTimeout.count() },
        { "notificationTimeoutMs", this->notificationTimeout.count() },
        { "profileTimeoutMs", this->profileTimeout.count() },
        { "publishTimeoutMs", this->publishTimeout.count() },
        { "messageLookbackSeconds", this->messageLookbackSeconds },
        { "recentFollowerWindowSeconds", this->recentFollowerWindowSeconds },
        { "initialFollowerBackdateSeconds", this->initialFollowerBackdateSeconds },
        { "messageQueryLimit", this->messageQueryLimit },
        { "wrappedWindowLimit", this->wrappedWindowLimit },
        { "notificationQueryLimit", this->notificationQueryLimit },
        { "maxNotifications", this->maxNotifications },
        { "enabledNotifications", enabled },
        { "logLevel", severity }
    };
};

ClientConfig ClientConfig::fromJson(const json& j)
{
    if (!j.is_object())
    {
        throw invalid_argument("ClientConfig::fromJson: The configuration must be a JSON object.");
    }

    ClientConfig config;
    readField(j, "readRelays", config.readRelays);
    readField(j, "writeRelays", config.writeRelays);
    readField(j, "wrappedRelay", config.wrappedRelay);
    readField(j, "useWrappedScheme", config.useWrappedScheme);
    readMilliseconds(j, "backlogTimeoutMs", config.backlogTimeout);
    readMilliseconds(j, "notificationTimeoutMs", config.notificationTimeout);
    readMilliseconds(j, "profileTimeoutMs", config.profileTimeout);
    readMilliseconds(j, "publishTimeoutMs", config.publishTimeout);
    readField(j, "messageLookbackSeconds", config.messageLookbackSeconds);
    readField(j, "recentFollowerWindowSeconds", config.recentFollowerWindowSeconds);
    readField(j, "initialFollowerBackdateSeconds", config.initialFollowerBackdateSeconds);
    readField(j, "messageQueryLimit", config.messageQueryLimit);
    readField(j, "wrappedWindowLimit", config.wrappedWindowLimit);
    readField(j, "notificationQueryLimit", config.notificationQueryLimit);
    readField(j, "maxNotifications", config.maxNotifications);

    if (j.contains("enabledNotifications"))
    {
        vector<string> names;
        readField(j, "enabledNotifications", names);

        config.enabledNotifications.clear();
        for (const string& name : names)
        {
            config.enabledNotifications.insert(notificationTypeFromString(name));
        }
    }

    if (j.contains("logLevel"))
    {
        string level;
        readField(j, "logLevel", level);
        config.logSeverity = plog::severityFromString(level.c_str());
        if (config.logSeverity == plog::none && level != "none")
        {
            throw invalid_argument("ClientConfig::fromJson: Unknown log level '" + level + "'.");
        }
    }

    config.validate();
    return config;
};

ClientConfig ClientConfig::fromFile(const filesystem::path& path)
{
    ifstream file(path);
    if (!file.is_open())
    {
        throw runtime_error("ClientConfig::fromFile: Unable to open " + path.string());
    }

    json j;
    try
    {
        j = json::parse(file);
    }
    catch (const json::parse_error& pe)
    {
        PLOG_ERROR << "Failed to parse configuration file " << path << ": " << pe.what();
        throw runtime_error("ClientConfig::fromFile: Invalid JSON in " + path.string());
    }

    return ClientConfig::fromJson(j);
};
