#pragma once

#include <atomic>
#include <iomanip>
#include <memory>
#include <sstream>
#include <string>
#include <tuple>
#include <vector>

#include <gmock/gmock.h>
#include <nlohmann/json.hpp>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Formatters/TxtFormatter.h>

#include "relaysync/client/web_socket_client.hpp"
#include "relaysync/data/data.hpp"
#include "relaysync/service/relay_pool.hpp"
#include "relaysync/signer/key_store.hpp"

namespace relaysync_test
{
inline const std::string ALICE = std::string(64, 'a');
inline const std::string BOB = std::string(64, 'b');
inline const std::string CAROL = std::string(64, 'c');

/**
 * @brief Gets the appender shared by every test.
 * @remark plog holds a raw pointer to the first appender it is given, so it must live as long
 * as the test process.
 */
inline std::shared_ptr<plog::IAppender> testAppender()
{
    static auto appender = std::make_shared<plog::ConsoleAppender<plog::TxtFormatter>>();
    return appender;
};

/**
 * @brief Builds a 64-character hex ID that sorts by the given number.
 */
inline std::string hexId(int n)
{
    std::stringstream ss;
    ss << std::hex << std::setw(64) << std::setfill('0') << n;
    return ss.str();
};

class MockWebSocketClient : public relaysync::client::IWebSocketClient
{
public:
    MOCK_METHOD(void, start, (), (override));
    MOCK_METHOD(void, stop, (), (override));
    MOCK_METHOD(void, openConnection, (std::string uri), (override));
    MOCK_METHOD(bool, isConnected, (std::string uri), (override));
    MOCK_METHOD((std::tuple<std::string, bool>), send, (std::string message, std::string uri), (override));
    MOCK_METHOD(void, receive, (std::string uri, std::function<void(const std::string&)> messageHandler), (override));
    MOCK_METHOD(void, onDisconnect, (std::string uri, std::function<void(const std::string&)> disconnectHandler), (override));
    MOCK_METHOD(void, closeConnection, (std::string uri), (override));
};

class MockRelayPool : public relaysync::service::IRelayPool
{
public:
    MOCK_METHOD(std::vector<std::string>, openRelayConnections, (std::vector<std::string> relays), (override));
    MOCK_METHOD(void, closeRelayConnections, (), (override));
    MOCK_METHOD(
        (std::tuple<std::vector<std::string>, std::vector<std::string>>),
        publishEvent,
        (std::vector<std::string> relays, std::shared_ptr<relaysync::data::Event> event),
        (override));
    MOCK_METHOD(
        std::string,
        subscribe,
        (std::vector<std::string> relays,
            std::vector<std::shared_ptr<relaysync::data::Filters>> filters,
            relaysync::service::EventHandler eventHandler,
            relaysync::service::EoseHandler eoseHandler,
            relaysync::service::CloseHandler closeHandler),
        (override));
    MOCK_METHOD(
        (std::tuple<std::vector<std::string>, std::vector<std::string>>),
        closeSubscription,
        (std::string subscriptionId),
        (override));
};

/**
 * @brief A deterministic key store for scheme tests.
 * @remark A payload records the unordered pair of keys it was exchanged between, and only a
 * store holding one of those keys, decrypting with the other, can read it back.  Signatures are
 * placeholders.
 */
class FakeKeyStore : public relaysync::signer::IKeyStore
{
public:
    explicit FakeKeyStore(std::string pubkey) : _pubkey(std::move(pubkey)) {};

    bool failSigning = false;

    std::string localIdentity() const override { return this->_pubkey; };

    std::string encrypt(
        relaysync::signer::CipherVersion version,
        const std::string& peerPubkey,
        const std::string& plaintext) override
    {
        nlohmann::json payload = {
            { "v", static_cast<int>(version) },
            { "pair", _pairOf(this->_pubkey, peerPubkey) },
            { "pt", plaintext }
        };
        return payload.dump();
    };

    std::string decrypt(
        relaysync::signer::CipherVersion version,
        const std::string& peerPubkey,
        const std::string& payload) override
    {
        nlohmann::json j = nlohmann::json::parse(payload, nullptr, false);
        if (j.is_discarded() || !j.is_object())
        {
            return std::string();
        }

        if (j.value("v", -1) != static_cast<int>(version)
            || j.value("pair", std::string()) != _pairOf(this->_pubkey, peerPubkey))
        {
            return std::string();
        }

        return j.value("pt", std::string());
    };

    bool sign(std::shared_ptr<relaysync::data::Event> event) override
    {
        if (this->failSigning)
        {
            return false;
        }

        event->pubkey = this->_pubkey;
        event->serialize();
        event->sig = std::string(128, 'f');
        return true;
    };

    std::shared_ptr<relaysync::signer::IKeyStore> createEphemeral() override
    {
        static std::atomic<int> counter{ 0 };
        auto ephemeral = std::make_shared<FakeKeyStore>(hexId(0xe000 + ++counter));
        ephemeral->failSigning = this->failSigning;
        return ephemeral;
    };

private:
    std::string _pubkey;

    static std::string _pairOf(const std::string& lhs, const std::string& rhs)
    {
        return lhs < rhs ? lhs + ":" + rhs : rhs + ":" + lhs;
    };
};

/**
 * @brief Builds a minimal event with a fixed ID.
 */
inline std::shared_ptr<relaysync::data::Event> makeEvent(
    const std::string& id,
    const std::string& pubkey,
    int kind,
    std::time_t createdAt,
    std::vector<std::vector<std::string>> tags = {},
    std::string content = std::string())
{
    auto event = std::make_shared<relaysync::data::Event>();
    event->id = id;
    event->pubkey = pubkey;
    event->kind = kind;
    event->createdAt = createdAt;
    event->tags = std::move(tags);
    event->content = std::move(content);
    event->sig = std::string(128, 'f');
    return event;
};
} // namespace relaysync_test
