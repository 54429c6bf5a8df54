#pragma once

#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <tuple>
#include <unordered_map>

#include <websocketpp/client.hpp>
#include <websocketpp/config/asio_client.hpp>

#include "relaysync/client/web_socket_client.hpp"

namespace relaysync
{
namespace client
{
/**
 * @brief An implementation of the `IWebSocketClient` interface that uses the WebSocket++ library.
 * @remark Connections use TLS, so only `wss://` URIs are supported.  All handlers run on the
 * client's I/O thread.
 */
class WebsocketppClient : public IWebSocketClient
{
public:
    /**
     * @param connectTimeout How long `openConnection` waits for the opening handshake.
     */
    WebsocketppClient(std::chrono::milliseconds connectTimeout = std::chrono::milliseconds(5000));

    ~WebsocketppClient() override;

    void start() override;

    void stop() override;

    void openConnection(std::string uri) override;

    bool isConnected(std::string uri) override;

    std::tuple<std::string, bool> send(std::string message, std::string uri) override;

    void receive(std::string uri, std::function<void(const std::string&)> messageHandler) override;

    void onDisconnect(std::string uri, std::function<void(const std::string&)> disconnectHandler) override;

    void closeConnection(std::string uri) override;

private:
    typedef websocketpp::client<websocketpp::config::asio_tls_client> websocketpp_client;
    typedef websocketpp::lib::shared_ptr<websocketpp::lib::asio::ssl::context> ssl_context_ptr;

    websocketpp_client _client;

    ///< Runs the client's event loop between `start` and `stop`.
    std::thread _ioThread;

    std::chrono::milliseconds _connectTimeout;

    std::mutex _propertyMutex;

    ///< Handles of open connections, keyed by URI.
    std::unordered_map<std::string, websocketpp::connection_hdl> _connectionHandles;

    std::unordered_map<std::string, std::function<void(const std::string&)>> _messageHandlers;

    std::unordered_map<std::string, std::function<void(const std::string&)>> _disconnectHandlers;

    bool _isRunning = false;

    ssl_context_ptr _onTlsInit(websocketpp::connection_hdl handle);

    void _onMessage(const std::string& uri, websocketpp_client::message_ptr message);

    void _onClose(const std::string& uri);
};
} // namespace client
} // namespace relaysync
