#pragma once

#include <functional>
#include <string>
#include <tuple>

namespace relaysync
{
namespace client
{
/**
 * @brief Relay transport: one WebSocket connection per relay URI, all driven by a single client.
 */
class IWebSocketClient
{
public:
    virtual ~IWebSocketClient() = default;

    /**
     * @brief Starts the I/O loop.  No connection can be opened before this is called.
     */
    virtual void start() = 0;

    /**
     * @brief Stops the I/O loop and joins its thread.
     */
    virtual void stop() = 0;

    /**
     * @brief Connects to a relay, blocking until the handshake succeeds, fails, or times out.
     * @remark Callers check the outcome with `isConnected`.
     */
    virtual void openConnection(std::string uri) = 0;

    virtual bool isConnected(std::string uri) = 0;

    /**
     * @brief Writes a text frame to a relay.
     * @returns The relay URI paired with true if the frame was handed to the transport.
     */
    virtual std::tuple<std::string, bool> send(std::string message, std::string uri) = 0;

    /**
     * @brief Registers the handler for text frames arriving from a relay.
     * @param uri The relay URI.
     * @param messageHandler Invoked on the I/O thread with each frame payload.
     * @remark A relay has at most one message handler; registering again replaces it.
     */
    virtual void receive(std::string uri, std::function<void(const std::string&)> messageHandler) = 0;

    /**
     * @brief Registers the handler for an unexpected loss of a relay connection.
     * @param uri The relay URI.
     * @param disconnectHandler Invoked on the I/O thread with the relay URI.
     * @remark Connections closed through `closeConnection` do not trigger it.
     */
    virtual void onDisconnect(std::string uri, std::function<void(const std::string&)> disconnectHandler) = 0;

    virtual void closeConnection(std::string uri) = 0;
};
} // namespace client
} // namespace relaysync
