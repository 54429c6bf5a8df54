#include <atomic>
#include <future>
#include <memory>

#include <openssl/ssl.h>
#include <plog/Log.h>

#include "relaysync/client/websocketpp_client.hpp"

using namespace relaysync::client;
using namespace std;

namespace asio = websocketpp::lib::asio;

WebsocketppClient::WebsocketppClient(chrono::milliseconds connectTimeout)
: _connectTimeout(connectTimeout)
{
    this->_client.clear_access_channels(websocketpp::log::alevel::all);
    this->_client.clear_error_channels(websocketpp::log::elevel::all);
};

WebsocketppClient::~WebsocketppClient()
{
    this->stop();
};

void WebsocketppClient::start()
{
    lock_guard<mutex> lock(this->_propertyMutex);
    if (this->_isRunning)
    {
        return;
    }

    this->_client.init_asio();
    this->_client.set_tls_init_handler([this](websocketpp::connection_hdl handle)
    {
        return this->_onTlsInit(handle);
    });
    this->_client.set_socket_init_handler([this](
        websocketpp::connection_hdl handle,
        asio::ssl::stream<asio::ip::tcp::socket>& stream)
    {
        // Relays behind shared front ends need SNI to pick the right certificate.
        websocketpp::lib::error_code error;
        auto connection = this->_client.get_con_from_hdl(handle, error);
        if (!error)
        {
            SSL_set_tlsext_host_name(stream.native_handle(), connection->get_host().c_str());
        }
    });
    this->_client.start_perpetual();

    this->_ioThread = thread([this]()
    {
        this->_client.run();
    });
    this->_isRunning = true;
};

void WebsocketppClient::stop()
{
    unique_lock<mutex> lock(this->_propertyMutex);
    if (!this->_isRunning)
    {
        return;
    }
    this->_isRunning = false;

    vector<string> uris;
    for (auto& [uri, handle] : this->_connectionHandles)
    {
        uris.push_back(uri);
    }
    lock.unlock();

    for (const string& uri : uris)
    {
        this->closeConnection(uri);
    }

    this->_client.stop_perpetual();
    this->_client.stop();
    if (this->_ioThread.joinable())
    {
        this->_ioThread.join();
    }
};

void WebsocketppClient::openConnection(string uri)
{
    websocketpp::lib::error_code error;
    websocketpp_client::connection_ptr connection = this->_client.get_connection(uri, error);

    if (error)
    {
        PLOG_ERROR << "Error connecting to relay " << uri << ": " << error.message();
        return;
    }

    // Both handlers may race against the timeout below, so the promise is settled at most once.
    auto openPromise = make_shared<promise<bool>>();
    auto isSettled = make_shared<atomic<bool>>(false);

    connection->set_open_handler([this, uri, openPromise, isSettled](websocketpp::connection_hdl handle)
    {
        if (isSettled->exchange(true))
        {
            PLOG_VERBOSE << "Closing late connection to relay " << uri;
            websocketpp::lib::error_code closeError;
            this->_client.close(handle, websocketpp::close::status::going_away, "Connection timed out.", closeError);
            return;
        }

        {
            lock_guard<mutex> lock(this->_propertyMutex);
            this->_connectionHandles[uri] = handle;
        }
        openPromise->set_value(true);
    });

    connection->set_fail_handler([this, uri, openPromise, isSettled](websocketpp::connection_hdl handle)
    {
        PLOG_ERROR << "Error connecting to relay " << uri << ": Handshake failed.";
        {
            lock_guard<mutex> lock(this->_propertyMutex);
            this->_connectionHandles.erase(uri);
        }

        if (!isSettled->exchange(true))
        {
            openPromise->set_value(false);
        }
    });

    connection->set_close_handler([this, uri](websocketpp::connection_hdl handle)
    {
        this->_onClose(uri);
    });

    connection->set_message_handler([this, uri](
        websocketpp::connection_hdl handle,
        websocketpp_client::message_ptr message)
    {
        this->_onMessage(uri, message);
    });

    future<bool> openFuture = openPromise->get_future();
    this->_client.connect(connection);

    bool isReady = openFuture.wait_for(this->_connectTimeout) == future_status::ready;
    if (!isReady && !isSettled->exchange(true))
    {
        // A handshake completing after this point closes itself in the open handler.
        PLOG_WARNING << "Timed out connecting to relay " << uri;
        return;
    }

    if (openFuture.get())
    {
        PLOG_VERBOSE << "Opened connection to relay " << uri;
    }
};

bool WebsocketppClient::isConnected(string uri)
{
    lock_guard<mutex> lock(this->_propertyMutex);
    auto it = this->_connectionHandles.find(uri);
    if (it == this->_connectionHandles.end())
    {
        return false;
    }

    websocketpp::lib::error_code error;
    auto connection = this->_client.get_con_from_hdl(it->second, error);

    return !error && connection->get_state() == websocketpp::session::state::open;
};

tuple<string, bool> WebsocketppClient::send(string message, string uri)
{
    websocketpp::lib::error_code error;

    // Make sure the connection isn't closed from under us.
    lock_guard<mutex> lock(this->_propertyMutex);
    auto it = this->_connectionHandles.find(uri);
    if (it == this->_connectionHandles.end())
    {
        PLOG_WARNING << "Cannot send to relay " << uri << ": not connected.";
        return make_tuple(uri, false);
    }

    this->_client.send(it->second, message, websocketpp::frame::opcode::text, error);

    if (error)
    {
        PLOG_WARNING << "Failed to send message to relay " << uri << ": " << error.message();
        return make_tuple(uri, false);
    }

    return make_tuple(uri, true);
};

void WebsocketppClient::receive(string uri, function<void(const string&)> messageHandler)
{
    lock_guard<mutex> lock(this->_propertyMutex);
    this->_messageHandlers[uri] = messageHandler;
};

void WebsocketppClient::onDisconnect(string uri, function<void(const string&)> disconnectHandler)
{
    lock_guard<mutex> lock(this->_propertyMutex);
    this->_disconnectHandlers[uri] = disconnectHandler;
};

void WebsocketppClient::closeConnection(string uri)
{
    lock_guard<mutex> lock(this->_propertyMutex);

    // A requested close is not a disconnect, so the handlers are forgotten before closing.
    this->_disconnectHandlers.erase(uri);
    this->_messageHandlers.erase(uri);

    auto it = this->_connectionHandles.find(uri);
    if (it == this->_connectionHandles.end())
    {
        return;
    }

    websocketpp::lib::error_code error;
    this->_client.close(
        it->second,
        websocketpp::close::status::going_away,
        "Client requested close.",
        error);

    if (error)
    {
        PLOG_WARNING << "Error closing connection to relay " << uri << ": " << error.message();
    }

    this->_connectionHandles.erase(it);
};

WebsocketppClient::ssl_context_ptr WebsocketppClient::_onTlsInit(websocketpp::connection_hdl handle)
{
    auto context = websocketpp::lib::make_shared<asio::ssl::context>(asio::ssl::context::tlsv12_client);

    websocketpp::lib::asio::error_code error;
    context->set_options(
        asio::ssl::context::default_workarounds
            | asio::ssl::context::no_sslv2
            | asio::ssl::context::no_sslv3
            | asio::ssl::context::single_dh_use,
        error);
    context->set_default_verify_paths(error);
    if (error)
    {
        PLOG_WARNING << "Failed to load the default certificate paths: " << error.message();
    }

    websocketpp::lib::error_code connectionError;
    auto connection = this->_client.get_con_from_hdl(handle, connectionError);
    if (!connectionError)
    {
        context->set_verify_mode(asio::ssl::verify_peer);
        context->set_verify_callback(asio::ssl::rfc2818_verification(connection->get_host()));
    }

    return context;
};

void WebsocketppClient::_onMessage(const string& uri, websocketpp_client::message_ptr message)
{
    function<void(const string&)> messageHandler;
    {
        lock_guard<mutex> lock(this->_propertyMutex);
        auto it = this->_messageHandlers.find(uri);
        if (it != this->_messageHandlers.end())
        {
            messageHandler = it->second;
        }
    }

    if (messageHandler)
    {
        messageHandler(message->get_payload());
    }
};

void WebsocketppClient::_onClose(const string& uri)
{
    function<void(const string&)> disconnectHandler;
    {
        lock_guard<mutex> lock(this->_propertyMutex);
        this->_connectionHandles.erase(uri);

        auto it = this->_disconnectHandlers.find(uri);
        if (it != this->_disconnectHandlers.end())
        {
            disconnectHandler = it->second;
            this->_disconnectHandlers.erase(it);
        }
    }

    if (disconnectHandler)
    {
        PLOG_WARNING << "Connection to relay " << uri << " dropped.";
        disconnectHandler(uri);
    }
};
