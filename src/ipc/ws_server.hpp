/**
 * codeact WebSocket server
 *
 * One TCP port. WebSocket upgrades become hub connections; plain HTTP
 * requests are answered by the HttpApi.
 */
#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <boost/asio/io_context.hpp>
#include "ipc/connection_hub.hpp"
#include "ipc/http_api.hpp"

namespace codeact::ipc {

class Listener;

struct WsLimits {
    size_t max_message_bytes = 50 * 1024 * 1024;   // largest inbound frame
    size_t max_outbox_bytes = 16 * 1024 * 1024;    // queued outbound bytes before the client is dropped
};

class WsServer {
public:
    WsServer(boost::asio::io_context& ioc, ConnectionHub& hub, const HttpApi& api,
             WsLimits limits = {});
    ~WsServer();

    // Binds and starts accepting; false if the address cannot be bound
    bool listen(const std::string& host, uint16_t port);

    // Stops accepting new connections
    void stop();

    // Bound port (useful when listening on port 0)
    uint16_t port() const;

private:
    boost::asio::io_context& ioc_;
    ConnectionHub& hub_;
    const HttpApi& api_;
    WsLimits limits_;
    std::shared_ptr<Listener> listener_;
};

} // namespace codeact::ipc
