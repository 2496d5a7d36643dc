#pragma once

#include "asio_config.hpp"
#include "sstun/cipher.hpp"
#include "sstun/dialer.hpp"
#include "sstun/relay.hpp"
#include "sstun/wait_group.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <string>

namespace sstun {

struct ServiceOptions {
    std::chrono::steady_clock::duration handshake_timeout = std::chrono::seconds(10);
    std::chrono::steady_clock::duration relay_read_timeout = std::chrono::seconds(5);
    std::chrono::steady_clock::duration accept_timeout = std::chrono::seconds(1);
    // Decode destinations to "host:port" for the debug log.
    bool debug = false;
};

// Where the tunnel server lives and the cipher template for talking to it.
struct ServerCipher {
    std::string server;
    std::shared_ptr<const Cipher> cipher;
};

class Service {
  public:
    Service(ServerCipher server_cipher, TunnelDialer& dialer, ServiceOptions options = {});

    Service(const Service&) = delete;
    Service& operator=(const Service&) = delete;

    // Must be set before the first serve().
    void set_traffic_listener(TrafficListener* listener) { listener_ = listener; }

    // Runs an accept loop for `acceptor` on its executor. May be called for
    // several acceptors.
    void serve(asio::ip::tcp::acceptor acceptor);

    // Signals shutdown and blocks until every accept loop and connection has
    // finished. Safe to call more than once. Must not be called from a thread
    // the service's executor depends on.
    void stop();

    bool stopping() const { return stopping_.load(std::memory_order_acquire); }

  private:
    asio::awaitable<void> accept_loop(asio::ip::tcp::acceptor acceptor, WaitGroup::Token token);
    asio::awaitable<void> handle_connection(asio::ip::tcp::socket socket, WaitGroup::Token token);
    // Completes once stop() has been called, checking every relay_read_timeout.
    asio::awaitable<void> wait_for_stop() const;

    const ServerCipher server_cipher_;
    TunnelDialer& dialer_;
    const ServiceOptions options_;
    TrafficListener* listener_ = nullptr;

    std::atomic<bool> stopping_{false};
    WaitGroup wait_group_;
};

} // namespace sstun
