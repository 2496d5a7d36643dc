#include "sstun/service.hpp"

#include "sstun/log.hpp"
#include "sstun/negotiator.hpp"
#include "sstun/protocol.hpp"
#include "sstun/stream.hpp"
#include "sstun/timeout.hpp"

#include <asio/experimental/awaitable_operators.hpp>
#include <stdexcept>
#include <utility>
#include <variant>

namespace sstun {

using namespace asio::experimental::awaitable_operators;

namespace {

std::string endpoint_string(const asio::ip::tcp::endpoint& ep) {
    if (ep.address().is_v6())
        return "[" + ep.address().to_string() + "]:" + std::to_string(ep.port());
    return ep.address().to_string() + ":" + std::to_string(ep.port());
}

} // namespace

Service::Service(ServerCipher server_cipher, TunnelDialer& dialer, ServiceOptions options)
    : server_cipher_(std::move(server_cipher)), dialer_(dialer), options_(options) {
    if (!server_cipher_.cipher)
        throw std::invalid_argument("Service needs a cipher template");
}

void Service::serve(asio::ip::tcp::acceptor acceptor) {
    auto executor = acceptor.get_executor();
    asio::co_spawn(executor, accept_loop(std::move(acceptor), wait_group_.track()), asio::detached);
}

void Service::stop() {
    if (!stopping_.exchange(true, std::memory_order_acq_rel))
        log::debug("stopping service, {} unit(s) in flight", wait_group_.pending());
    wait_group_.wait();
}

asio::awaitable<void> Service::accept_loop(asio::ip::tcp::acceptor acceptor, WaitGroup::Token token) {
    asio::error_code ec;
    std::string local = endpoint_string(acceptor.local_endpoint(ec));

    while (true) {
        if (stopping()) {
            log::debug("stopping listening on {}", local);
            acceptor.close(ec);
            co_return;
        }

        // Each connection gets its own strand so its two relays never race on a socket.
        asio::any_io_executor strand = asio::make_strand(acceptor.get_executor());
        auto accepted = co_await with_timeout_nothrow<asio::ip::tcp::socket>(
            acceptor.async_accept(strand, asio::deferred), options_.accept_timeout);
        if (!accepted) {
            if (!is_timeout(accepted.error()))
                log::error("Accept failed: {}", accepted.error().message());
            continue;
        }

        asio::ip::tcp::socket socket = std::move(*accepted);
        log::debug("socks connect from {}", endpoint_string(socket.remote_endpoint(ec)));

        auto executor = socket.get_executor();
        asio::co_spawn(executor, handle_connection(std::move(socket), wait_group_.track()), asio::detached);
    }
}

asio::awaitable<void> Service::wait_for_stop() const {
    asio::steady_timer timer(co_await asio::this_coro::executor);
    while (!stopping()) {
        timer.expires_after(options_.relay_read_timeout);
        auto [ec] = co_await timer.async_wait(asio::as_tuple(asio::use_awaitable));
        if (ec)
            co_return;
    }
}

asio::awaitable<void> Service::handle_connection(asio::ip::tcp::socket socket, WaitGroup::Token token) {
    SocketStream client(std::move(socket));
    ReadLimits limits{options_.handshake_timeout, &stopping_, options_.relay_read_timeout};

    if (auto negotiated = co_await negotiate(client.socket(), limits); !negotiated) {
        log::debug("socks handshake: {}", negotiated.error().message());
        client.close();
        co_return;
    }

    auto request = co_await read_request(client.socket(), limits, options_.debug);
    if (!request) {
        log::debug("error getting request: {}", request.error().message());
        client.close();
        co_return;
    }

    // Confirm before dialing to save a round trip. If the dial then fails the
    // client sees its "established" connection reset instead of a SOCKS error.
    if (auto confirmed = co_await client.write(asio::buffer(CONNECTION_ESTABLISHED)); !confirmed)
        log::debug("send connection confirmation: {}", confirmed.error().message());

    if (stopping()) {
        client.close();
        co_return;
    }

    log::debug("connected to {} via {}", request->host, server_cipher_.server);

    // A dial in progress is abandoned once the service stops.
    auto dialed = co_await (dialer_.dial(request->raw_address, server_cipher_.server, server_cipher_.cipher->copy()) ||
                            wait_for_stop());
    if (dialed.index() == 1) {
        log::debug("dial {}: abandoned on shutdown", server_cipher_.server);
        client.close();
        co_return;
    }

    auto remote = std::move(std::get<0>(dialed));
    if (!remote) {
        log::debug("dial {}: {}", server_cipher_.server, remote.error().message());
        client.close();
        co_return;
    }

    Relay relay(stopping_, options_.relay_read_timeout, listener_);
    Stream& tunnel = **remote;
    co_await (relay.run(tunnel, client, Direction::INBOUND) && relay.run(client, tunnel, Direction::OUTBOUND));

    log::debug("closed connection to {}", request->host);
}

} // namespace sstun
