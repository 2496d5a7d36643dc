#include "sstun/stream.hpp"

#include "sstun/timeout.hpp"

namespace sstun {

SocketStream::SocketStream(asio::ip::tcp::socket socket) : socket_(std::move(socket)) {}

asio::awaitable<std::expected<size_t, std::error_code>> SocketStream::read_some(
    asio::mutable_buffer buffer, std::chrono::steady_clock::duration timeout) {
    co_return co_await with_timeout_nothrow<size_t>(
        socket_.async_read_some(buffer, asio::deferred), timeout);
}

asio::awaitable<std::expected<size_t, std::error_code>> SocketStream::write(asio::const_buffer buffer) {
    auto [ec, n] = co_await asio::async_write(socket_, buffer, asio::as_tuple(asio::use_awaitable));
    if (ec)
        co_return std::unexpected(ec);
    co_return n;
}

void SocketStream::close() {
    asio::error_code ec;
    socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
    socket_.close(ec);
}

} // namespace sstun
