#pragma once

#include "asio_config.hpp"

#include <chrono>
#include <cstddef>
#include <expected>
#include <system_error>

namespace sstun {

// Byte stream the relay copies between.
class Stream {
  public:
    virtual ~Stream() = default;

    // Reads at least one byte. Fails with std::errc::timed_out when nothing
    // arrived within `timeout`; the stream stays usable in that case.
    virtual asio::awaitable<std::expected<size_t, std::error_code>> read_some(asio::mutable_buffer buffer,
                                                                              std::chrono::steady_clock::duration timeout) = 0;

    // Writes the whole buffer. No deadline.
    virtual asio::awaitable<std::expected<size_t, std::error_code>> write(asio::const_buffer buffer) = 0;

    // Cancels pending operations and releases the connection.
    virtual void close() = 0;
};

// Plain TCP.
class SocketStream : public Stream {
  public:
    explicit SocketStream(asio::ip::tcp::socket socket);

    asio::awaitable<std::expected<size_t, std::error_code>> read_some(asio::mutable_buffer buffer,
                                                                      std::chrono::steady_clock::duration timeout) override;
    asio::awaitable<std::expected<size_t, std::error_code>> write(asio::const_buffer buffer) override;
    void close() override;

    asio::ip::tcp::socket& socket() { return socket_; }

  private:
    asio::ip::tcp::socket socket_;
};

} // namespace sstun
