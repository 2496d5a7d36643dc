#pragma once

#include "asio_config.hpp"
#include "sstun/cipher.hpp"
#include "sstun/dialer.hpp"
#include "sstun/stream.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <memory>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace sstun {

// Decimal port number in 1-65535; anything else is INVALID_PORT.
std::expected<uint16_t, std::error_code> parse_port(const std::string& text);

// "host:port" or "[v6]:port" into host and port. The port must be 1-65535.
std::expected<std::pair<std::string, std::string>, std::error_code> split_host_port(const std::string& address);

// TCP connection with a stream cipher on both directions. Each direction
// starts with that side's IV in clear.
class CipherStream : public Stream {
  public:
    CipherStream(asio::ip::tcp::socket socket, std::unique_ptr<Cipher> cipher);

    asio::awaitable<std::expected<size_t, std::error_code>> read_some(asio::mutable_buffer buffer,
                                                                      std::chrono::steady_clock::duration timeout) override;
    asio::awaitable<std::expected<size_t, std::error_code>> write(asio::const_buffer buffer) override;
    void close() override;

  private:
    asio::awaitable<std::expected<void, std::error_code>> read_peer_iv(std::chrono::steady_clock::duration timeout);

    asio::ip::tcp::socket socket_;
    std::unique_ptr<Cipher> cipher_;

    std::vector<uint8_t> peer_iv_;
    size_t peer_iv_len_ = 0;
    bool decrypting_ = false;
    bool encrypting_ = false;
    std::vector<uint8_t> out_;
};

// Connects to the tunnel server and sends the destination raw address as the
// first encrypted bytes, after which the stream carries the client's data.
class ShadowTunnelDialer : public TunnelDialer {
  public:
    explicit ShadowTunnelDialer(std::chrono::steady_clock::duration timeout = std::chrono::seconds(10));

    asio::awaitable<std::expected<std::unique_ptr<Stream>, std::error_code>> dial(
        const std::vector<uint8_t>& raw_address, const std::string& server, std::unique_ptr<Cipher> cipher) override;

  private:
    std::chrono::steady_clock::duration timeout_;
};

} // namespace sstun
