#pragma once

#include "asio_config.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <expected>
#include <string>
#include <system_error>
#include <vector>

namespace sstun {

struct ConnectRequest {
    // {atyp, addr, port} exactly as the client sent it.
    std::vector<uint8_t> raw_address;
    // "host:port", only filled when decoding was asked for.
    std::string host;
};

// `timeout` bounds a whole message. Pending reads wake up every `poll` to
// check `stopping`; once it is set the read gives up with
// std::errc::operation_canceled.
struct ReadLimits {
    std::chrono::steady_clock::duration timeout;
    const std::atomic<bool>* stopping = nullptr;
    std::chrono::steady_clock::duration poll = std::chrono::seconds(1);
};

// Reads the version identifier / method selection message and answers
// "no authentication required". The offered methods are not examined.
asio::awaitable<std::expected<void, std::error_code>> negotiate(asio::ip::tcp::socket& socket, ReadLimits limits);

// Reads a CONNECT request. Only the command CONNECT is accepted.
asio::awaitable<std::expected<ConnectRequest, std::error_code>> read_request(asio::ip::tcp::socket& socket,
                                                                             ReadLimits limits, bool decode_host);

} // namespace sstun
