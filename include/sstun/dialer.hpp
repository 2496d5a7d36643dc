#pragma once

#include "asio_config.hpp"
#include "sstun/cipher.hpp"
#include "sstun/stream.hpp"

#include <cstdint>
#include <expected>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

namespace sstun {

// Opens the encrypted leg of a connection.
class TunnelDialer {
  public:
    virtual ~TunnelDialer() = default;

    // Connects to `server` ("host:port") and announces `raw_address` as the
    // destination. The returned stream carries plaintext on our side; `cipher`
    // is owned by it.
    virtual asio::awaitable<std::expected<std::unique_ptr<Stream>, std::error_code>> dial(
        const std::vector<uint8_t>& raw_address, const std::string& server, std::unique_ptr<Cipher> cipher) = 0;
};

} // namespace sstun
