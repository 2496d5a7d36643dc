#include "sstun/protocol.hpp"

#include <algorithm>

namespace sstun {

class SstunCategory : public std::error_category {
  public:
    const char* name() const noexcept override { return "sstun"; }

    std::string message(int ev) const override {
        switch (static_cast<Error>(ev)) {
            case Error::SUCCESS:
                return "Success";
            case Error::UNSUPPORTED_VERSION:
                return "SOCKS version not supported";
            case Error::UNSUPPORTED_COMMAND:
                return "SOCKS command not supported";
            case Error::UNSUPPORTED_ADDRESS_TYPE:
                return "SOCKS address type not supported";
            case Error::EXTRA_DATA:
                return "SOCKS message followed by extra data";
            case Error::UNSUPPORTED_CIPHER:
                return "Cipher method not supported";
            case Error::CIPHER_FAILURE:
                return "Cipher operation failed";
            case Error::INVALID_SERVER_ADDRESS:
                return "Server address must be host:port";
            case Error::INVALID_PORT:
                return "Port must be a number from 1 to 65535";
            default:
                return "Unknown error";
        }
    }
};

const std::error_category& sstun_category() {
    static SstunCategory instance;
    return instance;
}

std::error_code make_error_code(Error e) {
    return {static_cast<int>(e), sstun_category()};
}

std::expected<size_t, std::error_code> handshake_length(std::span<const uint8_t> head) {
    if (head.size() < HANDSHAKE_MIN_READ) {
        return std::unexpected(std::make_error_code(std::errc::message_size));
    }
    if (head[0] != VERSION) {
        return std::unexpected(make_error_code(Error::UNSUPPORTED_VERSION));
    }
    return static_cast<size_t>(head[1]) + 2;
}

std::expected<size_t, std::error_code> request_length(std::span<const uint8_t> head) {
    if (head.size() < REQUEST_MIN_READ) {
        return std::unexpected(std::make_error_code(std::errc::message_size));
    }
    if (head[REQ_VERSION] != VERSION) {
        return std::unexpected(make_error_code(Error::UNSUPPORTED_VERSION));
    }
    if (head[REQ_COMMAND] != static_cast<uint8_t>(Command::CONNECT)) {
        return std::unexpected(make_error_code(Error::UNSUPPORTED_COMMAND));
    }

    switch (static_cast<AddressType>(head[REQ_ADDRESS_TYPE])) {
        case AddressType::IPV4:
            return IPV4_REQUEST_LEN;
        case AddressType::IPV6:
            return IPV6_REQUEST_LEN;
        case AddressType::DOMAIN_NAME:
            return DOMAIN_REQUEST_BASE_LEN + head[REQ_DOMAIN_LENGTH];
        default:
            return std::unexpected(make_error_code(Error::UNSUPPORTED_ADDRESS_TYPE));
    }
}

std::string describe_address(std::span<const uint8_t> raw_address) {
    if (raw_address.size() < 2 + 2) {
        return {};
    }

    std::string host;
    size_t port_at = 0;
    switch (static_cast<AddressType>(raw_address[0])) {
        case AddressType::IPV4: {
            if (raw_address.size() < 1 + 4 + 2)
                return {};
            asio::ip::address_v4::bytes_type bytes;
            std::copy_n(raw_address.begin() + 1, bytes.size(), bytes.begin());
            host = asio::ip::make_address_v4(bytes).to_string();
            port_at = 1 + 4;
            break;
        }
        case AddressType::IPV6: {
            if (raw_address.size() < 1 + 16 + 2)
                return {};
            asio::ip::address_v6::bytes_type bytes;
            std::copy_n(raw_address.begin() + 1, bytes.size(), bytes.begin());
            host = "[" + asio::ip::make_address_v6(bytes).to_string() + "]";
            port_at = 1 + 16;
            break;
        }
        case AddressType::DOMAIN_NAME: {
            size_t len = raw_address[1];
            if (raw_address.size() < 2 + len + 2)
                return {};
            host.assign(reinterpret_cast<const char*>(raw_address.data() + 2), len);
            port_at = 2 + len;
            break;
        }
        default:
            return {};
    }

    uint16_t port = static_cast<uint16_t>((raw_address[port_at] << 8) | raw_address[port_at + 1]);
    return host + ":" + std::to_string(port);
}

} // namespace sstun
