#pragma once

#include "asio_config.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <system_error>

namespace sstun {

constexpr uint8_t VERSION = 0x05;
constexpr uint8_t RSV = 0x00;

enum class AuthMethod : uint8_t {
    NO_AUTH = 0x00
};

enum class Command : uint8_t {
    CONNECT = 0x01,
    BIND = 0x02,
    UDP_ASSOCIATE = 0x03
};

enum class AddressType : uint8_t {
    IPV4 = 0x01,
    DOMAIN_NAME = 0x03,
    IPV6 = 0x04
};

// Offsets inside a CONNECT request.
constexpr size_t REQ_VERSION = 0;
constexpr size_t REQ_COMMAND = 1;
constexpr size_t REQ_ADDRESS_TYPE = 3;
constexpr size_t REQ_ADDRESS = 4;
constexpr size_t REQ_DOMAIN_LENGTH = 4;
constexpr size_t REQ_DOMAIN = 5;

// ver + cmd + rsv
constexpr size_t REQUEST_HEADER_LEN = 3;
constexpr size_t IPV4_REQUEST_LEN = REQUEST_HEADER_LEN + 1 + 4 + 2;
constexpr size_t IPV6_REQUEST_LEN = REQUEST_HEADER_LEN + 1 + 16 + 2;
// Plus the domain length itself.
constexpr size_t DOMAIN_REQUEST_BASE_LEN = REQUEST_HEADER_LEN + 1 + 1 + 2;

// Bytes needed before a message length can be computed.
constexpr size_t HANDSHAKE_MIN_READ = 2;
constexpr size_t REQUEST_MIN_READ = REQ_DOMAIN_LENGTH + 1;

// Upper bounds: 255 methods, 255-byte domain.
constexpr size_t MAX_HANDSHAKE_LEN = 2 + 255;
constexpr size_t MAX_REQUEST_LEN = DOMAIN_REQUEST_BASE_LEN + 255;

constexpr std::array<uint8_t, 2> NO_AUTH_REPLY = {VERSION, static_cast<uint8_t>(AuthMethod::NO_AUTH)};

// Sent before the tunnel is dialed. BND.ADDR/BND.PORT are placeholders.
constexpr std::array<uint8_t, 10> CONNECTION_ESTABLISHED = {VERSION, 0x00, RSV, 0x01, 0x00,
                                                            0x00,    0x00, 0x00, 0x08, 0x43};

enum class Error {
    SUCCESS = 0,
    UNSUPPORTED_VERSION,
    UNSUPPORTED_COMMAND,
    UNSUPPORTED_ADDRESS_TYPE,
    EXTRA_DATA,
    UNSUPPORTED_CIPHER,
    CIPHER_FAILURE,
    INVALID_SERVER_ADDRESS,
    INVALID_PORT
};

const std::error_category& sstun_category();
std::error_code make_error_code(Error e);

// Total length of a method-selection message, given at least its first
// HANDSHAKE_MIN_READ bytes. Fails on a version other than 5.
std::expected<size_t, std::error_code> handshake_length(std::span<const uint8_t> head);

// Total length of a CONNECT request, given at least its first
// REQUEST_MIN_READ bytes. Validates version, command and address type.
std::expected<size_t, std::error_code> request_length(std::span<const uint8_t> head);

// Renders a raw address {atyp, addr, port} as "host:port" ("[v6]:port" for IPv6).
// The raw address must be complete; see request_length.
std::string describe_address(std::span<const uint8_t> raw_address);

} // namespace sstun

namespace std {
template <>
struct is_error_code_enum<sstun::Error> : true_type {};
} // namespace std
