#include "sstun/tunnel.hpp"

#include "sstun/protocol.hpp"
#include "sstun/timeout.hpp"

#include <algorithm>
#include <cctype>

namespace sstun {

std::expected<uint16_t, std::error_code> parse_port(const std::string& text) {
    if (text.empty() || text.size() > 5 ||
        !std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); }))
        return std::unexpected(make_error_code(Error::INVALID_PORT));
    int value = std::stoi(text);
    if (value < 1 || value > 65535)
        return std::unexpected(make_error_code(Error::INVALID_PORT));
    return static_cast<uint16_t>(value);
}

std::expected<std::pair<std::string, std::string>, std::error_code> split_host_port(const std::string& address) {
    auto bad = std::unexpected(make_error_code(Error::INVALID_SERVER_ADDRESS));

    auto colon = address.rfind(':');
    if (colon == std::string::npos || colon == 0)
        return bad;

    std::string host = address.substr(0, colon);
    std::string port = address.substr(colon + 1);

    if (host.front() == '[') {
        if (host.size() < 3 || host.back() != ']')
            return bad;
        host = host.substr(1, host.size() - 2);
    } else if (host.find(':') != std::string::npos) {
        // Bare IPv6 without brackets is ambiguous.
        return bad;
    }

    if (!parse_port(port))
        return bad;

    return std::make_pair(std::move(host), std::move(port));
}

CipherStream::CipherStream(asio::ip::tcp::socket socket, std::unique_ptr<Cipher> cipher)
    : socket_(std::move(socket)), cipher_(std::move(cipher)), peer_iv_(cipher_->iv_size()) {}

asio::awaitable<std::expected<void, std::error_code>> CipherStream::read_peer_iv(
    std::chrono::steady_clock::duration timeout) {
    // A deadline may expire part way through the IV; what arrived is kept.
    while (peer_iv_len_ < peer_iv_.size()) {
        auto got = co_await with_timeout_nothrow<size_t>(
            socket_.async_read_some(asio::buffer(peer_iv_.data() + peer_iv_len_, peer_iv_.size() - peer_iv_len_),
                                    asio::deferred),
            timeout);
        if (!got)
            co_return std::unexpected(got.error());
        peer_iv_len_ += *got;
    }

    if (!cipher_->init_decrypt(peer_iv_))
        co_return std::unexpected(make_error_code(Error::CIPHER_FAILURE));
    decrypting_ = true;
    co_return std::expected<void, std::error_code>{};
}

asio::awaitable<std::expected<size_t, std::error_code>> CipherStream::read_some(
    asio::mutable_buffer buffer, std::chrono::steady_clock::duration timeout) {
    if (!decrypting_) {
        auto iv = co_await read_peer_iv(timeout);
        if (!iv)
            co_return std::unexpected(iv.error());
    }

    auto got = co_await with_timeout_nothrow<size_t>(socket_.async_read_some(buffer, asio::deferred), timeout);
    if (!got)
        co_return std::unexpected(got.error());

    if (!cipher_->decrypt(std::span<uint8_t>(static_cast<uint8_t*>(buffer.data()), *got)))
        co_return std::unexpected(make_error_code(Error::CIPHER_FAILURE));
    co_return *got;
}

asio::awaitable<std::expected<size_t, std::error_code>> CipherStream::write(asio::const_buffer buffer) {
    out_.clear();
    if (!encrypting_) {
        if (!cipher_->init_encrypt(out_))
            co_return std::unexpected(make_error_code(Error::CIPHER_FAILURE));
        encrypting_ = true;
    }

    size_t prefix = out_.size();
    const auto* data = static_cast<const uint8_t*>(buffer.data());
    out_.insert(out_.end(), data, data + buffer.size());
    if (!cipher_->encrypt(std::span<uint8_t>(out_).subspan(prefix)))
        co_return std::unexpected(make_error_code(Error::CIPHER_FAILURE));

    auto [ec, n] = co_await asio::async_write(socket_, asio::buffer(out_), asio::as_tuple(asio::use_awaitable));
    if (ec)
        co_return std::unexpected(ec);
    co_return buffer.size();
}

void CipherStream::close() {
    asio::error_code ec;
    socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
    socket_.close(ec);
}

ShadowTunnelDialer::ShadowTunnelDialer(std::chrono::steady_clock::duration timeout) : timeout_(timeout) {}

asio::awaitable<std::expected<std::unique_ptr<Stream>, std::error_code>> ShadowTunnelDialer::dial(
    const std::vector<uint8_t>& raw_address, const std::string& server, std::unique_ptr<Cipher> cipher) {
    if (!cipher)
        co_return std::unexpected(make_error_code(Error::CIPHER_FAILURE));

    auto address = split_host_port(server);
    if (!address)
        co_return std::unexpected(address.error());

    auto executor = co_await asio::this_coro::executor;
    asio::ip::tcp::resolver resolver(executor);
    auto endpoints = co_await with_timeout_nothrow<asio::ip::tcp::resolver::results_type>(
        resolver.async_resolve(address->first, address->second, asio::deferred), timeout_);
    if (!endpoints)
        co_return std::unexpected(endpoints.error());

    asio::ip::tcp::socket socket(executor);
    auto connected = co_await with_timeout_nothrow<asio::ip::tcp::endpoint>(
        asio::async_connect(socket, *endpoints, asio::deferred), timeout_);
    if (!connected)
        co_return std::unexpected(connected.error());

    auto stream = std::make_unique<CipherStream>(std::move(socket), std::move(cipher));
    auto sent = co_await stream->write(asio::buffer(raw_address));
    if (!sent) {
        stream->close();
        co_return std::unexpected(sent.error());
    }
    co_return std::unique_ptr<Stream>(std::move(stream));
}

} // namespace sstun
