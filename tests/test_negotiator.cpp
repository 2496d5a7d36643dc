#include "sstun/negotiator.hpp"
#include "sstun/protocol.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <memory>
#include <thread>

using namespace sstun;
using namespace sstun::test;

class NegotiatorTest : public ::testing::Test {
  protected:
    void SetUp() override { pair_ = std::make_unique<SocketPair>(io_.context()); }

    void TearDown() override {
        pair_.reset();
        io_.stop();
    }

    std::expected<void, std::error_code> negotiate_now(std::chrono::milliseconds timeout = 2000ms) {
        return run_sync(io_.context(), negotiate(pair_->server, {timeout}));
    }

    std::expected<ConnectRequest, std::error_code> request_now(bool decode_host = true,
                                                               std::chrono::milliseconds timeout = 2000ms) {
        return run_sync(io_.context(), read_request(pair_->server, {timeout}, decode_host));
    }

    IoThreads io_{1};
    std::unique_ptr<SocketPair> pair_;
};

// 1. Method selection
TEST_F(NegotiatorTest, RepliesNoAuthWhateverIsOffered) {
    pair_->peer.write(method_selection(1));
    auto result = negotiate_now();
    ASSERT_TRUE(result.has_value()) << result.error().message();

    auto reply = pair_->peer.read_exactly(2);
    EXPECT_EQ(reply, std::vector<uint8_t>({0x05, 0x00}));
}

TEST_F(NegotiatorTest, AcceptsMaximalMethodList) {
    pair_->peer.write(method_selection(255));
    ASSERT_TRUE(negotiate_now().has_value());
    EXPECT_EQ(pair_->peer.read_exactly(2), std::vector<uint8_t>({0x05, 0x00}));
}

TEST_F(NegotiatorTest, AcceptsEmptyMethodList) {
    pair_->peer.write(method_selection(0));
    ASSERT_TRUE(negotiate_now().has_value());
    EXPECT_EQ(pair_->peer.read_exactly(2), std::vector<uint8_t>({0x05, 0x00}));
}

TEST_F(NegotiatorTest, ReadsRemainderOfSplitHandshake) {
    auto msg = method_selection(3);
    auto pending = asio::co_spawn(io_.context(), negotiate(pair_->server, {2000ms}), asio::use_future);

    pair_->peer.write(std::vector<uint8_t>(msg.begin(), msg.begin() + 2));
    std::this_thread::sleep_for(50ms);
    pair_->peer.write(std::vector<uint8_t>(msg.begin() + 2, msg.end()));

    auto result = pending.get();
    ASSERT_TRUE(result.has_value()) << result.error().message();
    EXPECT_EQ(pair_->peer.read_exactly(2), std::vector<uint8_t>({0x05, 0x00}));
}

TEST_F(NegotiatorTest, RejectsSocks4) {
    pair_->peer.write(std::vector<uint8_t>{0x04, 0x01, 0x00, 0x50, 127, 0, 0, 1, 0x00});
    auto result = negotiate_now();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), Error::UNSUPPORTED_VERSION);
}

TEST_F(NegotiatorTest, TrailingByteAfterHandshakeIsExtraData) {
    auto msg = method_selection(2);
    msg.push_back(0x05);
    pair_->peer.write(msg);

    auto result = negotiate_now();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), Error::EXTRA_DATA);
}

TEST_F(NegotiatorTest, HandshakeTimesOut) {
    auto result = negotiate_now(100ms);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), std::errc::timed_out);
}

TEST_F(NegotiatorTest, ClosedBeforeHandshakeFails) {
    pair_->peer.close();
    auto result = negotiate_now();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), asio::error::eof);
}

// 2. Connect request
TEST_F(NegotiatorTest, ReadsIPv4Request) {
    pair_->peer.write(connect_request("192.168.1.1", 8080));
    auto request = request_now();
    ASSERT_TRUE(request.has_value()) << request.error().message();

    EXPECT_EQ(request->raw_address, std::vector<uint8_t>({0x01, 192, 168, 1, 1, 0x1F, 0x90}));
    EXPECT_EQ(request->host, "192.168.1.1:8080");
}

TEST_F(NegotiatorTest, ReadsIPv6Request) {
    pair_->peer.write(connect_request("2001:db8::1", 443));
    auto request = request_now();
    ASSERT_TRUE(request.has_value());

    ASSERT_EQ(request->raw_address.size(), 19u);
    EXPECT_EQ(request->raw_address[0], 0x04);
    EXPECT_EQ(request->host, "[2001:db8::1]:443");
}

TEST_F(NegotiatorTest, ReadsDomainRequest) {
    pair_->peer.write(connect_request("example.com", 80));
    auto request = request_now();
    ASSERT_TRUE(request.has_value());

    std::vector<uint8_t> expected = {0x03, 11};
    std::string host = "example.com";
    expected.insert(expected.end(), host.begin(), host.end());
    expected.push_back(0x00);
    expected.push_back(0x50);
    EXPECT_EQ(request->raw_address, expected);
    EXPECT_EQ(request->host, "example.com:80");
}

TEST_F(NegotiatorTest, HostLeftEmptyWithoutDecoding) {
    pair_->peer.write(connect_request("example.com", 80));
    auto request = request_now(false);
    ASSERT_TRUE(request.has_value());
    EXPECT_TRUE(request->host.empty());
    EXPECT_EQ(request->raw_address.size(), 2u + 11u + 2u);
}

TEST_F(NegotiatorTest, ReadsRemainderOfSplitDomainRequest) {
    auto msg = connect_request("a-rather-long-host-name.example.org", 8443);
    auto pending = asio::co_spawn(io_.context(), read_request(pair_->server, {2000ms}, true), asio::use_future);

    pair_->peer.write(std::vector<uint8_t>(msg.begin(), msg.begin() + 6));
    std::this_thread::sleep_for(50ms);
    pair_->peer.write(std::vector<uint8_t>(msg.begin() + 6, msg.end()));

    auto request = pending.get();
    ASSERT_TRUE(request.has_value()) << request.error().message();
    EXPECT_EQ(request->host, "a-rather-long-host-name.example.org:8443");
}

TEST_F(NegotiatorTest, TrailingByteAfterRequestIsExtraData) {
    for (const std::string host : {"10.1.2.3", "::1", "example.com"}) {
        SocketPair pair(io_.context());
        auto msg = connect_request(host, 80);
        msg.push_back(0xFF);
        pair.peer.write(msg);

        auto request = run_sync(io_.context(), read_request(pair.server, {2000ms}, true));
        ASSERT_FALSE(request.has_value()) << host;
        EXPECT_EQ(request.error(), Error::EXTRA_DATA) << host;
    }
}

TEST_F(NegotiatorTest, RejectsBind) {
    pair_->peer.write(connect_request("10.0.0.1", 80, Command::BIND));
    auto request = request_now();
    ASSERT_FALSE(request.has_value());
    EXPECT_EQ(request.error(), Error::UNSUPPORTED_COMMAND);
}

TEST_F(NegotiatorTest, RejectsUnknownAddressType) {
    pair_->peer.write(std::vector<uint8_t>{0x05, 0x01, 0x00, 0x02, 0x00, 0x00, 0x50});
    auto request = request_now();
    ASSERT_FALSE(request.has_value());
    EXPECT_EQ(request.error(), Error::UNSUPPORTED_ADDRESS_TYPE);
}

TEST_F(NegotiatorTest, TruncatedRequestTimesOut) {
    auto msg = connect_request("192.168.1.1", 80);
    msg.resize(7);
    pair_->peer.write(msg);

    auto request = request_now(true, 100ms);
    ASSERT_FALSE(request.has_value());
    EXPECT_EQ(request.error(), std::errc::timed_out);
}

TEST_F(NegotiatorTest, SlicedReadsStillAssembleMessage) {
    auto msg = connect_request("sliced.example", 443);
    auto pending = asio::co_spawn(io_.context(), read_request(pair_->server, {2000ms, nullptr, 20ms}, true),
                                  asio::use_future);

    for (size_t i = 0; i < msg.size(); i += 4) {
        size_t end = std::min(i + 4, msg.size());
        pair_->peer.write(std::vector<uint8_t>(msg.begin() + static_cast<std::ptrdiff_t>(i),
                                               msg.begin() + static_cast<std::ptrdiff_t>(end)));
        std::this_thread::sleep_for(30ms);
    }

    auto request = pending.get();
    ASSERT_TRUE(request.has_value()) << request.error().message();
    EXPECT_EQ(request->host, "sliced.example:443");
}

// 3. Shutdown while waiting
TEST_F(NegotiatorTest, StopFlagEndsPendingHandshake) {
    std::atomic<bool> stopping{false};
    auto pending = asio::co_spawn(io_.context(), negotiate(pair_->server, {10s, &stopping, 50ms}), asio::use_future);

    std::this_thread::sleep_for(100ms);
    auto began = std::chrono::steady_clock::now();
    stopping = true;

    auto result = pending.get();
    EXPECT_LT(std::chrono::steady_clock::now() - began, 1000ms);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), std::errc::operation_canceled);
}

TEST_F(NegotiatorTest, StopFlagSetBeforeRequestReadsNothing) {
    std::atomic<bool> stopping{true};
    pair_->peer.write(connect_request("10.0.0.1", 80));
    auto request = run_sync(io_.context(), read_request(pair_->server, {2000ms, &stopping, 50ms}, true));
    ASSERT_FALSE(request.has_value());
    EXPECT_EQ(request.error(), std::errc::operation_canceled);
}

// 4. Both steps on one connection
TEST_F(NegotiatorTest, HandshakeThenRequest) {
    pair_->peer.write(method_selection(1));
    ASSERT_TRUE(negotiate_now().has_value());
    EXPECT_EQ(pair_->peer.read_exactly(2).size(), 2u);

    pair_->peer.write(connect_request("127.0.0.1", 22));
    auto request = request_now();
    ASSERT_TRUE(request.has_value());
    EXPECT_EQ(request->host, "127.0.0.1:22");
}
