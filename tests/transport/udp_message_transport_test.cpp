#include <gtest/gtest.h>
#include <nocturne/transport/udp_message_transport.hpp>

#include <future>
#include <thread>

#include "support/test_helpers.hpp"

namespace nocturne::transport::test {

using nocturne::test::waitFor;

class UdpMessageTransportTest : public ::testing::Test {
protected:
    void SetUp() override {
        server_ = std::make_unique<UdpMessageTransport>();
        client_ = std::make_unique<UdpMessageTransport>();
    }

    void TearDown() override {
        client_->close();
        server_->close();
    }

    SocketAddress startListening() {
        TransportTarget target;
        target.mode = TransportTarget::Mode::Listen;
        target.local = SocketAddress("127.0.0.1", 0);
        opened_ = std::async(std::launch::async, [this, target] { return server_->open(target); });

        EXPECT_TRUE(waitFor([this] { return server_->localAddress().port != 0; }));
        return server_->localAddress();
    }

    core::Result<std::string> connectClient(const SocketAddress& address) {
        TransportTarget target;
        target.mode = TransportTarget::Mode::Connect;
        target.remote = address;
        return client_->open(target);
    }

    static Bytes bytes(const std::string& text) {
        return Bytes(text.begin(), text.end());
    }

    static std::string text(const Bytes& data) {
        return std::string(data.begin(), data.end());
    }

    std::unique_ptr<UdpMessageTransport> server_;
    std::unique_ptr<UdpMessageTransport> client_;
    std::future<core::Result<std::string>> opened_;
};

TEST(UdpMessageTransportConfigTest, PayloadSizeBounds) {
    EXPECT_THROW(UdpMessageTransport(0), core::Error);
    EXPECT_THROW(UdpMessageTransport(UdpMessageTransport::kMaxDatagramSize + 1), core::Error);

    UdpMessageTransport transport;
    EXPECT_EQ(transport.maxPayloadSize(), UdpMessageTransport::kDefaultMaxPayloadSize);
    EXPECT_EQ(transport.kind(), TransportKind::Message);
}

TEST_F(UdpMessageTransportTest, ConnectRequiresRemote) {
    auto opened = connectClient(SocketAddress());
    ASSERT_TRUE(opened.is_error());
    EXPECT_EQ(opened.code(), core::ErrorCode::InvalidArgument);
}

// Listen mode memakai pengirim datagram pertama sebagai peer
TEST_F(UdpMessageTransportTest, ListenAdoptsFirstSender) {
    auto address = startListening();

    ASSERT_TRUE(connectClient(address).is_ok());
    ASSERT_TRUE(client_->send(bytes("hello")).is_ok());

    ASSERT_EQ(opened_.wait_for(std::chrono::seconds(3)), std::future_status::ready);
    auto peer = opened_.get();
    ASSERT_TRUE(peer.is_ok()) << peer.error().what();
    EXPECT_EQ(peer.value(), client_->localAddress().toString());

    // The datagram that opened the link is delivered first
    auto first = server_->receive();
    ASSERT_TRUE(first.is_ok());
    EXPECT_EQ(text(first.value()), "hello");

    ASSERT_TRUE(client_->send(bytes("second")).is_ok());
    auto second = server_->receive();
    ASSERT_TRUE(second.is_ok());
    EXPECT_EQ(text(second.value()), "second");

    ASSERT_TRUE(server_->send(bytes("reply")).is_ok());
    auto reply = client_->receive();
    ASSERT_TRUE(reply.is_ok());
    EXPECT_EQ(text(reply.value()), "reply");

    auto stats = server_->getStats();
    EXPECT_EQ(stats.receives, 2u);
    EXPECT_EQ(stats.bytes_received, 11u);
    EXPECT_EQ(stats.sends, 1u);
}

// Setiap send adalah satu datagram, batas datagram tetap terjaga
TEST_F(UdpMessageTransportTest, PreservesMessageBoundaries) {
    auto address = startListening();
    ASSERT_TRUE(connectClient(address).is_ok());
    ASSERT_TRUE(client_->send(bytes("a")).is_ok());
    ASSERT_TRUE(opened_.get().is_ok());

    ASSERT_TRUE(client_->send(bytes("bb")).is_ok());
    ASSERT_TRUE(client_->send(bytes("ccc")).is_ok());

    EXPECT_EQ(text(server_->receive().value()), "a");
    EXPECT_EQ(text(server_->receive().value()), "bb");
    EXPECT_EQ(text(server_->receive().value()), "ccc");
}

TEST_F(UdpMessageTransportTest, OversizedSendRejected) {
    auto address = startListening();
    ASSERT_TRUE(connectClient(address).is_ok());

    Bytes too_big(UdpMessageTransport::kDefaultMaxPayloadSize + 1, 'x');
    auto sent = client_->send(too_big);
    ASSERT_TRUE(sent.is_error());
    EXPECT_EQ(sent.code(), core::ErrorCode::FrameTooLarge);

    Bytes exact(UdpMessageTransport::kDefaultMaxPayloadSize, 'x');
    EXPECT_TRUE(client_->send(exact).is_ok());
    ASSERT_TRUE(opened_.get().is_ok());
    EXPECT_EQ(server_->receive().value().size(), UdpMessageTransport::kDefaultMaxPayloadSize);
}

TEST_F(UdpMessageTransportTest, CloseWakesPendingOpen) {
    startListening();

    server_->close();
    ASSERT_EQ(opened_.wait_for(std::chrono::seconds(3)), std::future_status::ready);
    EXPECT_TRUE(opened_.get().is_error());
}

TEST_F(UdpMessageTransportTest, CloseWakesBlockedReceive) {
    auto address = startListening();
    ASSERT_TRUE(connectClient(address).is_ok());
    ASSERT_TRUE(client_->send(bytes("hi")).is_ok());
    ASSERT_TRUE(opened_.get().is_ok());
    ASSERT_TRUE(server_->receive().is_ok());

    auto pending = std::async(std::launch::async, [this] { return server_->receive(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    server_->close();

    ASSERT_EQ(pending.wait_for(std::chrono::seconds(3)), std::future_status::ready);
    EXPECT_TRUE(pending.get().is_error());
    EXPECT_EQ(server_->send(bytes("late")).code(), core::ErrorCode::NotConnected);
}

} // namespace nocturne::transport::test
