/**
 * @file test_socket_factory.cpp
 * @brief Unit tests for the UDP socket wrapper and the discovery socket factory
 */

#include <gtest/gtest.h>
#include <ubnt/net/socket_factory.hpp>
#include <ubnt/net/udp_socket.hpp>

#include <chrono>
#include <cstring>
#include <string>

using namespace ubnt::net;

class UdpSocketTest : public ::testing::Test {
protected:
    SocketInitializer init_;
};

TEST_F(UdpSocketTest, CreateAndClose) {
    UdpSocket socket;
    EXPECT_TRUE(socket.isValid());

    socket.close();
    EXPECT_FALSE(socket.isValid());
}

TEST_F(UdpSocketTest, BindToEphemeralPort) {
    UdpSocket socket;
    ASSERT_TRUE(socket.bind(0, "127.0.0.1"));
    EXPECT_NE(socket.getLocalPort(), 0);
}

TEST_F(UdpSocketTest, MoveTransfersOwnership) {
    UdpSocket first;
    ASSERT_TRUE(first.bind(0, "127.0.0.1"));
    uint16_t port = first.getLocalPort();

    UdpSocket second(std::move(first));
    EXPECT_FALSE(first.isValid());
    EXPECT_TRUE(second.isValid());
    EXPECT_EQ(second.getLocalPort(), port);
}

TEST_F(UdpSocketTest, SendReceiveLoopback) {
    UdpSocket sender;
    UdpSocket receiver;
    ASSERT_TRUE(receiver.bind(0, "127.0.0.1"));

    const char* message = "Hello, UDP!";
    int sent = sender.sendTo(SocketAddress("127.0.0.1", receiver.getLocalPort()),
                             message, std::strlen(message));
    EXPECT_EQ(sent, static_cast<int>(std::strlen(message)));

    char buffer[256];
    SocketAddress from;
    int received = receiver.receiveFrom(buffer, sizeof(buffer) - 1, 1000, from);

    ASSERT_GT(received, 0);
    buffer[received] = '\0';
    EXPECT_STREQ(buffer, message);
    EXPECT_EQ(from.ip, "127.0.0.1");
}

TEST_F(UdpSocketTest, ReceiveTimeout) {
    UdpSocket socket;
    ASSERT_TRUE(socket.bind(0, "127.0.0.1"));

    char buffer[256];
    SocketAddress from;

    auto start = std::chrono::steady_clock::now();
    int received = socket.receiveFrom(buffer, sizeof(buffer), 100, from);
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    EXPECT_EQ(received, 0);
    EXPECT_GE(elapsed.count(), 90);  // Allow some tolerance
}

TEST_F(UdpSocketTest, EnableBroadcast) {
    UdpSocket socket;
    EXPECT_TRUE(socket.setBroadcast(true));
}

TEST_F(UdpSocketTest, ReuseAddressRoundTrip) {
    UdpSocket socket;
    EXPECT_FALSE(socket.isReuseAddress());
    ASSERT_TRUE(socket.setReuseAddress(true));
    EXPECT_TRUE(socket.isReuseAddress());
}

// =============================================================================
// createSocket
// =============================================================================

class SocketFactoryTest : public ::testing::Test {
protected:
    SocketInitializer init_;
};

TEST_F(SocketFactoryTest, DiscoveryPortConstant) {
    EXPECT_EQ(DISCOVERY_PORT, 10001);
}

TEST_F(SocketFactoryTest, SocketIsReadyForDiscovery) {
    UdpSocket socket = createSocket(0);
    EXPECT_TRUE(socket.isValid());
    EXPECT_NE(socket.getLocalPort(), 0);
    EXPECT_TRUE(socket.isReuseAddress());
}

TEST_F(SocketFactoryTest, PrefersRequestedPort) {
    // Find a free port, release it, then ask the factory for it
    uint16_t port;
    {
        UdpSocket probe;
        ASSERT_TRUE(probe.bind(0));
        port = probe.getLocalPort();
    }

    UdpSocket socket = createSocket(port);
    EXPECT_EQ(socket.getLocalPort(), port);
}

TEST_F(SocketFactoryTest, FallsBackWhenPortBusy) {
    UdpSocket holder;
    ASSERT_TRUE(holder.bind(0));
    uint16_t busy = holder.getLocalPort();

    UdpSocket socket = createSocket(busy);
    EXPECT_TRUE(socket.isValid());
    EXPECT_NE(socket.getLocalPort(), 0);
    EXPECT_NE(socket.getLocalPort(), busy);
}

TEST_F(SocketFactoryTest, DoubleBindOfDiscoveryPortYieldsDistinctPorts) {
    UdpSocket first = createSocket(DISCOVERY_PORT);
    UdpSocket second = createSocket(DISCOVERY_PORT);

    EXPECT_TRUE(first.isValid());
    EXPECT_TRUE(second.isValid());
    EXPECT_NE(first.getLocalPort(), second.getLocalPort());
}

TEST_F(SocketFactoryTest, NonBlockingReceiveReturnsImmediately) {
    UdpSocket socket = createSocket(0);

    char buffer[64];
    SocketAddress from;
    EXPECT_EQ(socket.receiveFrom(buffer, sizeof(buffer), 0, from), 0);
}

TEST_F(SocketFactoryTest, SocketErrorCarriesCode) {
    SocketError error("bind failed", 13);
    EXPECT_EQ(error.code(), 13);
    EXPECT_NE(std::string(error.what()).find("bind failed"), std::string::npos);
}
