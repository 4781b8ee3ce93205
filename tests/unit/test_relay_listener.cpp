// tests/unit/test_relay_listener.cpp
#include <gtest/gtest.h>
#include "../../src/core/relay/relay_listener.hpp"
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <poll.h>
#include <cerrno>
#include <cstring>
#include <atomic>
#include <mutex>
#include <system_error>
#include <thread>

using namespace WolRelay::Relay;
using namespace std::chrono_literals;

namespace
{
    class RecordingDirectSender : public DirectPacketSender
    {
    public:
        RecordingDirectSender() : DirectPacketSender(9, 1) {}

        size_t count() const
        {
            std::lock_guard<std::mutex> lock(mutex);
            return destinations.size();
        }

    protected:
        bool sendDatagram(const Packet &packet, const std::string &broadcast_address, uint16_t port) override
        {
            (void)packet;
            (void)port;
            std::lock_guard<std::mutex> lock(mutex);
            destinations.push_back(broadcast_address);
            return true;
        }

    private:
        mutable std::mutex mutex;
        std::vector<std::string> destinations;
    };

    sockaddr_in loopbackAddress(uint16_t port)
    {
        sockaddr_in addr;
        std::memset(&addr, 0, sizeof(addr));
        addr.sin_family = AF_INET;
        addr.sin_port = htons(port);
        inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
        return addr;
    }

    bool sendUdp(uint16_t port, const Packet &payload)
    {
        int fd = socket(AF_INET, SOCK_DGRAM, 0);
        if (fd < 0)
        {
            return false;
        }
        sockaddr_in addr = loopbackAddress(port);
        ssize_t sent = sendto(fd, payload.data(), payload.size(), 0,
                              reinterpret_cast<sockaddr *>(&addr), sizeof(addr));
        close(fd);
        return sent == static_cast<ssize_t>(payload.size());
    }

    // Kết nối TCP, gửi payload (nếu có) rồi đóng
    bool sendTcp(uint16_t port, const Packet &payload)
    {
        int fd = socket(AF_INET, SOCK_STREAM, 0);
        if (fd < 0)
        {
            return false;
        }
        sockaddr_in addr = loopbackAddress(port);
        if (connect(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0)
        {
            close(fd);
            return false;
        }
        bool ok = true;
        if (!payload.empty())
        {
            ok = send(fd, payload.data(), payload.size(), 0) == static_cast<ssize_t>(payload.size());
        }
        close(fd);
        return ok;
    }

    // accept() luôn thất bại như khi process hết file descriptor
    class ExhaustedTcpListener : public TcpRelayListener
    {
    public:
        using TcpRelayListener::TcpRelayListener;
        ~ExhaustedTcpListener() override { stop(); }

        std::atomic<int> attempts{0};

    protected:
        int acceptConnection(struct sockaddr_in &source) override
        {
            (void)source;
            attempts.fetch_add(1);
            errno = EMFILE;
            return -1;
        }
    };

    // Không tạo được thread cho kết nối mới
    class ThreadlessTcpListener : public TcpRelayListener
    {
    public:
        using TcpRelayListener::TcpRelayListener;
        ~ThreadlessTcpListener() override { stop(); }

        std::atomic<int> spawn_attempts{0};

    protected:
        std::thread spawnConnection(int client_fd, const std::string &source_address,
                                    std::shared_ptr<std::atomic<bool>> finished) override
        {
            (void)client_fd;
            (void)source_address;
            (void)finished;
            spawn_attempts.fetch_add(1);
            throw std::system_error(std::make_error_code(std::errc::resource_unavailable_try_again));
        }
    };

    int connectTcp(uint16_t port)
    {
        int fd = socket(AF_INET, SOCK_STREAM, 0);
        if (fd < 0)
        {
            return -1;
        }
        sockaddr_in addr = loopbackAddress(port);
        if (connect(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0)
        {
            close(fd);
            return -1;
        }
        return fd;
    }

    // Phía server đã đóng kết nối: recv() trả về 0
    bool peerClosed(int fd, int timeout_ms)
    {
        pollfd pfd;
        pfd.fd = fd;
        pfd.events = POLLIN;
        pfd.revents = 0;
        if (poll(&pfd, 1, timeout_ms) <= 0)
        {
            return false;
        }
        char byte;
        return recv(fd, &byte, 1, 0) == 0;
    }

    template <typename Predicate>
    bool waitUntil(Predicate predicate, std::chrono::milliseconds timeout = 3000ms)
    {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (!predicate())
        {
            if (std::chrono::steady_clock::now() > deadline)
            {
                return false;
            }
            std::this_thread::sleep_for(5ms);
        }
        return true;
    }
}

// ==================== Test Fixture ====================
class RelayListenerTest : public ::testing::Test
{
protected:
    std::shared_ptr<RecordingDirectSender> sender;
    std::shared_ptr<RequestProcessor> processor;
    NetworkAdapter loopback;

    void SetUp() override
    {
        loopback = NetworkAdapter("lo", "127.0.0.1", "255.0.0.0", "127.255.255.255", true);
        NetworkAdapter outgoing("eth1", "10.0.0.5", "255.255.0.0", "10.0.255.255");

        sender = std::make_shared<RecordingDirectSender>();
        processor = std::make_shared<RequestProcessor>(
            std::make_shared<WolPacketCodec>(), sender, AdapterList{outgoing}, AddressSet(), true);
    }

    ListenerConfig makeConfig() const
    {
        ListenerConfig config;
        config.adapter = loopback;
        config.port = 0;
        config.poll_timeout_ms = 50;
        config.read_timeout_ms = 300;
        return config;
    }
};

// ==================== UDP Tests ====================

TEST_F(RelayListenerTest, UdpInitializeBindsEphemeralPort)
{
    UdpRelayListener listener(makeConfig(), processor);

    ASSERT_TRUE(listener.initialize());
    EXPECT_NE(listener.getBoundPort(), 0);
    EXPECT_EQ(listener.getTransport(), Transport::UDP);
    EXPECT_EQ(listener.describe(), "UDP 127.0.0.1:" + std::to_string(listener.getBoundPort()));
    EXPECT_FALSE(listener.isRunning());
}

TEST_F(RelayListenerTest, UdpForwardsMagicPacket)
{
    UdpRelayListener listener(makeConfig(), processor);
    ASSERT_TRUE(listener.initialize());
    ASSERT_TRUE(listener.start());

    ASSERT_TRUE(sendUdp(listener.getBoundPort(), WolPacketCodec::buildPacket("AA:BB:CC:DD:EE:FF")));
    ASSERT_TRUE(waitUntil([&]() { return listener.getStats().packets_forwarded == 1; }));

    EXPECT_EQ(sender->count(), 1);

    listener.stop();
    EXPECT_FALSE(listener.isRunning());
}

TEST_F(RelayListenerTest, UdpRejectsNonWolData)
{
    UdpRelayListener listener(makeConfig(), processor);
    ASSERT_TRUE(listener.initialize());
    ASSERT_TRUE(listener.start());

    ASSERT_TRUE(sendUdp(listener.getBoundPort(), Packet{'h', 'e', 'l', 'l', 'o'}));
    ASSERT_TRUE(waitUntil([&]() { return listener.getStats().packets_rejected == 1; }));

    // Listener vẫn xử lý datagram tiếp theo
    ASSERT_TRUE(sendUdp(listener.getBoundPort(), WolPacketCodec::buildPacket("00:11:22:33:44:55")));
    ASSERT_TRUE(waitUntil([&]() { return listener.getStats().packets_forwarded == 1; }));

    ListenerStats stats = listener.getStats();
    EXPECT_EQ(stats.packets_received, 2);
    EXPECT_EQ(sender->count(), 1);
}

TEST_F(RelayListenerTest, StartRequiresInitialize)
{
    UdpRelayListener listener(makeConfig(), processor);
    EXPECT_FALSE(listener.start());
}

TEST_F(RelayListenerTest, BindFailsOnForeignAddress)
{
    ListenerConfig config = makeConfig();
    config.adapter = NetworkAdapter("eth9", "203.0.113.77", "255.255.255.0", "203.0.113.255");

    UdpRelayListener listener(config, processor);
    EXPECT_FALSE(listener.initialize());
}

TEST_F(RelayListenerTest, StopIsIdempotent)
{
    UdpRelayListener listener(makeConfig(), processor);
    ASSERT_TRUE(listener.initialize());
    ASSERT_TRUE(listener.start());

    listener.stop();
    listener.stop();
    EXPECT_FALSE(listener.isRunning());
}

// ==================== TCP Tests ====================

TEST_F(RelayListenerTest, TcpForwardsMagicPacket)
{
    TcpRelayListener listener(makeConfig(), processor);
    ASSERT_TRUE(listener.initialize());
    ASSERT_TRUE(listener.start());
    EXPECT_EQ(listener.getTransport(), Transport::TCP);

    ASSERT_TRUE(sendTcp(listener.getBoundPort(), WolPacketCodec::buildPacket("AA:BB:CC:DD:EE:FF")));
    ASSERT_TRUE(waitUntil([&]() { return listener.getStats().packets_forwarded == 1; }));

    EXPECT_EQ(listener.getStats().connections, 1);
    EXPECT_EQ(sender->count(), 1);
}

TEST_F(RelayListenerTest, TcpConnectionWithoutData)
{
    TcpRelayListener listener(makeConfig(), processor);
    ASSERT_TRUE(listener.initialize());
    ASSERT_TRUE(listener.start());

    ASSERT_TRUE(sendTcp(listener.getBoundPort(), Packet()));
    ASSERT_TRUE(waitUntil([&]() { return listener.getStats().connections == 1; }));
    ASSERT_TRUE(waitUntil([&]() { return listener.getOpenConnectionCount() == 0; }));

    ListenerStats stats = listener.getStats();
    EXPECT_EQ(stats.packets_received, 0);
    EXPECT_EQ(sender->count(), 0);
}

TEST_F(RelayListenerTest, TcpIdleConnectionTimesOut)
{
    TcpRelayListener listener(makeConfig(), processor);
    ASSERT_TRUE(listener.initialize());
    ASSERT_TRUE(listener.start());

    int fd = socket(AF_INET, SOCK_STREAM, 0);
    ASSERT_GE(fd, 0);
    sockaddr_in addr = loopbackAddress(listener.getBoundPort());
    ASSERT_EQ(connect(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)), 0);

    ASSERT_TRUE(waitUntil([&]() { return listener.getStats().connections == 1; }));

    // read_timeout_ms = 300: kết nối bị đóng dù client không gửi gì
    EXPECT_TRUE(waitUntil([&]() { return listener.getOpenConnectionCount() == 0; }));
    close(fd);

    EXPECT_EQ(listener.getStats().packets_received, 0);
}

TEST_F(RelayListenerTest, TcpStopWithOpenConnection)
{
    TcpRelayListener listener(makeConfig(), processor);
    ASSERT_TRUE(listener.initialize());
    ASSERT_TRUE(listener.start());

    int fd = socket(AF_INET, SOCK_STREAM, 0);
    ASSERT_GE(fd, 0);
    sockaddr_in addr = loopbackAddress(listener.getBoundPort());
    ASSERT_EQ(connect(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)), 0);
    ASSERT_TRUE(waitUntil([&]() { return listener.getStats().connections == 1; }));

    listener.stop();
    EXPECT_FALSE(listener.isRunning());
    EXPECT_EQ(listener.getOpenConnectionCount(), 0);
    close(fd);
}

TEST_F(RelayListenerTest, TcpAcceptFailureWaitsBeforeRetry)
{
    ExhaustedTcpListener listener(makeConfig(), processor);
    ASSERT_TRUE(listener.initialize());
    ASSERT_TRUE(listener.start());

    // Kết nối nằm trong backlog nên socket lắng nghe luôn readable
    int fd = connectTcp(listener.getBoundPort());
    ASSERT_GE(fd, 0);
    ASSERT_TRUE(waitUntil([&]() { return listener.attempts.load() >= 1; }));

    std::this_thread::sleep_for(300ms);
    listener.stop();
    close(fd);

    // poll_timeout_ms = 50: khoảng 6 lần thử trong 300 ms
    EXPECT_LE(listener.attempts.load(), 20);
    EXPECT_GE(listener.getStats().errors, 1);
    EXPECT_EQ(listener.getStats().connections, 0);
}

TEST_F(RelayListenerTest, TcpThreadFailureClosesConnectionAndKeepsListening)
{
    ThreadlessTcpListener listener(makeConfig(), processor);
    ASSERT_TRUE(listener.initialize());
    ASSERT_TRUE(listener.start());

    int first = connectTcp(listener.getBoundPort());
    ASSERT_GE(first, 0);
    ASSERT_TRUE(waitUntil([&]() { return listener.spawn_attempts.load() == 1; }));
    EXPECT_TRUE(peerClosed(first, 2000));
    close(first);

    // Listener vẫn accept kết nối tiếp theo
    EXPECT_TRUE(listener.isRunning());
    int second = connectTcp(listener.getBoundPort());
    ASSERT_GE(second, 0);
    EXPECT_TRUE(waitUntil([&]() { return listener.spawn_attempts.load() == 2; }));
    EXPECT_TRUE(peerClosed(second, 2000));
    close(second);

    listener.stop();
    EXPECT_EQ(listener.getStats().connections, 2);
    EXPECT_EQ(listener.getStats().errors, 2);
    EXPECT_EQ(listener.getOpenConnectionCount(), 0);
}

// ==================== ListenerManager Tests ====================

TEST_F(RelayListenerTest, ManagerAddAdapter)
{
    ListenerManager manager(processor);

    ListenerOptions options;
    options.udp_port = 0;
    options.tcp_enabled = true;
    options.tcp_port = 0;

    EXPECT_EQ(manager.addAdapter(loopback, options), 2);
    ASSERT_EQ(manager.getListenerCount(), 2);
    EXPECT_EQ(manager.getListeners()[0]->getTransport(), Transport::UDP);
    EXPECT_EQ(manager.getListeners()[1]->getTransport(), Transport::TCP);

    options.udp_enabled = false;
    options.tcp_enabled = false;
    EXPECT_EQ(manager.addAdapter(loopback, options), 0);
}

TEST_F(RelayListenerTest, ManagerStartAndStopAll)
{
    ListenerManager manager(processor);

    ListenerOptions options;
    options.udp_port = 0;
    options.tcp_enabled = true;
    options.tcp_port = 0;
    manager.addAdapter(loopback, options);

    EXPECT_EQ(manager.startAll(), 2);
    EXPECT_EQ(manager.getActiveCount(), 2);

    uint16_t udp_port = manager.getListeners()[0]->getBoundPort();
    uint16_t tcp_port = manager.getListeners()[1]->getBoundPort();

    ASSERT_TRUE(sendUdp(udp_port, WolPacketCodec::buildPacket("00:11:22:33:44:55")));
    ASSERT_TRUE(sendTcp(tcp_port, WolPacketCodec::buildPacket("AA:BB:CC:DD:EE:FF")));
    ASSERT_TRUE(waitUntil([&]() { return manager.getTotalStats().packets_forwarded == 2; }));

    ListenerStats total = manager.getTotalStats();
    EXPECT_EQ(total.packets_received, 2);
    EXPECT_EQ(total.connections, 1);

    manager.stopAll();
    EXPECT_EQ(manager.getActiveCount(), 0);
}

TEST_F(RelayListenerTest, ManagerSkipsListenerThatCannotBind)
{
    ListenerManager manager(processor);

    ListenerOptions options;
    options.udp_port = 0;
    manager.addAdapter(loopback, options);
    manager.addAdapter(NetworkAdapter("eth9", "203.0.113.77", "255.255.255.0", "203.0.113.255"), options);

    EXPECT_EQ(manager.startAll(), 1);
    EXPECT_EQ(manager.getActiveCount(), 1);
}

TEST_F(RelayListenerTest, TransportToString)
{
    EXPECT_EQ(transportToString(Transport::UDP), "UDP");
    EXPECT_EQ(transportToString(Transport::TCP), "TCP");
}
