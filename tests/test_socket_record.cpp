#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../src/core/SocketRecord.h"
#include <algorithm>
#include <vector>

namespace sockreap {

static Endpoint ep(const char* addr, std::uint16_t port) {
    return Endpoint{*IpAddress::parse(addr), port};
}

TEST(SocketRecordTest, TcpRecordCarriesState) {
    auto r = SocketRecord::tcp(ep("0.0.0.0", 8080), TcpState::Listen, std::nullopt, SocketOwner{1234, "nginx", 33}, 555);
    EXPECT_EQ(r.protocol(), Protocol::TCP);
    EXPECT_EQ(r.local_port(), 8080);
    ASSERT_TRUE(r.connection_state().has_value());
    EXPECT_EQ(*r.connection_state(), TcpState::Listen);
    EXPECT_FALSE(r.remote_address().has_value());
    EXPECT_FALSE(r.remote_port().has_value());
    EXPECT_EQ(r.owning_pid(), 1234);
    EXPECT_EQ(r.owning_process_name(), "nginx");
    EXPECT_EQ(r.owning_uid(), std::optional<std::uint32_t>(33));
    EXPECT_EQ(r.kernel_inode(), std::optional<std::uint64_t>(555));
    EXPECT_TRUE(std::holds_alternative<TcpTransport>(r.transport()));
}

TEST(SocketRecordTest, UdpRecordHasNoState) {
    auto r = SocketRecord::udp(ep("127.0.0.53", 53), std::nullopt, SocketOwner{890, "systemd-resolve", std::nullopt});
    EXPECT_EQ(r.protocol(), Protocol::UDP);
    EXPECT_FALSE(r.connection_state().has_value());
    EXPECT_FALSE(r.owning_uid().has_value());
    EXPECT_FALSE(r.kernel_inode().has_value());
    EXPECT_TRUE(std::holds_alternative<UdpTransport>(r.transport()));
}

TEST(SocketRecordTest, ConnectedRemoteEndpoint) {
    auto r = SocketRecord::tcp(ep("10.0.0.5", 44000), TcpState::Established, ep("93.184.216.34", 443), SocketOwner{77, "curl", 1000});
    ASSERT_TRUE(r.remote_address().has_value());
    EXPECT_EQ(r.remote_address()->to_string(), "93.184.216.34");
    EXPECT_EQ(r.remote_port(), std::optional<std::uint16_t>(443));
}

TEST(SocketRecordTest, SummaryLineFormat) {
    auto tcp = SocketRecord::tcp(ep("0.0.0.0", 8080), TcpState::Listen, std::nullopt, SocketOwner{1234, "nginx", 33});
    EXPECT_EQ(tcp.summary(), "1234:8080 -- nginx Status: LISTEN -- Protocol: TCP");
    auto udp = SocketRecord::udp(ep("0.0.0.0", 53), std::nullopt, SocketOwner{0, "unknown", std::nullopt});
    EXPECT_EQ(udp.summary(), "0:53 -- unknown Status: N/A -- Protocol: UDP");
}

TEST(SocketRecordTest, TcpStateCodesFollowKernelNumbering) {
    EXPECT_EQ(tcp_state_from_code(0x01), TcpState::Established);
    EXPECT_EQ(tcp_state_from_code(0x06), TcpState::TimeWait);
    EXPECT_EQ(tcp_state_from_code(0x0A), TcpState::Listen);
    EXPECT_EQ(tcp_state_from_code(0x0C), TcpState::NewSynRecv);
    EXPECT_EQ(tcp_state_from_code(0x00), TcpState::Unknown);
    EXPECT_EQ(tcp_state_from_code(0x42), TcpState::Unknown);
}

TEST(SocketRecordTest, ParseTcpStateIsCaseInsensitive) {
    EXPECT_EQ(parse_tcp_state("listen"), std::optional<TcpState>(TcpState::Listen));
    EXPECT_EQ(parse_tcp_state("Time_Wait"), std::optional<TcpState>(TcpState::TimeWait));
    EXPECT_FALSE(parse_tcp_state("OPEN").has_value());
    EXPECT_STREQ(to_string(TcpState::CloseWait), "CLOSE_WAIT");
    EXPECT_STREQ(to_string(TcpState::Unknown), "UNKNOWN");
}

TEST(IpAddressTest, ParseAndFormat) {
    auto v4 = IpAddress::parse("192.168.1.10");
    ASSERT_TRUE(v4.has_value());
    EXPECT_EQ(v4->family, IpAddress::Family::V4);
    EXPECT_EQ(*v4, IpAddress::v4(192, 168, 1, 10));
    EXPECT_EQ(v4->to_string(), "192.168.1.10");

    auto v6 = IpAddress::parse("::1");
    ASSERT_TRUE(v6.has_value());
    EXPECT_EQ(v6->family, IpAddress::Family::V6);
    EXPECT_TRUE(v6->is_loopback());
    EXPECT_EQ(v6->to_string(), "::1");

    EXPECT_FALSE(IpAddress::parse("not-an-ip").has_value());
}

TEST(IpAddressTest, UnspecifiedAndLoopback) {
    EXPECT_TRUE(IpAddress::v4(0, 0, 0, 0).is_unspecified());
    EXPECT_FALSE(IpAddress::v4(0, 0, 0, 1).is_unspecified());
    EXPECT_TRUE(IpAddress::v4(127, 0, 0, 53).is_loopback());
    EXPECT_TRUE(IpAddress::parse("::")->is_unspecified());
}

TEST(IpAddressTest, V4SortsBeforeV6) {
    EXPECT_TRUE(IpAddress::v4(255, 255, 255, 255) < *IpAddress::parse("::"));
    EXPECT_TRUE(IpAddress::v4(10, 0, 0, 1) < IpAddress::v4(10, 0, 0, 2));
}

TEST(RecordOrderTest, ProtocolThenPortThenAddress) {
    std::vector<SocketRecord> recs = {
        SocketRecord::udp(ep("0.0.0.0", 53), std::nullopt, SocketOwner{5, "b", std::nullopt}),
        SocketRecord::tcp(ep("127.0.0.1", 8080), TcpState::Listen, std::nullopt, SocketOwner{4, "a", std::nullopt}),
        SocketRecord::tcp(ep("0.0.0.0", 8080), TcpState::Listen, std::nullopt, SocketOwner{4, "a", std::nullopt}),
        SocketRecord::tcp(ep("0.0.0.0", 22), TcpState::Listen, std::nullopt, SocketOwner{3, "sshd", std::nullopt}),
    };
    std::sort(recs.begin(), recs.end(), record_order);
    EXPECT_EQ(recs[0].local_port(), 22);
    EXPECT_EQ(recs[1].local_address().to_string(), "0.0.0.0");
    EXPECT_EQ(recs[2].local_address().to_string(), "127.0.0.1");
    EXPECT_EQ(recs[3].protocol(), Protocol::UDP);
}

TEST(RecordOrderTest, AbsentRemoteSortsFirst) {
    auto listener = SocketRecord::tcp(ep("0.0.0.0", 80), TcpState::Listen, std::nullopt, SocketOwner{9, "web", std::nullopt});
    auto conn = SocketRecord::tcp(ep("0.0.0.0", 80), TcpState::Established, ep("10.1.1.1", 5000), SocketOwner{9, "web", std::nullopt});
    EXPECT_TRUE(record_order(listener, conn));
    EXPECT_FALSE(record_order(conn, listener));
    EXPECT_FALSE(record_order(listener, listener));
}

TEST(SocketRecordTest, Equality) {
    auto a = SocketRecord::tcp(ep("0.0.0.0", 80), TcpState::Listen, std::nullopt, SocketOwner{9, "web", std::nullopt}, 1);
    auto b = SocketRecord::tcp(ep("0.0.0.0", 80), TcpState::Listen, std::nullopt, SocketOwner{9, "web", std::nullopt}, 1);
    auto c = SocketRecord::udp(ep("0.0.0.0", 80), std::nullopt, SocketOwner{9, "web", std::nullopt}, 1);
    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
}

}
