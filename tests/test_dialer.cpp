// SPDX-License-Identifier: Apache-2.0
// Part of the VpnCtl (VCTL) project.
// tests/test_dialer.cpp

#include <gtest/gtest.h>
#include <chrono>
#include <string>
#include <vector>

#include <poll.h>
#include <sys/socket.h>

#include "vctl/error.hpp"
#include "vctl/internal/dialer.hpp"
#include "test_support.hpp"

namespace {

using namespace std::chrono_literals;
using vctl::internal::Dialer;
using vctl::internal::Network;
using vctl_test::BoundSocket;

// Reads one datagram, or returns "" after 2 seconds.
std::string recv_datagram(int fd) {
    pollfd pfd{fd, POLLIN, 0};
    if (::poll(&pfd, 1, 2000) != 1) return {};
    char buf[512];
    const ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
    return n > 0 ? std::string(buf, (std::size_t)n) : std::string();
}

TEST(DialerTest, ParseDnsServers) {
    using vctl::internal::parse_dns_servers;
    EXPECT_EQ(parse_dns_servers(""), std::vector<std::string>{"1.1.1.1:53"});
    EXPECT_EQ(parse_dns_servers(" , "), std::vector<std::string>{"1.1.1.1:53"});

    const auto v = parse_dns_servers("9.9.9.9, 8.8.8.8:5353 ,2001:db8::53,[2001:db8::54]:853");
    ASSERT_EQ(v.size(), 4u);
    EXPECT_EQ(v[0], "9.9.9.9:53");
    EXPECT_EQ(v[1], "8.8.8.8:5353");
    EXPECT_EQ(v[2], "[2001:db8::53]:53");
    EXPECT_EQ(v[3], "[2001:db8::54]:853");
}

TEST(DialerTest, PicksWithInjectedIndex) {
    const Dialer d(0, {"10.0.0.1:53", "10.0.0.2:53", "10.0.0.3:53"},
                   [](std::size_t n) { return n - 1; });
    EXPECT_EQ(d.pick_dns_server(), "10.0.0.3:53");

    const Dialer wild(0, {"10.0.0.1:53", "10.0.0.2:53"}, [](std::size_t) { return std::size_t(99); });
    EXPECT_EQ(wild.pick_dns_server(), "10.0.0.1:53");

    const Dialer empty(0, {});
    EXPECT_EQ(empty.pick_dns_server(), "1.1.1.1:53");
}

TEST(DialerTest, UdpAlwaysGoesToConfiguredDnsServer) {
    BoundSocket first(SOCK_DGRAM), second(SOCK_DGRAM);
    const Dialer d(0,
                   {"127.0.0.1:" + std::to_string(first.port), "127.0.0.1:" + std::to_string(second.port)},
                   [](std::size_t) { return std::size_t(1); });

    const auto ctx = vctl::Context::background().with_timeout(2s);
    vctl::internal::Socket s;
    // The requested address is irrelevant for UDP.
    ASSERT_FALSE(d.dial(ctx, Network::Udp, "192.0.2.1:53", s));
    ASSERT_FALSE(s.send_all(ctx, "query", 5));
    EXPECT_EQ(recv_datagram(second.fd), "query");

    pollfd pfd{first.fd, POLLIN, 0};
    EXPECT_EQ(::poll(&pfd, 1, 50), 0);
}

TEST(DialerTest, FirewallMarkFailureDoesNotFailDial) {
    // Without CAP_NET_ADMIN the mark cannot be set; the dial still works.
    BoundSocket server(SOCK_DGRAM);
    const Dialer d(0x1234, {"127.0.0.1:" + std::to_string(server.port)});

    const auto ctx = vctl::Context::background().with_timeout(2s);
    vctl::internal::Socket s;
    ASSERT_FALSE(d.dial(ctx, Network::Udp, "", s));
    ASSERT_FALSE(s.send_all(ctx, "x", 1));
    EXPECT_EQ(recv_datagram(server.fd), "x");
    EXPECT_EQ(d.firewall_mark(), 0x1234);
}

TEST(DialerTest, TcpConnects) {
    BoundSocket listener(SOCK_STREAM);
    const Dialer d(0, {});

    const auto ctx = vctl::Context::background().with_timeout(2s);
    vctl::internal::Socket s;
    ASSERT_FALSE(d.dial(ctx, Network::Tcp, "127.0.0.1:" + std::to_string(listener.port), s));
    EXPECT_TRUE(s.is_open());
}

TEST(DialerTest, TcpRefusedIsSystemError) {
    std::uint16_t port = 0;
    {
        BoundSocket gone(SOCK_STREAM);
        port = gone.port;
    }
    const Dialer d(0, {});
    vctl::internal::Socket s;
    const std::error_code ec = d.dial(vctl::Context::background().with_timeout(2s),
                                      Network::Tcp, "127.0.0.1:" + std::to_string(port), s);
    EXPECT_EQ(ec, std::errc::connection_refused);
    EXPECT_EQ(ec, vctl::error_kind::transport);
    EXPECT_FALSE(s.is_open());
}

TEST(DialerTest, CancelledContextDialsNothing) {
    const auto ctx = vctl::Context::background().with_cancel();
    ctx.cancel();
    const Dialer d(0, {});
    vctl::internal::Socket s;
    EXPECT_EQ(d.dial(ctx, Network::Tcp, "127.0.0.1:1", s), vctl::errc::cancelled);
}

TEST(DialerTest, MalformedAddress) {
    const Dialer d(0, {});
    vctl::internal::Socket s;
    EXPECT_EQ(d.dial(vctl::Context::background(), Network::Tcp, "no-port", s), vctl::errc::dial_failed);
}

} // namespace
