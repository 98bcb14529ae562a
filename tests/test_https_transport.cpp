// SPDX-License-Identifier: Apache-2.0
// Part of the VpnCtl (VCTL) project.
// tests/test_https_transport.cpp

#include <gtest/gtest.h>
#include <chrono>
#include <fstream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <openssl/ssl.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include "vctl/error.hpp"
#include "vctl/pins.hpp"
#include "vctl/internal/dialer.hpp"
#include "vctl/internal/https_transport.hpp"
#include "test_support.hpp"

namespace {

using namespace std::chrono_literals;
using vctl_test::make_cert;
using vctl_test::make_ed25519_key;

// TLS 1.3 server on loopback answering `connections` requests in turn with a
// canned response.
class TlsServer {
public:
    TlsServer(X509* cert, EVP_PKEY* key, std::string response, int connections = 1)
        : _listener(SOCK_STREAM), _response(std::move(response)), _connections(connections)
    {
        _ctx = SSL_CTX_new(TLS_server_method());
        SSL_CTX_set_min_proto_version(_ctx, TLS1_3_VERSION);
        SSL_CTX_use_certificate(_ctx, cert);
        SSL_CTX_use_PrivateKey(_ctx, key);
        SSL_CTX_set_alpn_select_cb(_ctx, &TlsServer::on_alpn, this);
        _thread = std::thread([this] {
            for (int i = 0; i < _connections; ++i) {
                if (!serve_one()) return;
            }
        });
    }
    ~TlsServer() {
        if (_thread.joinable()) _thread.join();
        SSL_CTX_free(_ctx);
    }

    std::uint16_t port() const { return _listener.port; }

    // Valid after join().
    const std::string& request() const { return _requests.front(); }
    int handshakes() const { return _handshakes; }
    int resumed() const { return _resumed; }
    const std::string& offered_alpn() const { return _alpn; }   // wire format, as sent

    void join() { if (_thread.joinable()) _thread.join(); }

private:
    static int on_alpn(SSL*, const unsigned char** out, unsigned char* outlen,
                       const unsigned char* in, unsigned int inlen, void* arg) {
        auto* self = static_cast<TlsServer*>(arg);
        self->_alpn.assign((const char*)in, inlen);
        return SSL_select_next_proto((unsigned char**)out, outlen,
                                     (const unsigned char*)"\x08http/1.1", 9, in, inlen) == OPENSSL_NPN_NEGOTIATED
                   ? SSL_TLSEXT_ERR_OK : SSL_TLSEXT_ERR_NOACK;
    }

    bool serve_one() {
        pollfd pfd{_listener.fd, POLLIN, 0};
        if (::poll(&pfd, 1, 3000) != 1) return false;
        const int fd = ::accept(_listener.fd, nullptr, nullptr);
        if (fd < 0) return false;
        timeval tv{3, 0};
        ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

        SSL* ssl = SSL_new(_ctx);
        SSL_set_fd(ssl, fd);
        if (SSL_accept(ssl) == 1) {
            ++_handshakes;
            if (SSL_session_reused(ssl)) ++_resumed;
            std::string req;
            char buf[4096];
            std::size_t want = std::string::npos;
            for (;;) {
                const int n = SSL_read(ssl, buf, sizeof(buf));
                if (n <= 0) break;
                req.append(buf, (std::size_t)n);
                const std::size_t hdr = req.find("\r\n\r\n");
                if (hdr != std::string::npos && want == std::string::npos) {
                    const std::size_t cl = req.find("Content-Length: ");
                    want = hdr + 4 + (cl == std::string::npos ? 0 : std::stoul(req.substr(cl + 16)));
                }
                if (want != std::string::npos && req.size() >= want) break;
            }
            _requests.push_back(std::move(req));
            SSL_write(ssl, _response.data(), (int)_response.size());
            SSL_shutdown(ssl);
        }
        SSL_free(ssl);
        ::close(fd);
        return true;
    }

    vctl_test::BoundSocket _listener;
    std::string _response;
    int _connections;
    std::vector<std::string> _requests;
    int _handshakes = 0;
    int _resumed = 0;
    std::string _alpn;
    SSL_CTX* _ctx = nullptr;
    std::thread _thread;
};

class HttpsTransportTest : public ::testing::Test {
protected:
    vctl_test::TempDir dir;
    vctl_test::PkeyPtr ca_key = make_ed25519_key();
    vctl_test::PkeyPtr leaf_key = make_ed25519_key();
    vctl_test::X509Ptr ca = make_cert("Test Root CA", ca_key.get(), true, nullptr, nullptr);
    vctl_test::X509Ptr leaf = make_cert("localhost", leaf_key.get(), false, ca.get(), ca_key.get(),
                                        "DNS:localhost,IP:127.0.0.1", 2);
    vctl::ClientConfig cfg;
    vctl::internal::Dialer dialer{0, {}};

    void SetUp() override {
        cfg.ca_file = dir.file("ca.pem");
        std::ofstream(cfg.ca_file) << vctl_test::to_pem(ca.get());
        cfg.pins = {{"Test Root CA", vctl::PinVerifier::pin_of(ca.get())}};
        cfg.tls_handshake_timeout_sec = 3;
        cfg.response_header_timeout_sec = 3;
    }

    vctl::PostTarget target(std::uint16_t port, const std::string& name) const {
        vctl::PostTarget t;
        t.host = "127.0.0.1";
        t.port = port;
        t.server_name = name;
        t.path = "/v1.0.0/connect";
        return t;
    }
};

TEST_F(HttpsTransportTest, PinnedExchangeWithContentLength) {
    TlsServer server(leaf.get(), leaf_key.get(),
                     "HTTP/1.1 200 OK\r\nContent-Type: application/json\r\nContent-Length: 11\r\n\r\n{\"ok\":true}");
    const vctl::PinVerifier pins(cfg.pins);
    vctl::internal::HttpsTransport transport(cfg, dialer, pins);
    ASSERT_FALSE(transport.status());

    vctl::HttpResponse resp;
    const auto ctx = vctl::Context::background().with_timeout(5s);
    ASSERT_FALSE(transport.post(ctx, target(server.port(), "localhost"), "{\"a\":1}", resp));
    EXPECT_EQ(resp.status_code, 200);
    EXPECT_EQ(resp.headers["content-type"], "application/json");
    EXPECT_EQ(resp.body, "{\"ok\":true}");

    server.join();
    EXPECT_EQ(server.request().rfind("POST /v1.0.0/connect HTTP/1.1\r\n", 0), 0u);
    // Host names the dialed address; "localhost" only goes out as SNI.
    EXPECT_NE(server.request().find("Host: 127.0.0.1:" + std::to_string(server.port()) + "\r\n"),
              std::string::npos);
    EXPECT_NE(server.request().find("User-Agent: vctl-client/1"), std::string::npos);
    EXPECT_EQ(server.offered_alpn(), std::string("\x08http/1.1", 9));
    EXPECT_EQ(server.request().substr(server.request().size() - 7), "{\"a\":1}");
}

TEST_F(HttpsTransportTest, EveryRequestHandshakesAndChecksPins) {
    vctl_test::LogCapture logs;
    TlsServer server(leaf.get(), leaf_key.get(), "HTTP/1.1 200 OK\r\nContent-Length: 2\r\n\r\n{}", 2);
    const vctl::PinVerifier pins(cfg.pins);
    vctl::internal::HttpsTransport transport(cfg, dialer, pins);

    for (int i = 0; i < 2; ++i) {
        vctl::HttpResponse resp;
        ASSERT_FALSE(transport.post(vctl::Context::background().with_timeout(5s),
                                    target(server.port(), "localhost"), "{}", resp));
        EXPECT_EQ(resp.body, "{}");
    }

    server.join();
    EXPECT_EQ(server.handshakes(), 2);
    EXPECT_EQ(server.resumed(), 0);
    EXPECT_EQ(logs.count("[PINS] Test Root CA pin OK"), 2u);
}

TEST_F(HttpsTransportTest, ChunkedBodyAndIpServerName) {
    TlsServer server(leaf.get(), leaf_key.get(),
                     "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n3\r\nfal\r\n2\r\nse\r\n0\r\n\r\n");
    const vctl::PinVerifier pins(cfg.pins);
    vctl::internal::HttpsTransport transport(cfg, dialer, pins);

    vctl::HttpResponse resp;
    const auto ctx = vctl::Context::background().with_timeout(5s);
    ASSERT_FALSE(transport.post(ctx, target(server.port(), "127.0.0.1"), "{}", resp));
    EXPECT_EQ(resp.body, "false");
}

TEST_F(HttpsTransportTest, BodyUntilClose) {
    TlsServer server(leaf.get(), leaf_key.get(), "HTTP/1.1 403 Forbidden\r\nConnection: close\r\n\r\nold client");
    const vctl::PinVerifier pins(cfg.pins);
    vctl::internal::HttpsTransport transport(cfg, dialer, pins);

    vctl::HttpResponse resp;
    ASSERT_FALSE(transport.post(vctl::Context::background().with_timeout(5s),
                                target(server.port(), "localhost"), "{}", resp));
    EXPECT_EQ(resp.status_code, 403);
    EXPECT_EQ(resp.body, "old client");
}

TEST_F(HttpsTransportTest, UnpinnedCaIsRejected) {
    vctl_test::LogCapture logs;
    TlsServer server(leaf.get(), leaf_key.get(), "HTTP/1.1 200 OK\r\nContent-Length: 0\r\n\r\n");

    // Chain of trust is fine (the CA is in the bundle) but its key is not pinned.
    auto other_key = make_ed25519_key();
    auto other = make_cert("Test Root CA", other_key.get(), true, nullptr, nullptr);
    cfg.pins = {{"Test Root CA", vctl::PinVerifier::pin_of(other.get())}};
    const vctl::PinVerifier pins(cfg.pins);
    vctl::internal::HttpsTransport transport(cfg, dialer, pins);

    vctl::HttpResponse resp;
    const std::error_code ec = transport.post(vctl::Context::background().with_timeout(5s),
                                              target(server.port(), "localhost"), "{}", resp);
    EXPECT_EQ(ec, vctl::errc::bad_pin);
    EXPECT_TRUE(logs.contains("[PINS] Test Root CA pin failed"));
}

TEST_F(HttpsTransportTest, NameMismatchFailsVerification) {
    TlsServer server(leaf.get(), leaf_key.get(), "HTTP/1.1 200 OK\r\nContent-Length: 0\r\n\r\n");
    const vctl::PinVerifier pins(cfg.pins);
    vctl::internal::HttpsTransport transport(cfg, dialer, pins);

    vctl::HttpResponse resp;
    EXPECT_EQ(transport.post(vctl::Context::background().with_timeout(5s),
                             target(server.port(), "nl.hideservers.net"), "{}", resp),
              vctl::errc::tls_verify_failed);
}

TEST_F(HttpsTransportTest, UntrustedChainFailsVerification) {
    TlsServer server(leaf.get(), leaf_key.get(), "HTTP/1.1 200 OK\r\nContent-Length: 0\r\n\r\n");

    auto other_key = make_ed25519_key();
    auto other = make_cert("Other Root CA", other_key.get(), true, nullptr, nullptr);
    std::ofstream(cfg.ca_file, std::ios::trunc) << vctl_test::to_pem(other.get());
    const vctl::PinVerifier pins(cfg.pins);
    vctl::internal::HttpsTransport transport(cfg, dialer, pins);

    vctl::HttpResponse resp;
    EXPECT_EQ(transport.post(vctl::Context::background().with_timeout(5s),
                             target(server.port(), "localhost"), "{}", resp),
              vctl::errc::tls_verify_failed);
}

TEST_F(HttpsTransportTest, SilentServerTimesOut) {
    // Accepts TCP but never speaks TLS.
    vctl_test::BoundSocket listener(SOCK_STREAM);
    cfg.tls_handshake_timeout_sec = 1;
    const vctl::PinVerifier pins(cfg.pins);
    vctl::internal::HttpsTransport transport(cfg, dialer, pins);

    vctl::HttpResponse resp;
    const auto t0 = std::chrono::steady_clock::now();
    EXPECT_EQ(transport.post(vctl::Context::background().with_timeout(10s),
                             target(listener.port, "localhost"), "{}", resp),
              vctl::errc::timed_out);
    EXPECT_LT(std::chrono::steady_clock::now() - t0, 5s);
}

} // namespace
