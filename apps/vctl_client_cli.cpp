// SPDX-License-Identifier: Apache-2.0
// Part of the VpnCtl (VCTL) project.
// apps/vctl_client_cli.cpp

#include "vctl/client.hpp"
#include "vctl/context.hpp"
#include "vctl/error.hpp"
#include "vctl/internal/utils.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

namespace {

// Cancelled from the SIGINT/SIGTERM handler.
vctl::Context g_ctx = vctl::Context::background();

extern "C" void on_signal(int) { g_ctx.cancel(); }

void usage(const char* argv0) {
    std::cerr <<
      "Usage:\n"
      "  " << argv0 << " --cmd resolve|token|connect|disconnect|filter --host H [--port P]\n"
      "\n"
      "Session:\n"
      "  --domain D            service domain (default hide.me)\n"
      "  --api V               REST API version (default v1.0.0)\n"
      "  --token-file F        access token file (base64, rewritten on refresh)\n"
      "  --user U --pass P     credentials when no access token is held\n"
      "  --pubkey B64          WireGuard public key for connect (default: fresh X25519 key)\n"
      "  --session B64         session token for disconnect\n"
      "\n"
      "Network:\n"
      "  --ca F                PEM CA bundle (default: system roots)\n"
      "  --mark N              SO_MARK for every socket (default 0, off)\n"
      "  --dns LIST            DNS servers \"ip[:port],...\" (default 1.1.1.1:53)\n"
      "  --rest_timeout <sec>  per-request timeout (default 10)\n"
      "  --retries N           attempts per operation (default 1)\n"
      "  --reconnect_wait <sec> pause between attempts (default 30)\n"
      "  --log F               also log to file F\n"
      "\n"
      "Filter (for --cmd filter):\n"
      "  --filter-ads 0|1 --filter-trackers 0|1 --filter-malware 0|1 --filter-malicious 0|1\n"
      "  --filter-pg 0|12|18 --filter-safe-search 0|1\n"
      "  --filter-risk LIST --filter-illegal LIST --filter-categories LIST\n"
      "  --filter-whitelist LIST --filter-blacklist LIST\n";
}

bool flag(const char* v) { return std::stoi(v) != 0; }

// Sleeps up to `sec` seconds; returns early with the error once g_ctx is cancelled.
std::error_code sleep_cancellable(int sec) {
    const vctl::Context wait = g_ctx.with_timeout(std::chrono::seconds(std::max(0, sec)));
    while (!wait.expired()) std::this_thread::sleep_for(std::chrono::milliseconds(100));
    return g_ctx.err();
}

// Runs op up to `attempts` times. Validation failures, cancellation and
// "update required" are final.
std::error_code with_retries(int attempts, int wait_sec, const char* what,
                             const std::function<std::error_code()>& op)
{
    std::error_code ec;
    for (int i = 1; i <= attempts; ++i) {
        ec = op();
        if (!ec) return ec;
        std::cerr << what << " failed: " << ec.message() << "\n";
        if (ec == vctl::errc::update_required || ec == vctl::error_kind::validation ||
            ec == vctl::errc::cancelled || g_ctx.cancelled()) {
            return ec;
        }
        if (i < attempts) {
            std::cerr << "retrying in " << wait_sec << "s (" << i << "/" << attempts << ")\n";
            if (auto pe = sleep_cancellable(wait_sec)) return pe;
        }
    }
    return ec;
}

// X25519 public key of a freshly generated pair; the private key goes to stdout.
bool generate_wireguard_key(vctl::Bytes& public_key) {
    EVP_PKEY_CTX* kctx = EVP_PKEY_CTX_new_id(EVP_PKEY_X25519, nullptr);
    if (!kctx) return false;
    EVP_PKEY* pkey = nullptr;
    const bool gen = EVP_PKEY_keygen_init(kctx) == 1 && EVP_PKEY_keygen(kctx, &pkey) == 1;
    EVP_PKEY_CTX_free(kctx);
    if (!gen || !pkey) return false;

    unsigned char pub[32], priv[32];
    std::size_t pub_len = sizeof(pub), priv_len = sizeof(priv);
    const bool ok = EVP_PKEY_get_raw_public_key(pkey, pub, &pub_len) == 1 &&
                    EVP_PKEY_get_raw_private_key(pkey, priv, &priv_len) == 1 &&
                    pub_len == sizeof(pub) && priv_len == sizeof(priv);
    EVP_PKEY_free(pkey);
    if (!ok) return false;

    public_key.assign((const char*)pub, pub_len);
    std::cout << "privateKey: " << vctl::internal::base64_encode(std::string((const char*)priv, priv_len)) << "\n";
    return true;
}

void print_list(const char* name, const std::vector<std::string>& v) {
    std::cout << name << ":";
    for (const auto& s : v) std::cout << " " << s;
    std::cout << "\n";
}

void print_connect(const vctl::ConnectResponse& r) {
    using vctl::internal::base64_encode;
    std::cout << "publicKey: " << base64_encode(r.public_key) << "\n";
    std::cout << "presharedKey: " << base64_encode(r.preshared_key) << "\n";
    std::cout << "endpoint: " << vctl::internal::join_host_port(r.endpoint.ip, (std::uint16_t)r.endpoint.port);
    if (!r.endpoint.zone.empty()) std::cout << " zone " << r.endpoint.zone;
    std::cout << "\n";
    std::cout << "persistentKeepalive: " << r.persistent_keepalive_ns / 1000000000 << "s\n";
    print_list("allowedIps", r.allowed_ips);
    print_list("DNS", r.dns);
    print_list("gateway", r.gateway);
    std::cout << "sessionToken: " << base64_encode(r.session_token) << "\n";
    std::cout << "staleAccessToken: " << (r.stale_access_token ? "true" : "false") << "\n";
}

} // namespace

int main(int argc, char** argv){
    vctl::ClientConfig cfg;
    std::string cmd, pubkey_b64, session_b64;
    int retries = 1;

    try {
        for(int i=1;i<argc;++i){
            std::string a=argv[i];
            if(a=="--cmd" && i+1<argc) cmd = argv[++i];
            else if(a=="--host" && i+1<argc) cfg.host = argv[++i];
            else if(a=="--port" && i+1<argc) cfg.port = (uint16_t)std::stoi(argv[++i]);
            else if(a=="--domain" && i+1<argc) cfg.domain = argv[++i];
            else if(a=="--api" && i+1<argc) cfg.api_version = argv[++i];
            else if(a=="--token-file" && i+1<argc) cfg.access_token_file = argv[++i];
            else if(a=="--user" && i+1<argc) cfg.username = argv[++i];
            else if(a=="--pass" && i+1<argc) cfg.password = argv[++i];
            else if(a=="--ca" && i+1<argc) cfg.ca_file = argv[++i];
            else if(a=="--mark" && i+1<argc) cfg.firewall_mark = std::stoi(argv[++i]);
            else if(a=="--dns" && i+1<argc) cfg.dns_servers = argv[++i];
            else if(a=="--pubkey" && i+1<argc) pubkey_b64 = argv[++i];
            else if(a=="--session" && i+1<argc) session_b64 = argv[++i];
            else if(a=="--retries" && i+1<argc) retries = std::max(1, std::stoi(argv[++i]));
            else if(a=="--rest_timeout" && i+1<argc) cfg.rest_timeout_sec = std::max(1, std::stoi(argv[++i]));
            else if(a=="--reconnect_wait" && i+1<argc) cfg.reconnect_wait_sec = std::max(0, std::stoi(argv[++i]));
            else if(a=="--log" && i+1<argc) cfg.log_file = argv[++i];
            else if(a=="--filter-ads" && i+1<argc) cfg.filter.ads = flag(argv[++i]);
            else if(a=="--filter-trackers" && i+1<argc) cfg.filter.trackers = flag(argv[++i]);
            else if(a=="--filter-malware" && i+1<argc) cfg.filter.malware = flag(argv[++i]);
            else if(a=="--filter-malicious" && i+1<argc) cfg.filter.malicious = flag(argv[++i]);
            else if(a=="--filter-pg" && i+1<argc) cfg.filter.pg = std::stoi(argv[++i]);
            else if(a=="--filter-safe-search" && i+1<argc) cfg.filter.safe_search = flag(argv[++i]);
            else if(a=="--filter-risk" && i+1<argc) cfg.filter.risk = vctl::internal::split_trim(argv[++i], ',');
            else if(a=="--filter-illegal" && i+1<argc) cfg.filter.illegal = vctl::internal::split_trim(argv[++i], ',');
            else if(a=="--filter-categories" && i+1<argc) cfg.filter.categories = vctl::internal::split_trim(argv[++i], ',');
            else if(a=="--filter-whitelist" && i+1<argc) cfg.filter.whitelist = vctl::internal::split_trim(argv[++i], ',');
            else if(a=="--filter-blacklist" && i+1<argc) cfg.filter.blacklist = vctl::internal::split_trim(argv[++i], ',');
            else { usage(argv[0]); return 2; }
        }
    } catch (const std::exception& e) {
        std::cerr << "Bad argument: " << e.what() << "\n";
        usage(argv[0]);
        return 2;
    }

    if (cmd != "resolve" && cmd != "token" && cmd != "connect" &&
        cmd != "disconnect" && cmd != "filter") {
        usage(argv[0]);
        return 2;
    }
    if (cfg.host.empty()) {
        // The filter endpoint is fixed; the client still wants a valid host.
        if (cmd != "filter") { usage(argv[0]); return 2; }
        cfg.host = cfg.filter_host;
    }

    vctl::Bytes public_key, session_token;
    if (cmd == "connect" && !pubkey_b64.empty() && !vctl::internal::base64_decode(pubkey_b64, public_key)) {
        std::cerr << "Bad --pubkey: not base64\n";
        return 2;
    }
    if (cmd == "disconnect" && !vctl::internal::base64_decode(session_b64, session_token)) {
        std::cerr << "Bad --session: not base64\n";
        return 2;
    }

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    std::unique_ptr<vctl::Client> cli;
    if (auto ec = vctl::Client::create(cfg, cli)) {
        std::cerr << "client setup failed: " << ec.message() << "\n";
        return 1;
    }
    const int wait = cli->config().reconnect_wait_sec;

    if (cmd == "filter") {
        if (with_retries(retries, wait, "filter", [&]{ return cli->apply_filter(g_ctx); })) return 1;
        std::cout << "filter applied\n";
        return 0;
    }

    if (with_retries(retries, wait, "resolve", [&]{ return cli->resolve(g_ctx); })) return 1;
    std::cout << "remote: " << cli->remote()->to_string() << " (" << cli->server_name() << ")"
              << (cli->stale() ? " [previous lookup]" : "") << "\n";
    if (cmd == "resolve") return 0;

    auto refresh_token = [&]{ return with_retries(retries, wait, "access token",
                                                  [&]{ return cli->get_access_token(g_ctx); }); };

    if (cmd == "token") {
        if (refresh_token()) return 1;
        std::cout << "access token updated\n";
        return 0;
    }

    if (cmd == "disconnect") {
        if (with_retries(retries, wait, "disconnect", [&]{ return cli->disconnect(g_ctx, session_token); })) return 1;
        std::cout << "disconnected\n";
        return 0;
    }

    // connect
    if (!cli->have_access_token() && refresh_token()) return 1;
    if (public_key.empty() && !generate_wireguard_key(public_key)) {
        std::cerr << "key generation failed\n";
        return 1;
    }

    vctl::ConnectResponse resp;
    if (with_retries(retries, wait, "connect", [&]{ return cli->connect(g_ctx, public_key, resp); })) return 1;
    print_connect(resp);

    if (resp.stale_access_token) {
        std::cout << "access token is stale, refreshing in "
                  << cli->config().access_token_update_delay_sec << "s\n";
        if (sleep_cancellable(cli->config().access_token_update_delay_sec)) return 1;
        if (refresh_token()) return 1;
        std::cout << "access token updated\n";
    }
    return 0;
}
