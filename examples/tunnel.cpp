/* SPDX-License-Identifier: MIT */
/*
 * Tunlink Tunnel Runner
 * Loads a config file and runs the tunnel over UDP until interrupted
 *
 * Usage:
 *   ./tunlink_up <config-file>
 */

#include <tunlink/tunlink.hpp>
#include <atomic>
#include <csignal>
#include <cstring>
#include <iostream>

using namespace tunlink;
using namespace dp;

namespace {
    std::atomic<bool> g_running{true};

    void signal_handler(int) { g_running.store(false); }
} // namespace

void print_usage(const char *prog) {
    std::cout << "Tunlink Tunnel Runner\n\n";
    std::cout << "Usage: " << prog << " <config-file>\n\n";
    std::cout << "Decrypted packets are logged instead of written to an interface.\n";
}

auto main(int argc, char *argv[]) -> int {
    if (argc != 2 || strcmp(argv[1], "--help") == 0 || strcmp(argv[1], "-h") == 0) {
        print_usage(argv[0]);
        return argc == 2 ? 0 : 1;
    }

    if (tunlink::init().is_err()) {
        std::cerr << "Failed to initialize libsodium" << std::endl;
        return 1;
    }

    echo::info("=== Tunlink ", VERSION_STRING, " ===").cyan();

    auto config_res = cfg::load_config_file(String(argv[1]));
    if (config_res.is_err()) {
        echo::error("Config: ", config_res.error().describe().c_str());
        return 1;
    }
    const auto &config = config_res.value();

    runtime::Tunnel tunnel;
    auto configure_res = tunnel.configure(config);
    if (configure_res.is_err()) {
        echo::error("Config: ", configure_res.error().describe().c_str());
        return 1;
    }

    netdev::CallbackSink sink([](netdev::IpPacket packet) {
        echo::info("rx ", packet.is_ipv4() ? "ipv4 " : "ipv6 ", packet.size(), " bytes from ",
                   net::format_endpoint(packet.source).c_str());
    });
    tunnel.set_sink(&sink);
    tunnel.set_event_hook([](const runtime::TunnelEvent &event) {
        if (event.kind == runtime::EventKind::HandshakeComplete) {
            echo::info("Handshake complete with ", net::format_endpoint(event.endpoint).c_str()).green();
        }
    });

    auto start_res = tunnel.start(std::make_shared<net::NetpipeSocket>());
    if (start_res.is_err()) {
        echo::error("Start: ", start_res.error().describe().c_str());
        return 1;
    }

    echo::info("Public key: ", crypto::encode(tunnel.public_key()).c_str());
    echo::info("Address:    ", config.address.c_str());
    echo::info("Listening:  ", start_res.value());
    echo::info("Peers:      ", configure_res.value());

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    while (g_running.load()) {
        time::sleep_ms(200);
    }

    tunnel.shutdown();

    auto &m = metrics::global();
    echo::info("Datagrams sent/received: ", m.datagrams_sent.load(), "/", m.datagrams_received.load());
    echo::info("Handshakes completed:    ", m.handshakes_completed.load());
    echo::info("Packets delivered:       ", m.packets_delivered.load());
    return 0;
}
