/* SPDX-License-Identifier: MIT */
/*
 * Tunlink Client Config Generator
 * Creates a client keypair and prints a config pointing at the server's first peer
 *
 * Usage:
 *   ./tunlink_genconf <server-config> <client-address> [dns]
 */

#include <tunlink/tunlink.hpp>
#include <iostream>

using namespace tunlink;
using namespace dp;

void print_usage(const char *prog) {
    std::cout << "Tunlink Client Config Generator\n\n";
    std::cout << "Usage: " << prog << " <server-config> <client-address> [dns]\n\n";
    std::cout << "Example:\n";
    std::cout << "  " << prog << " server.conf 10.0.0.2/32 > client.conf\n";
}

auto main(int argc, char *argv[]) -> int {
    if (argc < 3 || argc > 4) {
        print_usage(argv[0]);
        return 1;
    }

    if (tunlink::init().is_err()) {
        std::cerr << "Failed to initialize libsodium" << std::endl;
        return 1;
    }

    auto config_res = cfg::load_config_file(String(argv[1]));
    if (config_res.is_err()) {
        std::cerr << "Config: " << config_res.error().describe().c_str() << "\n";
        return 1;
    }

    auto [client_priv, client_pub] = crypto::generate_keypair();
    String dns = argc == 4 ? String(argv[3]) : String(DEFAULT_CLIENT_DNS);
    auto text = cfg::generate_client_config(config_res.value(), crypto::encode(client_priv), String(argv[2]), dns);
    client_priv.secure_clear();
    if (text.is_err()) {
        std::cerr << "Generate: " << text.error().describe().c_str() << "\n";
        return 1;
    }

    std::cout << text.value().c_str();
    std::cerr << "# Client public key (add as a [Peer] on the server): " << crypto::encode(client_pub).c_str() << "\n";
    return 0;
}
