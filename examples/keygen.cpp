/* SPDX-License-Identifier: MIT */
/*
 * Tunlink Key Generation Tool
 * Generates X25519 keypairs in the base64 form used by tunnel config files
 *
 * Usage:
 *   ./tunlink_keygen                  # New private key and its public key
 *   ./tunlink_keygen --pub <private>  # Public key for an existing private key
 *   ./tunlink_keygen --config         # Output as an [Interface] snippet
 */

#include <tunlink/tunlink.hpp>
#include <cstring>
#include <iostream>

using namespace tunlink;
using namespace dp;

void print_usage(const char *prog) {
    std::cout << "Tunlink Key Generation Tool\n\n";
    std::cout << "Usage: " << prog << " [OPTIONS]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --help, -h        Show this help message\n";
    std::cout << "  --pub <private>   Derive the public key of a base64 private key\n";
    std::cout << "  --config          Output as a config file snippet\n";
    std::cout << "\nExamples:\n";
    std::cout << "  " << prog << "                      # Generate a keypair\n";
    std::cout << "  " << prog << " --config >> wg0.conf   # Append to a config\n";
}

auto main(int argc, char *argv[]) -> int {
    boolean config_output = false;
    const char *derive_from = nullptr;

    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "--help") == 0 || strcmp(argv[i], "-h") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (strcmp(argv[i], "--config") == 0) {
            config_output = true;
        } else if (strcmp(argv[i], "--pub") == 0) {
            if (i + 1 >= argc) {
                std::cerr << "--pub needs a private key\n";
                return 1;
            }
            derive_from = argv[++i];
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    auto init_result = tunlink::init();
    if (init_result.is_err()) {
        std::cerr << "Failed to initialize: " << init_result.error().message.c_str() << "\n";
        return 1;
    }

    if (derive_from != nullptr) {
        auto key_res = crypto::decode_private_key(String(derive_from));
        if (key_res.is_err()) {
            std::cerr << "Bad private key: " << key_res.error().describe().c_str() << "\n";
            return 1;
        }
        std::cout << crypto::encode(crypto::public_from_private(key_res.value())).c_str() << "\n";
        return 0;
    }

    auto [priv, pub] = crypto::generate_keypair();
    if (config_output) {
        std::cout << "[Interface]\n";
        std::cout << "PrivateKey = " << crypto::encode(priv).c_str() << "\n";
        std::cout << "# PublicKey = " << crypto::encode(pub).c_str() << "\n";
    } else {
        std::cout << "private: " << crypto::encode(priv).c_str() << "\n";
        std::cout << "public:  " << crypto::encode(pub).c_str() << "\n";
    }
    priv.secure_clear();
    return 0;
}
