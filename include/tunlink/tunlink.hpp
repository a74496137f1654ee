/* SPDX-License-Identifier: MIT */
/*
 * Tunlink - Point-to-point encrypted UDP tunnel engine
 *
 * Main umbrella header - includes all tunlink modules
 *
 * Features:
 * - [Interface]/[Peer] config files and client config generation
 * - X25519 key pairs with base64 text form
 * - Per-peer handshake and session lifetime state machine
 * - Receiver, sender and orchestration tasks joined by bounded queues
 *
 * Dependencies:
 * - datapod: POD-compatible data structures
 * - keylock: Cryptographic primitives (libsodium)
 * - netpipe: UDP datagram sockets
 * - echo: Logging
 */

#pragma once

// Core modules
#include <tunlink/core/metrics.hpp>
#include <tunlink/core/result.hpp>
#include <tunlink/core/time.hpp>
#include <tunlink/core/types.hpp>

// Configuration
#include <tunlink/cfg/config.hpp>
#include <tunlink/cfg/config_file.hpp>

// Cryptography
#include <tunlink/crypto/cipher.hpp>
#include <tunlink/crypto/keys.hpp>

// Networking
#include <tunlink/net/bounded_queue.hpp>
#include <tunlink/net/endpoint.hpp>
#include <tunlink/net/peer_directory.hpp>
#include <tunlink/net/socket.hpp>

// Sessions
#include <tunlink/session/engine.hpp>
#include <tunlink/session/keylock_engine.hpp>
#include <tunlink/session/protocol_session.hpp>

// Downstream consumer
#include <tunlink/netdev/packet_sink.hpp>

// Runtime
#include <tunlink/runtime/orchestrator.hpp>
#include <tunlink/runtime/tunnel.hpp>

#include <sodium.h>

namespace tunlink {

    // Library version
    inline constexpr u32 VERSION_MAJOR = 0;
    inline constexpr u32 VERSION_MINOR = 1;
    inline constexpr u32 VERSION_PATCH = 0;
    inline constexpr const char *VERSION_STRING = "0.1.0";

    // Initialize libsodium (call once at startup)
    inline auto init() -> VoidRes {
        if (sodium_init() < 0) {
            return result::err(err::invalid("Failed to initialize libsodium"));
        }
        return result::ok();
    }

} // namespace tunlink

// =============================================================================
// EXPOSE_ALL - Expose submodule namespaces and core types globally
// =============================================================================

#ifdef TUNLINK_EXPOSE_ALL

namespace tunlink_crypto = tunlink::crypto;
namespace tunlink_net = tunlink::net;
namespace tunlink_cfg = tunlink::cfg;
namespace tunlink_session = tunlink::session;
namespace tunlink_runtime = tunlink::runtime;

// Expose result types
using tunlink::Res;
using tunlink::VoidRes;

// Expose core types
using tunlink::Endpoint;
using tunlink::PrivateKey;
using tunlink::PublicKey;
using tunlink::SessionState;
using tunlink::TunnelConfig;
using tunlink::TunnelOptions;

#endif // TUNLINK_EXPOSE_ALL
