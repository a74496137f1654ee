/* SPDX-License-Identifier: MIT */
/*
 * Tunlink Configuration
 * Tunnel identity, peer list and runtime tuning using datapod types
 */

#pragma once

#include <datapod/datapod.hpp>
#include <tunlink/core/result.hpp>
#include <tunlink/core/types.hpp>

namespace tunlink {

    using namespace dp;

    // =============================================================================
    // Peer Config - One [Peer] section
    // =============================================================================

    struct PeerConfig {
        PublicKey public_key;
        String endpoint;            // "host:port" as written, resolved by the peer directory
        Vector<String> allowed_ips; // CIDR strings, kept in declared order
        u16 persistent_keepalive = 0; // Seconds, 0 disables

        auto members() noexcept { return std::tie(public_key, endpoint, allowed_ips, persistent_keepalive); }
        auto members() const noexcept { return std::tie(public_key, endpoint, allowed_ips, persistent_keepalive); }
    };

    // =============================================================================
    // Tunnel Config - [Interface] plus peers
    // =============================================================================

    struct TunnelConfig {
        PrivateKey private_key;
        String address; // Tunnel address without prefix length
        u16 listen_port = DEFAULT_PORT;
        String dns; // Optional, only meaningful for exported client configs
        Vector<PeerConfig> peers;

        [[nodiscard]] auto find_peer(const PublicKey &key) const -> const PeerConfig * {
            for (const auto &peer : peers) {
                if (peer.public_key == key) {
                    return &peer;
                }
            }
            return nullptr;
        }

        auto members() noexcept { return std::tie(private_key, address, listen_port, dns, peers); }
        auto members() const noexcept { return std::tie(private_key, address, listen_port, dns, peers); }
    };

    // =============================================================================
    // Tunnel Options - Runtime tuning passed at construction
    // =============================================================================

    struct TunnelOptions {
        String bind_host{"0.0.0.0"};

        // Datagram and queue sizing
        usize max_datagram_size = MAX_DATAGRAM_SIZE;
        usize queue_capacity = DEFAULT_QUEUE_CAPACITY;

        // Loop timing
        u64 housekeeping_interval_ms = 1000; // Session tick cadence
        u64 receive_backoff_ms = 100;        // Pause after a socket receive error

        // Session management
        u64 handshake_timeout_ms = 5000;  // Per attempt
        u32 max_handshake_attempts = 3;   // Attempts before the session expires
        u64 session_lifetime_ms = 180000; // Transport keys rejected after this age
        u64 idle_timeout_ms = 180000;     // No authenticated traffic for this long expires the session

        auto members() noexcept {
            return std::tie(bind_host, max_datagram_size, queue_capacity, housekeeping_interval_ms, receive_backoff_ms,
                            handshake_timeout_ms, max_handshake_attempts, session_lifetime_ms, idle_timeout_ms);
        }
        auto members() const noexcept {
            return std::tie(bind_host, max_datagram_size, queue_capacity, housekeeping_interval_ms, receive_backoff_ms,
                            handshake_timeout_ms, max_handshake_attempts, session_lifetime_ms, idle_timeout_ms);
        }
    };

    namespace cfg {

        // Smallest datagram that still carries a handshake initiation
        inline constexpr usize MIN_DATAGRAM_SIZE = 128;

        [[nodiscard]] inline auto validate(const TunnelOptions &options) -> VoidRes {
            if (options.bind_host.empty()) {
                return result::err(err::config("bind_host is required"));
            }
            if (options.max_datagram_size < MIN_DATAGRAM_SIZE) {
                return result::err(err::config("max_datagram_size too small for a handshake"));
            }
            if (options.queue_capacity == 0) {
                return result::err(err::config("queue_capacity must be at least 1"));
            }
            if (options.housekeeping_interval_ms == 0) {
                return result::err(err::config("housekeeping_interval_ms must be positive"));
            }
            if (options.handshake_timeout_ms == 0) {
                return result::err(err::config("handshake_timeout_ms must be positive"));
            }
            if (options.max_handshake_attempts == 0) {
                return result::err(err::config("max_handshake_attempts must be at least 1"));
            }
            if (options.session_lifetime_ms == 0) {
                return result::err(err::config("session_lifetime_ms must be positive"));
            }
            return result::ok();
        }

    } // namespace cfg

} // namespace tunlink
