/* SPDX-License-Identifier: MIT */
/*
 * Tunlink Core Types
 * POD-compatible types using datapod primitives
 */

#pragma once

#include <datapod/datapod.hpp>

#include <cstdio>

namespace tunlink {

    using namespace dp;

    // =============================================================================
    // Number to String Helpers (avoid std::to_string)
    // =============================================================================

    namespace detail {
        template <typename T> inline auto num_to_string(T value) -> String {
            if (value == 0) {
                return String("0");
            }

            char buf[32];
            usize idx = 31;
            buf[idx] = '\0';

            while (value > 0 && idx > 0) {
                --idx;
                buf[idx] = '0' + static_cast<char>(value % 10);
                value /= 10;
            }

            return String(&buf[idx]);
        }
    } // namespace detail

    inline auto to_str(u8 v) -> String { return detail::num_to_string(v); }
    inline auto to_str(u16 v) -> String { return detail::num_to_string(v); }
    inline auto to_str(u32 v) -> String { return detail::num_to_string(v); }
    inline auto to_str(u64 v) -> String { return detail::num_to_string(v); }

    // Strict decimal parse: digits only, no sign, must fit in u16
    [[nodiscard]] inline auto parse_u16(const String &s) -> Optional<u16> {
        if (s.empty() || s.size() > 5) {
            return dp::nullopt;
        }
        u32 result = 0;
        for (usize i = 0; i < s.size(); ++i) {
            char c = s[i];
            if (c < '0' || c > '9') {
                return dp::nullopt;
            }
            result = result * 10 + static_cast<u32>(c - '0');
        }
        if (result > 65535) {
            return dp::nullopt;
        }
        return static_cast<u16>(result);
    }

    // =============================================================================
    // Constants
    // =============================================================================

    inline constexpr usize KEY_SIZE = 32;
    inline constexpr u16 DEFAULT_PORT = 51820;
    inline constexpr usize MAX_DATAGRAM_SIZE = 1500;
    inline constexpr usize DEFAULT_QUEUE_CAPACITY = 1000;
    inline constexpr const char *DEFAULT_CLIENT_DNS = "1.1.1.1";

    // =============================================================================
    // Session State
    // =============================================================================

    enum class SessionState : u8 {
        Idle = 0,               // No handshake attempted
        HandshakeInitiated = 1, // Handshake message sent or answered, not yet confirmed
        Established = 2,        // Transport keys agreed, data may flow
        Expired = 3,            // Lifetime exceeded or handshake failed, must be reset
    };

    [[nodiscard]] inline auto session_state_to_string(SessionState state) -> const char * {
        switch (state) {
        case SessionState::Idle:
            return "idle";
        case SessionState::HandshakeInitiated:
            return "handshake_initiated";
        case SessionState::Established:
            return "established";
        case SessionState::Expired:
            return "expired";
        default:
            return "unknown";
        }
    }

    // =============================================================================
    // PublicKey - X25519 public key
    // =============================================================================

    struct PublicKey {
        Array<u8, KEY_SIZE> data{};

        PublicKey() = default;

        explicit PublicKey(const u8 *src) {
            if (src) {
                for (usize i = 0; i < KEY_SIZE; ++i) {
                    data[i] = src[i];
                }
            }
        }

        [[nodiscard]] auto is_zero() const -> boolean {
            for (usize i = 0; i < KEY_SIZE; ++i) {
                if (data[i] != 0)
                    return false;
            }
            return true;
        }

        [[nodiscard]] auto operator==(const PublicKey &other) const -> boolean {
            for (usize i = 0; i < KEY_SIZE; ++i) {
                if (data[i] != other.data[i])
                    return false;
            }
            return true;
        }

        [[nodiscard]] auto operator!=(const PublicKey &other) const -> boolean { return !(*this == other); }

        [[nodiscard]] auto raw() -> u8 * { return data.data(); }
        [[nodiscard]] auto raw() const -> const u8 * { return data.data(); }

        auto members() noexcept { return std::tie(data); }
        auto members() const noexcept { return std::tie(data); }
    };

    // =============================================================================
    // PrivateKey - X25519 private scalar, wiped on move and destruction
    // =============================================================================

    struct PrivateKey {
        Array<u8, KEY_SIZE> data{};

        PrivateKey() = default;

        explicit PrivateKey(const u8 *src) {
            if (src) {
                for (usize i = 0; i < KEY_SIZE; ++i) {
                    data[i] = src[i];
                }
            }
        }

        PrivateKey(const PrivateKey &other) {
            for (usize i = 0; i < KEY_SIZE; ++i) {
                data[i] = other.data[i];
            }
        }

        auto operator=(const PrivateKey &other) -> PrivateKey & {
            if (this != &other) {
                for (usize i = 0; i < KEY_SIZE; ++i) {
                    data[i] = other.data[i];
                }
            }
            return *this;
        }

        PrivateKey(PrivateKey &&other) noexcept {
            for (usize i = 0; i < KEY_SIZE; ++i) {
                data[i] = other.data[i];
            }
            other.secure_clear();
        }

        auto operator=(PrivateKey &&other) noexcept -> PrivateKey & {
            if (this != &other) {
                secure_clear();
                for (usize i = 0; i < KEY_SIZE; ++i) {
                    data[i] = other.data[i];
                }
                other.secure_clear();
            }
            return *this;
        }

        ~PrivateKey() { secure_clear(); }

        // volatile writes so the wipe is not optimized away
        auto secure_clear() -> void {
            volatile u8 *p = data.data();
            for (usize i = 0; i < KEY_SIZE; ++i) {
                p[i] = 0;
            }
        }

        [[nodiscard]] auto is_zero() const -> boolean {
            for (usize i = 0; i < KEY_SIZE; ++i) {
                if (data[i] != 0)
                    return false;
            }
            return true;
        }

        [[nodiscard]] auto operator==(const PrivateKey &other) const -> boolean { return data == other.data; }

        [[nodiscard]] auto raw() -> u8 * { return data.data(); }
        [[nodiscard]] auto raw() const -> const u8 * { return data.data(); }

        auto members() noexcept { return std::tie(data); }
        auto members() const noexcept { return std::tie(data); }
    };

    // =============================================================================
    // Endpoint - Network endpoint (IP + port)
    // =============================================================================

    enum class AddrFamily : u8 {
        None = 0,
        IPv4 = 2,  // AF_INET
        IPv6 = 10, // AF_INET6
    };

    struct IPv4Addr {
        Array<u8, 4> octets{};

        IPv4Addr() = default;

        IPv4Addr(u8 a, u8 b, u8 c, u8 d) : octets{a, b, c, d} {}

        [[nodiscard]] auto operator==(const IPv4Addr &other) const -> boolean { return octets == other.octets; }

        auto members() noexcept { return std::tie(octets); }
        auto members() const noexcept { return std::tie(octets); }
    };

    struct IPv6Addr {
        Array<u8, 16> octets{};

        IPv6Addr() = default;

        [[nodiscard]] auto operator==(const IPv6Addr &other) const -> boolean { return octets == other.octets; }

        auto members() noexcept { return std::tie(octets); }
        auto members() const noexcept { return std::tie(octets); }
    };

    struct Endpoint {
        AddrFamily family = AddrFamily::None;
        IPv4Addr ipv4{};
        IPv6Addr ipv6{};
        u16 port = 0;

        Endpoint() = default;

        Endpoint(IPv4Addr addr, u16 p) : family(AddrFamily::IPv4), ipv4(addr), port(p) {}

        Endpoint(IPv6Addr addr, u16 p) : family(AddrFamily::IPv6), ipv6(addr), port(p) {}

        [[nodiscard]] auto is_ipv4() const -> boolean { return family == AddrFamily::IPv4; }
        [[nodiscard]] auto is_ipv6() const -> boolean { return family == AddrFamily::IPv6; }
        [[nodiscard]] auto is_valid() const -> boolean { return family != AddrFamily::None && port > 0; }

        [[nodiscard]] auto operator==(const Endpoint &other) const -> boolean {
            if (family != other.family || port != other.port)
                return false;
            if (family == AddrFamily::IPv4)
                return ipv4 == other.ipv4;
            if (family == AddrFamily::IPv6)
                return ipv6 == other.ipv6;
            return true;
        }

        [[nodiscard]] auto operator!=(const Endpoint &other) const -> boolean { return !(*this == other); }

        auto members() noexcept { return std::tie(family, ipv4, ipv6, port); }
        auto members() const noexcept { return std::tie(family, ipv4, ipv6, port); }
    };

} // namespace tunlink

// =============================================================================
// Hash Specializations (needed for dp::Map keyed by peer key or endpoint)
// =============================================================================

namespace datapod {

    template <> struct Hasher<tunlink::PublicKey> {
        auto operator()(const tunlink::PublicKey &key) const -> hash_t {
            // FNV-1a over the 32 key bytes
            hash_t hash = 14695981039346656037ULL;
            for (usize i = 0; i < tunlink::KEY_SIZE; ++i) {
                hash ^= static_cast<hash_t>(key.data[i]);
                hash *= 1099511628211ULL;
            }
            return hash;
        }
    };

    template <> struct Hasher<tunlink::Endpoint> {
        auto operator()(const tunlink::Endpoint &ep) const -> hash_t {
            hash_t hash = 14695981039346656037ULL;
            auto mix = [&hash](u8 byte) {
                hash ^= static_cast<hash_t>(byte);
                hash *= 1099511628211ULL;
            };
            mix(static_cast<u8>(ep.family));
            if (ep.is_ipv4()) {
                for (usize i = 0; i < 4; ++i) {
                    mix(ep.ipv4.octets[i]);
                }
            } else if (ep.is_ipv6()) {
                for (usize i = 0; i < 16; ++i) {
                    mix(ep.ipv6.octets[i]);
                }
            }
            mix(static_cast<u8>(ep.port & 0xFF));
            mix(static_cast<u8>((ep.port >> 8) & 0xFF));
            return hash;
        }
    };

} // namespace datapod
