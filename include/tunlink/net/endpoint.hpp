/* SPDX-License-Identifier: MIT */
/*
 * Tunlink Endpoint
 * Peer endpoint parsing ("a.b.c.d:port", "[v6]:port", "host:port") and formatting
 */

#pragma once

#include <datapod/datapod.hpp>
#include <tunlink/core/result.hpp>
#include <tunlink/core/types.hpp>

#include <arpa/inet.h>
#include <cstring>
#include <netdb.h>
#include <sys/socket.h>
#include <sys/types.h>

namespace tunlink {

    using namespace dp;

    namespace net {

        // =============================================================================
        // Port Validation
        // =============================================================================

        // Returns error on empty string, non-digit characters, overflow or zero port
        [[nodiscard]] inline auto parse_port(const String &port_str) -> Res<u16> {
            auto port = parse_u16(port_str);
            if (!port.has_value()) {
                return result::err(err::invalid("Invalid port number"));
            }
            if (port.value() == 0) {
                return result::err(err::invalid("Port 0 is not allowed"));
            }
            return result::ok(port.value());
        }

        // =============================================================================
        // Address Literals
        // =============================================================================

        [[nodiscard]] inline auto parse_ipv4_addr(const String &str) -> Res<IPv4Addr> {
            in_addr addr{};
            if (inet_pton(AF_INET, str.c_str(), &addr) != 1) {
                return result::err(err::invalid("Invalid IPv4 address"));
            }
            IPv4Addr out;
            std::memcpy(out.octets.data(), &addr.s_addr, 4);
            return result::ok(out);
        }

        [[nodiscard]] inline auto parse_ipv6_addr(const String &str) -> Res<IPv6Addr> {
            in6_addr addr{};
            if (inet_pton(AF_INET6, str.c_str(), &addr) != 1) {
                return result::err(err::invalid("Invalid IPv6 address"));
            }
            IPv6Addr out;
            std::memcpy(out.octets.data(), addr.s6_addr, 16);
            return result::ok(out);
        }

        [[nodiscard]] inline auto format_ipv4_addr(const IPv4Addr &addr) -> String {
            char buf[INET_ADDRSTRLEN];
            snprintf(buf, sizeof(buf), "%u.%u.%u.%u", addr.octets[0], addr.octets[1], addr.octets[2], addr.octets[3]);
            return String(buf);
        }

        [[nodiscard]] inline auto format_ipv6_addr(const IPv6Addr &addr) -> String {
            char buf[INET6_ADDRSTRLEN];
            in6_addr raw{};
            std::memcpy(raw.s6_addr, addr.octets.data(), 16);
            if (inet_ntop(AF_INET6, &raw, buf, sizeof(buf)) == nullptr) {
                return String("::");
            }
            return String(buf);
        }

        // Check if a string is written as an IPv4 literal (digits and dots only)
        [[nodiscard]] inline auto looks_like_ipv4(const String &str) -> boolean {
            if (str.empty()) {
                return false;
            }
            boolean has_dot = false;
            for (usize i = 0; i < str.size(); ++i) {
                char c = str[i];
                if (c == '.') {
                    has_dot = true;
                } else if (c < '0' || c > '9') {
                    return false;
                }
            }
            return has_dot;
        }

        // =============================================================================
        // DNS Resolution
        // =============================================================================

        // Resolve hostname with getaddrinfo, preferring IPv4 to match the common server setup
        [[nodiscard]] inline auto resolve_hostname(const String &hostname, u16 port) -> Res<Endpoint> {
            struct addrinfo hints {};
            hints.ai_family = AF_UNSPEC;
            hints.ai_socktype = SOCK_DGRAM;
            hints.ai_flags = AI_ADDRCONFIG;

            char port_str[16];
            snprintf(port_str, sizeof(port_str), "%u", port);

            struct addrinfo *found = nullptr;
            int ret = getaddrinfo(hostname.c_str(), port_str, &hints, &found);
            if (ret != 0) {
                return result::err(err::network(gai_strerror(ret)));
            }
            if (found == nullptr) {
                return result::err(err::network("DNS resolution returned no results"));
            }

            Optional<Endpoint> v4;
            Optional<Endpoint> v6;
            for (struct addrinfo *ai = found; ai != nullptr; ai = ai->ai_next) {
                if (ai->ai_family == AF_INET && !v4.has_value()) {
                    auto *sin = reinterpret_cast<struct sockaddr_in *>(ai->ai_addr);
                    IPv4Addr addr;
                    std::memcpy(addr.octets.data(), &sin->sin_addr.s_addr, 4);
                    v4 = Endpoint(addr, port);
                } else if (ai->ai_family == AF_INET6 && !v6.has_value()) {
                    auto *sin6 = reinterpret_cast<struct sockaddr_in6 *>(ai->ai_addr);
                    IPv6Addr addr;
                    std::memcpy(addr.octets.data(), sin6->sin6_addr.s6_addr, 16);
                    v6 = Endpoint(addr, port);
                }
            }
            freeaddrinfo(found);

            if (v4.has_value()) {
                return result::ok(v4.value());
            }
            if (v6.has_value()) {
                return result::ok(v6.value());
            }
            return result::err(err::network("DNS resolution returned unsupported address family"));
        }

        // =============================================================================
        // Endpoint Parsing
        // =============================================================================

        // Parse "192.168.1.1:51820", "[2001:db8::1]:51820" or "vpn.example.com:51820"
        [[nodiscard]] inline auto parse_endpoint(const String &str) -> Res<Endpoint> {
            if (str.empty()) {
                return result::err(err::invalid("Empty endpoint"));
            }

            if (str[0] == '[') {
                usize bracket_end = str.find(']');
                if (bracket_end == String::npos) {
                    return result::err(err::invalid("Invalid IPv6 endpoint: missing ]"));
                }
                if (bracket_end + 1 >= str.size() || str[bracket_end + 1] != ':') {
                    return result::err(err::invalid("Invalid IPv6 endpoint: missing port"));
                }

                auto port_res = parse_port(str.substr(bracket_end + 2));
                if (port_res.is_err()) {
                    return result::err(port_res.error());
                }
                auto addr_res = parse_ipv6_addr(str.substr(1, bracket_end - 1));
                if (addr_res.is_err()) {
                    return result::err(addr_res.error());
                }
                return result::ok(Endpoint(addr_res.value(), port_res.value()));
            }

            usize port_sep = str.rfind(':');
            if (port_sep == String::npos || port_sep == 0) {
                return result::err(err::invalid("Invalid endpoint format (missing host or port)"));
            }

            String host = str.substr(0, port_sep);
            if (host.find(':') != String::npos) {
                return result::err(err::invalid("IPv6 endpoints must be bracketed"));
            }

            auto port_res = parse_port(str.substr(port_sep + 1));
            if (port_res.is_err()) {
                return result::err(port_res.error());
            }

            if (looks_like_ipv4(host)) {
                auto addr_res = parse_ipv4_addr(host);
                if (addr_res.is_err()) {
                    return result::err(addr_res.error());
                }
                return result::ok(Endpoint(addr_res.value(), port_res.value()));
            }

            return resolve_hostname(host, port_res.value());
        }

        // =============================================================================
        // Formatting
        // =============================================================================

        // Host part only, without brackets
        [[nodiscard]] inline auto format_host(const Endpoint &ep) -> String {
            if (ep.is_ipv4()) {
                return format_ipv4_addr(ep.ipv4);
            }
            if (ep.is_ipv6()) {
                return format_ipv6_addr(ep.ipv6);
            }
            return String("<none>");
        }

        // "a.b.c.d:port" or "[v6]:port"
        [[nodiscard]] inline auto format_endpoint(const Endpoint &ep) -> String {
            String out;
            if (ep.is_ipv6()) {
                out += "[";
                out += format_host(ep);
                out += "]";
            } else {
                out += format_host(ep);
            }
            out += ":";
            out += to_str(ep.port);
            return out;
        }

    } // namespace net

} // namespace tunlink
