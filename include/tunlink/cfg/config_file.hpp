/* SPDX-License-Identifier: MIT */
/*
 * Tunlink Config File
 * Line-oriented [Interface]/[Peer] parser, loader and generators
 */

#pragma once

#include <datapod/datapod.hpp>
#include <echo/echo.hpp>
#include <tunlink/cfg/config.hpp>
#include <tunlink/core/result.hpp>
#include <tunlink/core/types.hpp>
#include <tunlink/crypto/keys.hpp>

#include <fstream>
#include <sstream>
#include <string>

namespace tunlink {

    using namespace dp;

    namespace cfg {

        namespace detail {

            inline auto trim(const std::string &s) -> std::string {
                auto start = s.find_first_not_of(" \t\r\n");
                if (start == std::string::npos) {
                    return std::string();
                }
                auto end = s.find_last_not_of(" \t\r\n");
                return s.substr(start, end - start + 1);
            }

            inline auto line_label(usize line_num) -> String { return String("line ") + to_str(static_cast<u64>(line_num)); }

            // Comma separated list, entries trimmed, empty entries skipped
            inline auto split_list(const std::string &value) -> Vector<String> {
                Vector<String> out;
                std::string item;
                std::istringstream stream(value);
                while (std::getline(stream, item, ',')) {
                    auto trimmed = trim(item);
                    if (!trimmed.empty()) {
                        out.push_back(String(trimmed.c_str()));
                    }
                }
                return out;
            }

            enum class Section : u8 {
                None = 0,
                Interface = 1,
                Peer = 2,
                Other = 3, // Unrecognised section, keys are skipped
            };

            struct PeerDraft {
                Optional<PublicKey> public_key;
                String endpoint;
                Vector<String> allowed_ips;
                u16 persistent_keepalive = 0;
            };

        } // namespace detail

        // =============================================================================
        // Parser
        // =============================================================================

        class ConfigParser {
          private:
            TunnelConfig config_;
            boolean has_private_key_ = false;
            boolean has_address_ = false;
            detail::Section section_ = detail::Section::None;
            Optional<detail::PeerDraft> draft_;

          public:
            ConfigParser() = default;

            [[nodiscard]] auto parse(const String &content) -> Result<TunnelConfig, ConfigError> {
                std::istringstream stream(std::string(content.c_str()));
                std::string line;
                usize line_num = 0;

                while (std::getline(stream, line)) {
                    ++line_num;
                    auto res = parse_line(detail::trim(line), line_num);
                    if (res.is_err()) {
                        return result::err(res.error());
                    }
                }

                auto commit_res = commit_peer();
                if (commit_res.is_err()) {
                    return result::err(commit_res.error());
                }

                if (!has_private_key_) {
                    return result::err(ConfigError::missing_field("PrivateKey"));
                }
                if (!has_address_) {
                    return result::err(ConfigError::missing_field("Address"));
                }

                return result::ok(std::move(config_));
            }

          private:
            auto parse_line(const std::string &line, usize line_num) -> Result<boolean, ConfigError> {
                if (line.empty()) {
                    // A blank line closes the current peer and falls back to interface scope
                    if (section_ == detail::Section::Peer) {
                        auto res = commit_peer();
                        if (res.is_err()) {
                            return res;
                        }
                        section_ = detail::Section::Interface;
                    }
                    return result::ok(true);
                }

                if (line[0] == '#') {
                    return result::ok(true);
                }

                if (line[0] == '[') {
                    if (line.back() != ']') {
                        return result::err(ConfigError::syntax(detail::line_label(line_num), "unclosed section header"));
                    }
                    return enter_section(detail::trim(line.substr(1, line.size() - 2)));
                }

                auto eq_pos = line.find('=');
                if (eq_pos == std::string::npos) {
                    return result::err(ConfigError::syntax(detail::line_label(line_num), "expected key = value"));
                }

                std::string key = detail::trim(line.substr(0, eq_pos));
                std::string value = line.substr(eq_pos + 1);
                auto hash_pos = value.find('#');
                if (hash_pos != std::string::npos) {
                    value = value.substr(0, hash_pos);
                }
                value = detail::trim(value);

                if (key.empty()) {
                    return result::err(ConfigError::syntax(detail::line_label(line_num), "empty key"));
                }

                switch (section_) {
                case detail::Section::Interface:
                    return set_interface_key(key, value, line_num);
                case detail::Section::Peer:
                    return set_peer_key(key, value, line_num);
                default:
                    return result::ok(false);
                }
            }

            auto enter_section(const std::string &name) -> Result<boolean, ConfigError> {
                if (name == "Peer") {
                    auto res = commit_peer();
                    if (res.is_err()) {
                        return res;
                    }
                    draft_.emplace();
                    section_ = detail::Section::Peer;
                    return result::ok(true);
                }

                auto res = commit_peer();
                if (res.is_err()) {
                    return res;
                }
                section_ = name == "Interface" ? detail::Section::Interface : detail::Section::Other;
                return result::ok(true);
            }

            auto set_interface_key(const std::string &key, const std::string &value, usize line_num)
                -> Result<boolean, ConfigError> {
                if (key == "PrivateKey") {
                    auto key_res = crypto::decode_private_key(String(value.c_str()));
                    if (key_res.is_err()) {
                        return result::err(ConfigError::invalid_key(
                            "PrivateKey", detail::line_label(line_num) + ": " + key_res.error().describe()));
                    }
                    config_.private_key = std::move(key_res.value());
                    has_private_key_ = true;
                } else if (key == "Address") {
                    // Prefix length is not kept
                    auto slash = value.find('/');
                    config_.address = String(detail::trim(value.substr(0, slash)).c_str());
                    has_address_ = true;
                } else if (key == "ListenPort") {
                    auto port = parse_u16(String(value.c_str()));
                    if (port.has_value()) {
                        config_.listen_port = port.value();
                    } else {
                        echo::warn("ConfigParser: ignoring unparsable ListenPort on ", detail::line_label(line_num).c_str());
                    }
                } else if (key == "DNS") {
                    config_.dns = String(value.c_str());
                } else {
                    return result::ok(false);
                }
                return result::ok(true);
            }

            auto set_peer_key(const std::string &key, const std::string &value, usize line_num)
                -> Result<boolean, ConfigError> {
                if (!draft_.has_value()) {
                    draft_.emplace();
                }
                auto &draft = draft_.value();

                if (key == "PublicKey") {
                    auto key_res = crypto::decode_public_key(String(value.c_str()));
                    if (key_res.is_err()) {
                        return result::err(ConfigError::invalid_key(
                            "PublicKey", detail::line_label(line_num) + ": " + key_res.error().describe()));
                    }
                    draft.public_key = key_res.value();
                } else if (key == "Endpoint") {
                    draft.endpoint = String(value.c_str());
                } else if (key == "AllowedIPs") {
                    draft.allowed_ips = detail::split_list(value);
                } else if (key == "PersistentKeepalive") {
                    auto secs = parse_u16(String(value.c_str()));
                    draft.persistent_keepalive = secs.has_value() ? secs.value() : 0;
                } else {
                    return result::ok(false);
                }
                return result::ok(true);
            }

            // Only a peer with both a public key and an endpoint is kept
            auto commit_peer() -> Result<boolean, ConfigError> {
                if (!draft_.has_value()) {
                    return result::ok(false);
                }

                detail::PeerDraft draft = std::move(draft_.value());
                draft_.reset();

                if (!draft.public_key.has_value() || draft.endpoint.empty()) {
                    echo::warn("ConfigParser: dropping [Peer] without both PublicKey and Endpoint");
                    return result::ok(false);
                }

                if (config_.find_peer(draft.public_key.value()) != nullptr) {
                    return result::err(ConfigError::duplicate_peer(crypto::encode(draft.public_key.value())));
                }

                PeerConfig peer;
                peer.public_key = draft.public_key.value();
                peer.endpoint = std::move(draft.endpoint);
                peer.allowed_ips = std::move(draft.allowed_ips);
                peer.persistent_keepalive = draft.persistent_keepalive;
                config_.peers.push_back(std::move(peer));
                return result::ok(true);
            }
        };

        // Parse config text into a TunnelConfig
        [[nodiscard]] inline auto parse(const String &content) -> Result<TunnelConfig, ConfigError> {
            ConfigParser parser;
            return parser.parse(content);
        }

        // =============================================================================
        // Config File Loader
        // =============================================================================

        [[nodiscard]] inline auto load_config_file(const String &path) -> Result<TunnelConfig, ConfigError> {
            std::ifstream file(path.c_str());
            if (!file.is_open()) {
                return result::err(ConfigError::io(path, "failed to open config file"));
            }

            std::stringstream buffer;
            buffer << file.rdbuf();
            if (file.bad()) {
                return result::err(ConfigError::io(path, "failed to read config file"));
            }

            return parse(String(buffer.str().c_str()));
        }

        // =============================================================================
        // Generators
        // =============================================================================

        namespace detail {

            inline auto join_list(const Vector<String> &items) -> std::string {
                std::string out;
                for (usize i = 0; i < items.size(); ++i) {
                    if (i > 0) {
                        out += ", ";
                    }
                    out += items[i].c_str();
                }
                return out;
            }

        } // namespace detail

        // Ready-to-use client config pointing at the first configured peer
        [[nodiscard]] inline auto generate_client_config(const TunnelConfig &config, const String &client_private_key,
                                                         const String &client_address,
                                                         const String &dns = String(DEFAULT_CLIENT_DNS))
            -> Result<String, ConfigError> {
            if (config.peers.empty()) {
                return result::err(ConfigError{ConfigErrorKind::MissingField, String("Peer"),
                                               String("no server peer found")});
            }

            const auto &server = config.peers[0];
            std::ostringstream out;
            out << "[Interface]\n";
            out << "PrivateKey = " << client_private_key.c_str() << "\n";
            out << "Address = " << client_address.c_str() << "\n";
            out << "DNS = " << dns.c_str() << "\n";
            out << "\n";
            out << "[Peer]\n";
            out << "PublicKey = " << crypto::encode(server.public_key).c_str() << "\n";
            out << "AllowedIPs = " << detail::join_list(server.allowed_ips) << "\n";
            out << "Endpoint = " << server.endpoint.c_str() << "\n";
            out << "PersistentKeepalive = " << server.persistent_keepalive << "\n";

            return result::ok(String(out.str().c_str()));
        }

        // Full config in the same textual format, parse(serialize_config(c)) reproduces c
        [[nodiscard]] inline auto serialize_config(const TunnelConfig &config) -> String {
            std::ostringstream out;
            out << "[Interface]\n";
            out << "PrivateKey = " << crypto::encode(config.private_key).c_str() << "\n";
            out << "Address = " << config.address.c_str() << "\n";
            out << "ListenPort = " << config.listen_port << "\n";
            if (!config.dns.empty()) {
                out << "DNS = " << config.dns.c_str() << "\n";
            }

            for (const auto &peer : config.peers) {
                out << "\n[Peer]\n";
                out << "PublicKey = " << crypto::encode(peer.public_key).c_str() << "\n";
                out << "Endpoint = " << peer.endpoint.c_str() << "\n";
                if (!peer.allowed_ips.empty()) {
                    out << "AllowedIPs = " << detail::join_list(peer.allowed_ips) << "\n";
                }
                if (peer.persistent_keepalive > 0) {
                    out << "PersistentKeepalive = " << peer.persistent_keepalive << "\n";
                }
            }

            return String(out.str().c_str());
        }

    } // namespace cfg

} // namespace tunlink
