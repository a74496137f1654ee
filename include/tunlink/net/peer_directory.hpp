/* SPDX-License-Identifier: MIT */
/*
 * Tunlink Peer Directory
 * Public key to endpoint and policy lookup, built once from the config
 */

#pragma once

#include <datapod/datapod.hpp>
#include <echo/echo.hpp>
#include <tunlink/cfg/config.hpp>
#include <tunlink/core/result.hpp>
#include <tunlink/core/types.hpp>
#include <tunlink/crypto/keys.hpp>
#include <tunlink/net/endpoint.hpp>

namespace tunlink {

    using namespace dp;

    namespace net {

        // =============================================================================
        // Peer Policy
        // =============================================================================

        struct PeerPolicy {
            PublicKey public_key;
            Endpoint endpoint;
            Vector<String> allowed_ips;
            u16 keepalive_secs = 0;

            [[nodiscard]] auto keepalive_ms() const -> u64 { return static_cast<u64>(keepalive_secs) * 1000; }

            auto members() noexcept { return std::tie(public_key, endpoint, allowed_ips, keepalive_secs); }
            auto members() const noexcept { return std::tie(public_key, endpoint, allowed_ips, keepalive_secs); }
        };

        // =============================================================================
        // Peer Directory
        // =============================================================================

        // Owned by the orchestration loop; other tasks only see snapshots of keys()
        class PeerDirectory {
          private:
            Map<PublicKey, PeerPolicy> peers_;
            Vector<PublicKey> order_; // Declaration order from the config

          public:
            PeerDirectory() = default;

            // Resolves every endpoint up front; any failure rejects the whole directory
            [[nodiscard]] static auto build(const Vector<PeerConfig> &peers) -> Result<PeerDirectory, ConfigError> {
                PeerDirectory dir;
                for (const auto &peer : peers) {
                    String label = crypto::encode(peer.public_key);
                    if (dir.contains(peer.public_key)) {
                        return result::err(ConfigError::duplicate_peer(label));
                    }

                    auto ep_res = parse_endpoint(peer.endpoint);
                    if (ep_res.is_err()) {
                        return result::err(ConfigError::invalid_endpoint(
                            label, peer.endpoint + ": " + String(ep_res.error().message.c_str())));
                    }

                    PeerPolicy policy;
                    policy.public_key = peer.public_key;
                    policy.endpoint = ep_res.value();
                    policy.allowed_ips = peer.allowed_ips;
                    policy.keepalive_secs = peer.persistent_keepalive;

                    echo::debug("PeerDirectory: ", label.c_str(), " -> ", format_endpoint(policy.endpoint).c_str());
                    dir.peers_[peer.public_key] = std::move(policy);
                    dir.order_.push_back(peer.public_key);
                }
                return result::ok(std::move(dir));
            }

            [[nodiscard]] auto resolve(const PublicKey &key) const -> Optional<PeerPolicy> {
                auto it = peers_.find(key);
                if (it == peers_.end()) {
                    return dp::nullopt;
                }
                return it->second;
            }

            [[nodiscard]] auto find_by_endpoint(const Endpoint &ep) const -> Optional<PublicKey> {
                for (const auto &key : order_) {
                    auto it = peers_.find(key);
                    if (it != peers_.end() && it->second.endpoint == ep) {
                        return key;
                    }
                }
                return dp::nullopt;
            }

            [[nodiscard]] auto contains(const PublicKey &key) const -> boolean { return peers_.find(key) != peers_.end(); }

            // Roaming: called by the orchestration loop after an authenticated handshake
            auto update_endpoint(const PublicKey &key, const Endpoint &ep) -> boolean {
                auto it = peers_.find(key);
                if (it == peers_.end() || it->second.endpoint == ep) {
                    return false;
                }
                echo::info("PeerDirectory: peer ", crypto::encode(key).c_str(), " roamed to ",
                           format_endpoint(ep).c_str());
                it->second.endpoint = ep;
                return true;
            }

            [[nodiscard]] auto keys() const -> Vector<PublicKey> { return order_; }

            [[nodiscard]] auto size() const -> usize { return order_.size(); }
            [[nodiscard]] auto empty() const -> boolean { return order_.empty(); }
        };

    } // namespace net

} // namespace tunlink
