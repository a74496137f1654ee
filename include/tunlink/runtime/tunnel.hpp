/* SPDX-License-Identifier: MIT */
/*
 * Tunlink Tunnel
 * Receiver, sender and orchestration tasks joined by two bounded queues
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

#include <datapod/datapod.hpp>
#include <echo/echo.hpp>
#include <tunlink/cfg/config.hpp>
#include <tunlink/core/metrics.hpp>
#include <tunlink/core/result.hpp>
#include <tunlink/core/time.hpp>
#include <tunlink/core/types.hpp>
#include <tunlink/crypto/keys.hpp>
#include <tunlink/net/bounded_queue.hpp>
#include <tunlink/net/peer_directory.hpp>
#include <tunlink/net/socket.hpp>
#include <tunlink/netdev/packet_sink.hpp>
#include <tunlink/runtime/orchestrator.hpp>
#include <tunlink/session/keylock_engine.hpp>

namespace tunlink {

    using namespace dp;

    namespace runtime {

        // =============================================================================
        // Tunnel State
        // =============================================================================

        enum class TunnelState : u8 {
            Created = 0,    // Constructed, no config yet
            Configured = 1, // Config validated, peer directory built
            Running = 2,    // Tasks started
            Stopped = 3,    // Shut down, cannot be restarted
        };

        [[nodiscard]] inline auto tunnel_state_to_string(TunnelState state) -> const char * {
            switch (state) {
            case TunnelState::Created:
                return "created";
            case TunnelState::Configured:
                return "configured";
            case TunnelState::Running:
                return "running";
            case TunnelState::Stopped:
                return "stopped";
            default:
                return "unknown";
            }
        }

        // =============================================================================
        // Inbound Work Item
        // =============================================================================

        enum class InboundKind : u8 {
            Network = 0, // Datagram read from the socket
            Local = 1,   // Plaintext to seal for a peer
        };

        struct InboundItem {
            InboundKind kind = InboundKind::Network;
            net::Datagram datagram;
            PublicKey peer; // Local items only
        };

        // =============================================================================
        // Tunnel
        // =============================================================================

        class Tunnel {
          private:
            TunnelOptions options_;
            std::atomic<TunnelState> state_{TunnelState::Created};

            PrivateKey private_key_;
            PublicKey public_key_;
            u16 listen_port_ = DEFAULT_PORT;
            Optional<net::PeerDirectory> directory_;

            EngineFactory factory_;
            boolean custom_factory_ = false;
            netdev::PacketSink *sink_ = nullptr;
            EventHook hook_;

            std::shared_ptr<net::DatagramSocket> socket_;
            net::BoundedQueue<InboundItem> inbound_;
            net::BoundedQueue<net::Datagram> outbound_;
            std::unique_ptr<Orchestrator> orchestrator_;

            std::thread receiver_;
            std::thread sender_;
            std::thread orchestrator_thread_;

            std::atomic<bool> stopping_{false};
            std::mutex stop_mutex_;
            std::condition_variable stop_cv_;
            std::once_flag close_once_;
            std::mutex lifecycle_mutex_;

          public:
            explicit Tunnel(TunnelOptions options = {})
                : options_(std::move(options)), inbound_(options_.queue_capacity), outbound_(options_.queue_capacity) {}

            ~Tunnel() { shutdown(); }

            Tunnel(const Tunnel &) = delete;
            auto operator=(const Tunnel &) -> Tunnel & = delete;

            // =============================================================================
            // Setup (before start)
            // =============================================================================

            // All config, key and endpoint problems surface here, before any task exists
            auto configure(const TunnelConfig &config) -> Result<usize, ConfigError> {
                std::lock_guard<std::mutex> lock(lifecycle_mutex_);
                if (state_.load() != TunnelState::Created && state_.load() != TunnelState::Configured) {
                    return result::err(ConfigError::invalid_state("cannot configure a started tunnel"));
                }

                auto opt_res = cfg::validate(options_);
                if (opt_res.is_err()) {
                    return result::err(
                        ConfigError::invalid_option("TunnelOptions", String(opt_res.error().message.c_str())));
                }

                if (config.private_key.is_zero()) {
                    return result::err(ConfigError::invalid_key("PrivateKey", "all-zero key"));
                }

                auto dir_res = net::PeerDirectory::build(config.peers);
                if (dir_res.is_err()) {
                    return result::err(dir_res.error());
                }

                private_key_ = config.private_key;
                public_key_ = crypto::public_from_private(private_key_);
                listen_port_ = config.listen_port;
                directory_ = std::move(dir_res.value());

                // Rebuilt on every configure so engines always carry the current identity and peers
                if (!custom_factory_) {
                    factory_ = keylock_engine_factory(private_key_, directory_->keys());
                }

                state_.store(TunnelState::Configured);
                echo::info("Tunnel: configured ", crypto::encode(public_key_).c_str(), " with ", directory_->size(),
                           " peer(s)");
                return result::ok(directory_->size());
            }

            auto set_engine_factory(EngineFactory factory) -> void {
                std::lock_guard<std::mutex> lock(lifecycle_mutex_);
                custom_factory_ = static_cast<bool>(factory);
                factory_ = std::move(factory);
            }
            auto set_sink(netdev::PacketSink *sink) -> void { sink_ = sink; }
            auto set_event_hook(EventHook hook) -> void { hook_ = std::move(hook); }

            // =============================================================================
            // Lifecycle
            // =============================================================================

            // Binds the socket and spawns the three tasks; returns the bound port
            auto start(std::shared_ptr<net::DatagramSocket> socket) -> Result<u16, TransportError> {
                std::lock_guard<std::mutex> lock(lifecycle_mutex_);
                if (state_.load() != TunnelState::Configured || !directory_.has_value()) {
                    return result::err(TransportError{TransportErrorKind::BindFailed, String("tunnel not configured")});
                }
                if (!socket) {
                    return result::err(TransportError{TransportErrorKind::BindFailed, String("no socket")});
                }

                if (!factory_) {
                    factory_ = keylock_engine_factory(private_key_, directory_->keys());
                }

                auto bind_res = socket->bind(options_.bind_host, listen_port_);
                if (bind_res.is_err()) {
                    echo::error("Tunnel: ", bind_res.error().describe().c_str());
                    return bind_res;
                }
                socket_ = std::move(socket);

                orchestrator_ = std::make_unique<Orchestrator>(
                    std::move(directory_.value()), options_, factory_,
                    [this](net::Datagram datagram) { return outbound_.push(std::move(datagram)); });
                directory_.reset();
                orchestrator_->set_sink(sink_);
                orchestrator_->set_event_hook(hook_);

                stopping_.store(false);
                state_.store(TunnelState::Running);

                receiver_ = std::thread([this] { receiver_loop(); });
                sender_ = std::thread([this] { sender_loop(); });
                orchestrator_thread_ = std::thread([this] { orchestrator_loop(); });

                echo::info("Tunnel: running on port ", bind_res.value());
                return bind_res;
            }

            // Queue plaintext for a peer; false when the tunnel is not running
            auto send(const PublicKey &peer, Vector<u8> payload) -> boolean {
                if (state_.load() != TunnelState::Running) {
                    return false;
                }
                InboundItem item;
                item.kind = InboundKind::Local;
                item.datagram.data = std::move(payload);
                item.peer = peer;
                return inbound_.push(std::move(item));
            }

            // Broadcast stop, wake every suspended task, close the socket once and join.
            // Idempotent and safe to call from any thread except the tunnel's own tasks.
            auto shutdown() -> void {
                std::lock_guard<std::mutex> lock(lifecycle_mutex_);
                if (state_.load() != TunnelState::Running) {
                    if (state_.load() != TunnelState::Stopped) {
                        state_.store(TunnelState::Stopped);
                    }
                    return;
                }

                echo::info("Tunnel: shutting down");
                {
                    std::lock_guard<std::mutex> stop_lock(stop_mutex_);
                    stopping_.store(true);
                }
                stop_cv_.notify_all();
                inbound_.close();
                outbound_.close();

                if (orchestrator_thread_.joinable()) {
                    orchestrator_thread_.join();
                }
                if (sender_.joinable()) {
                    sender_.join();
                }

                // Closing wakes a receiver suspended inside recv_from
                close_socket();
                if (receiver_.joinable()) {
                    receiver_.join();
                }

                state_.store(TunnelState::Stopped);
                echo::info("Tunnel: stopped");
            }

            // =============================================================================
            // Accessors
            // =============================================================================

            [[nodiscard]] auto state() const -> TunnelState { return state_.load(); }
            [[nodiscard]] auto is_running() const -> boolean { return state_.load() == TunnelState::Running; }
            [[nodiscard]] auto public_key() const -> const PublicKey & { return public_key_; }
            [[nodiscard]] auto listen_port() const -> u16 { return listen_port_; }
            [[nodiscard]] auto options() const -> const TunnelOptions & { return options_; }

          private:
            // Production engines: keylock handshake, responders limited to configured peers
            static auto keylock_engine_factory(const PrivateKey &key, Vector<PublicKey> known) -> EngineFactory {
                auto snapshot = std::make_shared<const Vector<PublicKey>>(std::move(known));
                return [key, snapshot](const Optional<PublicKey> &peer) -> std::unique_ptr<session::SessionEngine> {
                    auto authorize = [snapshot](const PublicKey &candidate) {
                        for (const auto &k : *snapshot) {
                            if (k == candidate) {
                                return true;
                            }
                        }
                        return false;
                    };
                    return std::make_unique<session::KeylockEngine>(key, peer, authorize);
                };
            }

            auto close_socket() -> void {
                std::call_once(close_once_, [this] {
                    if (socket_) {
                        socket_->close();
                        echo::debug("Tunnel: socket closed");
                    }
                });
            }

            // Interruptible pause, returns early on shutdown
            auto pause_ms(u64 ms) -> void {
                std::unique_lock<std::mutex> lock(stop_mutex_);
                stop_cv_.wait_for(lock, std::chrono::milliseconds(ms), [this] { return stopping_.load(); });
            }

            // =============================================================================
            // Tasks
            // =============================================================================

            auto receiver_loop() -> void {
                u64 failures = 0;
                while (!stopping_.load()) {
                    auto res = socket_->recv_from();
                    if (stopping_.load()) {
                        break;
                    }
                    if (res.is_err()) {
                        metrics::inc_receive_errors();
                        if (failures == 0) {
                            echo::warn("Tunnel: receive failed: ", res.error().describe().c_str());
                        } else {
                            echo::debug("Tunnel: receive failed: ", res.error().describe().c_str());
                        }
                        ++failures;
                        pause_ms(options_.receive_backoff_ms);
                        continue;
                    }
                    if (failures > 0) {
                        echo::debug("Tunnel: receive recovered after ", failures, " failure(s)");
                        failures = 0;
                    }

                    auto &maybe = res.value();
                    if (!maybe.has_value()) {
                        continue;
                    }

                    metrics::inc_datagrams_received(maybe->data.size());
                    InboundItem item;
                    item.kind = InboundKind::Network;
                    item.datagram = std::move(maybe.value());
                    if (!inbound_.push(std::move(item))) {
                        break;
                    }
                }
                echo::debug("Tunnel: receiver exited");
            }

            auto sender_loop() -> void {
                while (true) {
                    auto datagram = outbound_.pop();
                    if (!datagram.has_value()) {
                        break;
                    }
                    auto res = socket_->send_to(datagram->data, datagram->endpoint);
                    if (res.is_err()) {
                        metrics::inc_send_errors();
                        echo::warn("Tunnel: send to ", net::format_endpoint(datagram->endpoint).c_str(),
                                   " failed: ", res.error().describe().c_str());
                        continue;
                    }
                    metrics::inc_datagrams_sent(res.value());
                }
                echo::debug("Tunnel: sender exited");
            }

            auto orchestrator_loop() -> void {
                orchestrator_->prepare();
                u64 next_tick = time::now_ms();

                while (!stopping_.load()) {
                    u64 now = time::now_ms();
                    if (now >= next_tick) {
                        orchestrator_->handle_tick(now);
                        next_tick = now + orchestrator_->next_tick_ms(now);
                    }

                    // Wait for whichever comes first: queued work or the next timer
                    u64 wait = next_tick > now ? next_tick - now : 0;
                    auto item = inbound_.pop_for(wait);
                    if (!item.has_value()) {
                        if (inbound_.is_closed()) {
                            break;
                        }
                        continue;
                    }

                    now = time::now_ms();
                    if (item->kind == InboundKind::Network) {
                        orchestrator_->handle_datagram(std::move(item->datagram), now);
                    } else {
                        orchestrator_->handle_payload(item->peer, item->datagram.data, now);
                    }

                    // Handling may have armed a sooner timer
                    u64 soonest = now + orchestrator_->next_tick_ms(now);
                    if (soonest < next_tick) {
                        next_tick = soonest;
                    }
                }
                echo::debug("Tunnel: orchestrator exited");
            }
        };

    } // namespace runtime

} // namespace tunlink
