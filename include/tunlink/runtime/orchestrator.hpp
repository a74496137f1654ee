/* SPDX-License-Identifier: MIT */
/*
 * Tunlink Orchestrator
 * Owns the peer directory and the session set, routes datagrams and payloads
 */

#pragma once

#include <functional>
#include <memory>

#include <datapod/datapod.hpp>
#include <echo/echo.hpp>
#include <tunlink/cfg/config.hpp>
#include <tunlink/core/metrics.hpp>
#include <tunlink/core/result.hpp>
#include <tunlink/core/types.hpp>
#include <tunlink/crypto/keys.hpp>
#include <tunlink/net/endpoint.hpp>
#include <tunlink/net/peer_directory.hpp>
#include <tunlink/net/socket.hpp>
#include <tunlink/netdev/packet_sink.hpp>
#include <tunlink/session/engine.hpp>
#include <tunlink/session/protocol_session.hpp>

namespace tunlink {

    using namespace dp;

    namespace runtime {

        // =============================================================================
        // Tunnel Events
        // =============================================================================

        enum class EventKind : u8 {
            SessionCreated = 0,
            StateChanged = 1,
            HandshakeComplete = 2,
            PlaintextDelivered = 3,
            SessionRemoved = 4,
            Dropped = 5, // Inbound datagram or outbound payload discarded
        };

        [[nodiscard]] inline auto event_kind_to_string(EventKind kind) -> const char * {
            switch (kind) {
            case EventKind::SessionCreated:
                return "session_created";
            case EventKind::StateChanged:
                return "state_changed";
            case EventKind::HandshakeComplete:
                return "handshake_complete";
            case EventKind::PlaintextDelivered:
                return "plaintext_delivered";
            case EventKind::SessionRemoved:
                return "session_removed";
            case EventKind::Dropped:
                return "dropped";
            default:
                return "unknown";
            }
        }

        struct TunnelEvent {
            EventKind kind = EventKind::SessionCreated;
            Endpoint endpoint;
            SessionState from = SessionState::Idle;
            SessionState to = SessionState::Idle;
            usize bytes = 0;
        };

        using EventHook = std::function<void(const TunnelEvent &)>;

        // Builds the engine for a new session; `peer` is set when the endpoint belongs to a configured peer
        using EngineFactory = std::function<std::unique_ptr<session::SessionEngine>(const Optional<PublicKey> &peer)>;

        // Hands a datagram to the outbound queue, false once the queue is closed
        using DatagramSender = std::function<boolean(net::Datagram)>;

        // =============================================================================
        // Orchestrator
        // =============================================================================

        // Single-threaded: only the orchestration task calls into it.
        class Orchestrator {
          private:
            using SessionPtr = std::unique_ptr<session::ProtocolSession>;

            net::PeerDirectory directory_;
            TunnelOptions options_;
            EngineFactory factory_;
            DatagramSender send_;
            netdev::PacketSink *sink_ = nullptr;
            EventHook hook_;
            Map<Endpoint, SessionPtr> sessions_;

          public:
            Orchestrator(net::PeerDirectory directory, const TunnelOptions &options, EngineFactory factory,
                         DatagramSender send)
                : directory_(std::move(directory)), options_(options), factory_(std::move(factory)),
                  send_(std::move(send)) {}

            auto set_sink(netdev::PacketSink *sink) -> void { sink_ = sink; }
            auto set_event_hook(EventHook hook) -> void { hook_ = std::move(hook); }

            // Peers with a persistent keepalive get a session up front and handshake on the first tick
            auto prepare() -> usize {
                usize count = 0;
                for (const auto &key : directory_.keys()) {
                    auto policy = directory_.resolve(key);
                    if (!policy.has_value() || policy->keepalive_secs == 0) {
                        continue;
                    }
                    auto &session = ensure_session(policy->endpoint, key, policy->keepalive_ms());
                    session.request_handshake();
                    ++count;
                }
                return count;
            }

            // =============================================================================
            // Inbound datagram from the network
            // =============================================================================

            auto handle_datagram(net::Datagram datagram, u64 now) -> void {
                auto it = sessions_.find(datagram.endpoint);
                session::ProtocolSession *session = nullptr;
                if (it != sessions_.end()) {
                    session = it->second.get();
                } else {
                    auto peer = directory_.find_by_endpoint(datagram.endpoint);
                    u64 keepalive_ms = 0;
                    if (peer.has_value()) {
                        keepalive_ms = directory_.resolve(peer.value())->keepalive_ms();
                    }
                    session = &ensure_session(datagram.endpoint, peer, keepalive_ms);
                }

                if (session->state() == SessionState::Expired) {
                    reset_session(*session);
                }

                SessionState before = session->state();
                auto out = session->decapsulate(datagram.data, now);
                note_transition(*session, before);

                switch (out.kind) {
                case session::OutputKind::SendToNetwork:
                    emit_datagram(session->endpoint(), std::move(out.data));
                    break;

                case session::OutputKind::HandshakeComplete:
                    on_handshake_complete(*session, now);
                    break;

                case session::OutputKind::DeliverPlaintextV4:
                    deliver(*session, std::move(out.data), netdev::IpVersion::V4);
                    break;

                case session::OutputKind::DeliverPlaintextV6:
                    deliver(*session, std::move(out.data), netdev::IpVersion::V6);
                    break;

                case session::OutputKind::NoAction:
                default:
                    break;
                }

                // Datagrams that never led anywhere do not keep a session alive
                if (session->state() == SessionState::Idle && !session->peer_key().has_value()) {
                    emit(TunnelEvent{EventKind::Dropped, datagram.endpoint, before, before, datagram.data.size()});
                    remove_session(datagram.endpoint);
                }
            }

            // =============================================================================
            // Outbound plaintext from the local side
            // =============================================================================

            auto handle_payload(const PublicKey &peer, const Vector<u8> &payload, u64 now) -> boolean {
                auto policy = directory_.resolve(peer);
                if (!policy.has_value()) {
                    metrics::inc_payloads_dropped_no_session();
                    echo::warn("Orchestrator: dropping payload for unknown peer ", crypto::encode(peer).c_str());
                    emit(TunnelEvent{EventKind::Dropped, Endpoint{}, SessionState::Idle, SessionState::Idle,
                                     payload.size()});
                    return false;
                }

                auto it = sessions_.find(policy->endpoint);
                session::ProtocolSession &session = it != sessions_.end()
                                                        ? *it->second
                                                        : ensure_session(policy->endpoint, peer, policy->keepalive_ms());

                if (session.state() == SessionState::Expired) {
                    reset_session(session);
                }

                SessionState before = session.state();
                auto res = session.encapsulate(payload, now);
                note_transition(session, before);

                if (res.is_err()) {
                    metrics::inc_payloads_dropped_no_session();
                    echo::debug("Orchestrator: payload dropped: ", res.error().describe().c_str());
                    emit(TunnelEvent{EventKind::Dropped, session.endpoint(), before, session.state(), payload.size()});
                    if (session.state() == SessionState::Expired) {
                        reset_session(session);
                    }
                    session.request_handshake();
                    run_tick(session, now);
                    return false;
                }

                emit_datagram(session.endpoint(), std::move(res.value()));
                return true;
            }

            // =============================================================================
            // Periodic housekeeping
            // =============================================================================

            auto handle_tick(u64 now) -> usize {
                usize emitted = 0;
                Vector<Endpoint> stale;

                for (auto &[ep, session] : sessions_) {
                    if (session->state() == SessionState::Expired) {
                        reset_session(*session);
                        if (!session->wants_handshake()) {
                            stale.push_back(ep);
                            continue;
                        }
                    }
                    if (run_tick(*session, now)) {
                        ++emitted;
                    }
                }

                for (const auto &ep : stale) {
                    remove_session(ep);
                }
                return emitted;
            }

            // Milliseconds until the earliest session timer, capped at the housekeeping interval
            [[nodiscard]] auto next_tick_ms(u64 now) const -> u64 {
                u64 wait = options_.housekeeping_interval_ms;
                for (const auto &[ep, session] : sessions_) {
                    u64 t = session->next_timer_ms(now);
                    if (t < wait) {
                        wait = t;
                    }
                }
                return wait;
            }

            // =============================================================================
            // Introspection
            // =============================================================================

            [[nodiscard]] auto session_state(const Endpoint &ep) const -> Optional<SessionState> {
                auto it = sessions_.find(ep);
                if (it == sessions_.end()) {
                    return dp::nullopt;
                }
                return it->second->state();
            }

            [[nodiscard]] auto session_count() const -> usize { return sessions_.size(); }
            [[nodiscard]] auto directory() const -> const net::PeerDirectory & { return directory_; }

          private:
            auto ensure_session(const Endpoint &ep, const Optional<PublicKey> &peer, u64 keepalive_ms)
                -> session::ProtocolSession & {
                auto it = sessions_.find(ep);
                if (it != sessions_.end()) {
                    return *it->second;
                }

                auto session = std::make_unique<session::ProtocolSession>(
                    factory_(peer), ep, session::SessionTimers::from_options(options_, keepalive_ms));
                auto [new_it, inserted] = sessions_.emplace(ep, std::move(session));
                metrics::inc_sessions_created();
                echo::debug("Orchestrator: new session for ", net::format_endpoint(ep).c_str());
                emit(TunnelEvent{EventKind::SessionCreated, ep, SessionState::Idle, SessionState::Idle, 0});
                return *new_it->second;
            }

            auto remove_session(const Endpoint &ep) -> void {
                auto it = sessions_.find(ep);
                if (it == sessions_.end()) {
                    return;
                }
                SessionState last = it->second->state();
                sessions_.erase(it);
                emit(TunnelEvent{EventKind::SessionRemoved, ep, last, last, 0});
            }

            auto reset_session(session::ProtocolSession &session) -> void {
                SessionState before = session.state();
                session.reset();
                note_transition(session, before);
            }

            // Ticks one session and sends whatever it produced
            auto run_tick(session::ProtocolSession &session, u64 now) -> boolean {
                SessionState before = session.state();
                auto out = session.tick(now);
                note_transition(session, before);
                if (!out.has_value()) {
                    return false;
                }
                emit_datagram(session.endpoint(), std::move(out.value()));
                return true;
            }

            auto on_handshake_complete(session::ProtocolSession &session, u64 now) -> void {
                auto peer = session.peer_key();
                if (peer.has_value()) {
                    drop_other_sessions(peer.value(), session);
                    directory_.update_endpoint(peer.value(), session.endpoint());
                    auto policy = directory_.resolve(peer.value());
                    if (policy.has_value()) {
                        session.set_keepalive_ms(policy->keepalive_ms());
                    }
                }
                emit(TunnelEvent{EventKind::HandshakeComplete, session.endpoint(), session.state(), session.state(), 0});

                // Initiators owe the peer a confirmation datagram right away
                run_tick(session, now);
            }

            // A peer lives at one address; sessions left at its previous addresses are removed and
            // their outbound intent moves to the session that just completed
            auto drop_other_sessions(const PublicKey &peer, session::ProtocolSession &current) -> void {
                Vector<Endpoint> stale;
                for (const auto &[ep, other] : sessions_) {
                    if (other.get() == &current) {
                        continue;
                    }
                    auto key = other->peer_key();
                    if (!key.has_value() || key.value() != peer) {
                        continue;
                    }
                    if (other->wants_handshake()) {
                        current.request_handshake();
                    }
                    stale.push_back(ep);
                }
                for (const auto &ep : stale) {
                    echo::debug("Orchestrator: peer moved, dropping session at ", net::format_endpoint(ep).c_str());
                    remove_session(ep);
                }
            }

            auto deliver(session::ProtocolSession &session, Vector<u8> packet, netdev::IpVersion version) -> void {
                usize bytes = packet.size();
                if (sink_ == nullptr) {
                    metrics::inc_packets_dropped_no_sink();
                    echo::debug("Orchestrator: no packet sink, dropping ", bytes, " bytes");
                    emit(TunnelEvent{EventKind::Dropped, session.endpoint(), session.state(), session.state(), bytes});
                    return;
                }
                sink_->deliver(netdev::IpPacket(std::move(packet), version, session.endpoint()));
                metrics::inc_packets_delivered();
                emit(TunnelEvent{EventKind::PlaintextDelivered, session.endpoint(), session.state(), session.state(),
                                 bytes});
            }

            auto emit_datagram(const Endpoint &ep, Vector<u8> data) -> void {
                if (!send_(net::Datagram(std::move(data), ep))) {
                    echo::debug("Orchestrator: outbound queue closed, datagram discarded");
                }
            }

            auto note_transition(const session::ProtocolSession &session, SessionState before) -> void {
                if (session.state() != before) {
                    emit(TunnelEvent{EventKind::StateChanged, session.endpoint(), before, session.state(), 0});
                }
            }

            auto emit(const TunnelEvent &event) -> void {
                if (hook_) {
                    hook_(event);
                }
            }
        };

    } // namespace runtime

} // namespace tunlink
