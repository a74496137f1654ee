/* SPDX-License-Identifier: MIT */
/*
 * Tunlink Keylock Engine
 * X25519 handshake and XChaCha20-Poly1305 transport built on keylock
 */

#pragma once

#include <functional>
#include <initializer_list>

#include <datapod/datapod.hpp>
#include <echo/echo.hpp>
#include <tunlink/core/metrics.hpp>
#include <tunlink/core/result.hpp>
#include <tunlink/core/time.hpp>
#include <tunlink/core/types.hpp>
#include <tunlink/crypto/cipher.hpp>
#include <tunlink/crypto/keys.hpp>
#include <tunlink/session/engine.hpp>

namespace tunlink {

    using namespace dp;

    namespace session {

        // =============================================================================
        // Wire Format
        // =============================================================================
        //
        // init      : 0x01 | sender_index u32 | static_i 32 | ephemeral_i 32 | timestamp u64 | tag 16
        // response  : 0x02 | sender_index u32 | receiver_index u32 | ephemeral_r 32 | tag 16
        // transport : 0x04 | receiver_index u32 | counter u64 | ciphertext (+ tag 16)
        //
        // All integers little endian. Tags authenticate the whole header as associated data.

        inline constexpr u8 MSG_HANDSHAKE_INIT = 0x01;
        inline constexpr u8 MSG_HANDSHAKE_RESPONSE = 0x02;
        inline constexpr u8 MSG_TRANSPORT = 0x04;

        inline constexpr usize INIT_HEADER_SIZE = 1 + 4 + KEY_SIZE + KEY_SIZE + 8;
        inline constexpr usize INIT_SIZE = INIT_HEADER_SIZE + crypto::TAG_SIZE;
        inline constexpr usize RESPONSE_HEADER_SIZE = 1 + 4 + 4 + KEY_SIZE;
        inline constexpr usize RESPONSE_SIZE = RESPONSE_HEADER_SIZE + crypto::TAG_SIZE;
        inline constexpr usize TRANSPORT_HEADER_SIZE = 1 + 4 + 8;
        inline constexpr usize TRANSPORT_MIN_SIZE = TRANSPORT_HEADER_SIZE + crypto::TAG_SIZE;

        // Counters are refused well before the nonce space wraps
        inline constexpr u64 REJECT_AFTER_MESSAGES = (1ULL << 60);

        namespace detail {

            inline auto put_u32(Vector<u8> &out, u32 v) -> void {
                for (usize i = 0; i < 4; ++i) {
                    out.push_back(static_cast<u8>((v >> (i * 8)) & 0xFF));
                }
            }

            inline auto put_u64(Vector<u8> &out, u64 v) -> void {
                for (usize i = 0; i < 8; ++i) {
                    out.push_back(static_cast<u8>((v >> (i * 8)) & 0xFF));
                }
            }

            inline auto put_key(Vector<u8> &out, const u8 *key) -> void {
                for (usize i = 0; i < KEY_SIZE; ++i) {
                    out.push_back(key[i]);
                }
            }

            inline auto get_u32(const Vector<u8> &in, usize offset) -> u32 {
                u32 v = 0;
                for (usize i = 0; i < 4; ++i) {
                    v |= static_cast<u32>(in[offset + i]) << (i * 8);
                }
                return v;
            }

            inline auto get_u64(const Vector<u8> &in, usize offset) -> u64 {
                u64 v = 0;
                for (usize i = 0; i < 8; ++i) {
                    v |= static_cast<u64>(in[offset + i]) << (i * 8);
                }
                return v;
            }

            // Lexicographic byte order, used to break simultaneous initiations
            inline auto key_less(const PublicKey &a, const PublicKey &b) -> boolean {
                for (usize i = 0; i < KEY_SIZE; ++i) {
                    if (a.data[i] != b.data[i]) {
                        return a.data[i] < b.data[i];
                    }
                }
                return false;
            }

            inline auto concat(std::initializer_list<const Array<u8, KEY_SIZE> *> parts) -> Vector<u8> {
                Vector<u8> out;
                out.reserve(parts.size() * KEY_SIZE);
                for (const auto *part : parts) {
                    for (usize i = 0; i < KEY_SIZE; ++i) {
                        out.push_back((*part)[i]);
                    }
                }
                return out;
            }

        } // namespace detail

        // Decides whether an initiator's static key may open a session
        using PeerAuthorizer = std::function<boolean(const PublicKey &)>;

        // =============================================================================
        // Keylock Engine
        // =============================================================================

        class KeylockEngine : public SessionEngine {
          private:
            enum class Phase : u8 {
                None = 0,         // No handshake in flight
                InitSent = 1,     // Initiator waiting for the response
                ResponseSent = 2, // Responder waiting for the first transport datagram
                Ready = 3,        // Transport keys confirmed
            };

            PrivateKey static_private_;
            PublicKey static_public_;
            Optional<PublicKey> peer_;
            PeerAuthorizer authorize_;

            Phase phase_ = Phase::None;
            PrivateKey ephemeral_private_;
            PublicKey ephemeral_public_;
            u32 local_index_ = 0;
            u32 remote_index_ = 0;
            crypto::SessionKey init_key_;
            crypto::SessionKey send_key_;
            crypto::SessionKey recv_key_;
            u64 send_counter_ = 0;
            crypto::ReplayWindow replay_;

            u64 last_sent_timestamp_ = 0;
            u64 last_accepted_timestamp_ = 0;

          public:
            // `peer` pins the remote static key; leave it empty to learn it from an authorized initiator
            KeylockEngine(const PrivateKey &static_private, Optional<PublicKey> peer, PeerAuthorizer authorize)
                : static_private_(static_private), static_public_(crypto::public_from_private(static_private)),
                  peer_(std::move(peer)), authorize_(std::move(authorize)) {}

            auto initiate() -> Result<Vector<u8>, SessionError> override {
                if (!peer_.has_value()) {
                    return result::err(SessionError{SessionErrorKind::HandshakeFailed, String("peer key unknown")});
                }

                clear_handshake();
                auto [eph_priv, eph_pub] = crypto::generate_keypair();
                ephemeral_private_ = std::move(eph_priv);
                ephemeral_public_ = eph_pub;

                auto dh_es = crypto::shared_secret(ephemeral_private_, peer_.value());
                auto dh_ss = crypto::shared_secret(static_private_, peer_.value());
                if (!dh_es.has_value() || !dh_ss.has_value()) {
                    return result::err(SessionError{SessionErrorKind::HandshakeFailed, String("degenerate peer key")});
                }
                init_key_ = derive_init_key(dh_es.value(), dh_ss.value());

                u64 ts = static_cast<u64>(time::now_ns());
                last_sent_timestamp_ = ts > last_sent_timestamp_ ? ts : last_sent_timestamp_ + 1;
                local_index_ = crypto::random_index();

                Vector<u8> msg;
                msg.reserve(INIT_SIZE);
                msg.push_back(MSG_HANDSHAKE_INIT);
                detail::put_u32(msg, local_index_);
                detail::put_key(msg, static_public_.raw());
                detail::put_key(msg, ephemeral_public_.raw());
                detail::put_u64(msg, last_sent_timestamp_);

                auto tag = crypto::seal(init_key_, 0, nullptr, 0, msg.data(), msg.size());
                if (tag.is_err()) {
                    return result::err(SessionError{SessionErrorKind::HandshakeFailed, String("sealing init failed")});
                }
                for (const auto b : tag.value()) {
                    msg.push_back(b);
                }

                phase_ = Phase::InitSent;
                return result::ok(std::move(msg));
            }

            auto decapsulate(const Vector<u8> &datagram) -> EngineResult override {
                if (datagram.empty()) {
                    return EngineResult::none();
                }
                switch (datagram[0]) {
                case MSG_HANDSHAKE_INIT:
                    return handle_init(datagram);
                case MSG_HANDSHAKE_RESPONSE:
                    return handle_response(datagram);
                case MSG_TRANSPORT:
                    return handle_transport(datagram);
                default:
                    metrics::inc_datagrams_dropped_invalid();
                    return EngineResult::none();
                }
            }

            auto encapsulate(const Vector<u8> &plaintext) -> Result<Vector<u8>, SessionError> override {
                if (phase_ != Phase::Ready) {
                    return result::err(SessionError{SessionErrorKind::NotEstablished, String("no transport keys")});
                }
                if (send_counter_ >= REJECT_AFTER_MESSAGES) {
                    return result::err(SessionError{SessionErrorKind::Expired, String("counter exhausted")});
                }

                u64 counter = ++send_counter_;
                Vector<u8> msg;
                msg.reserve(TRANSPORT_MIN_SIZE + plaintext.size());
                msg.push_back(MSG_TRANSPORT);
                detail::put_u32(msg, remote_index_);
                detail::put_u64(msg, counter);

                auto ct = crypto::seal(send_key_, counter, plaintext.data(), plaintext.size(), msg.data(),
                                       TRANSPORT_HEADER_SIZE);
                if (ct.is_err()) {
                    return result::err(SessionError{SessionErrorKind::Expired, String("sealing failed")});
                }
                for (const auto b : ct.value()) {
                    msg.push_back(b);
                }
                return result::ok(std::move(msg));
            }

            auto reset() -> void override {
                clear_handshake();
                send_key_.clear();
                recv_key_.clear();
                remote_index_ = 0;
                send_counter_ = 0;
                replay_.reset();
            }

            [[nodiscard]] auto peer_key() const -> Optional<PublicKey> override { return peer_; }

            [[nodiscard]] auto local_public_key() const -> const PublicKey & { return static_public_; }

          private:
            auto clear_handshake() -> void {
                phase_ = Phase::None;
                ephemeral_private_.secure_clear();
                ephemeral_public_ = PublicKey{};
                init_key_.clear();
                local_index_ = 0;
            }

            static auto derive_init_key(const Array<u8, KEY_SIZE> &dh_es, const Array<u8, KEY_SIZE> &dh_ss)
                -> crypto::SessionKey {
                auto ikm = detail::concat({&dh_es, &dh_ss});
                auto keys = crypto::derive_keys(ikm, "tunlink-init", 1);
                keylock::utils::Common::secure_clear(ikm.data(), ikm.size());
                return keys[0];
            }

            // Returns {response key, initiator->responder key, responder->initiator key}
            auto derive_transport_keys(const Array<u8, KEY_SIZE> &dh_ee, const Array<u8, KEY_SIZE> &dh_se)
                -> Vector<crypto::SessionKey> {
                Array<u8, KEY_SIZE> chain{};
                for (usize i = 0; i < KEY_SIZE; ++i) {
                    chain[i] = init_key_.data[i];
                }
                auto ikm = detail::concat({&dh_ee, &dh_se, &chain});
                auto keys = crypto::derive_keys(ikm, "tunlink-transport", 3);
                keylock::utils::Common::secure_clear(ikm.data(), ikm.size());
                keylock::utils::Common::secure_clear(chain.data(), chain.size());
                return keys;
            }

            auto handle_init(const Vector<u8> &msg) -> EngineResult {
                if (msg.size() != INIT_SIZE) {
                    metrics::inc_datagrams_dropped_invalid();
                    return EngineResult::none();
                }

                u32 sender_index = detail::get_u32(msg, 1);
                PublicKey initiator_static(msg.data() + 5);
                PublicKey initiator_ephemeral(msg.data() + 5 + KEY_SIZE);
                u64 timestamp = detail::get_u64(msg, 5 + 2 * KEY_SIZE);

                auto dh_es = crypto::shared_secret(static_private_, initiator_ephemeral);
                auto dh_ss = crypto::shared_secret(static_private_, initiator_static);
                if (!dh_es.has_value() || !dh_ss.has_value()) {
                    metrics::inc_datagrams_dropped_invalid();
                    return EngineResult::none();
                }
                auto candidate_key = derive_init_key(dh_es.value(), dh_ss.value());

                auto check = crypto::unseal(candidate_key, 0, msg.data() + INIT_HEADER_SIZE, crypto::TAG_SIZE,
                                            msg.data(), INIT_HEADER_SIZE);
                if (check.is_err()) {
                    metrics::inc_datagrams_dropped_invalid();
                    return EngineResult::none();
                }

                if (peer_.has_value() && peer_.value() != initiator_static) {
                    echo::debug("KeylockEngine: init from a different peer than this session expects");
                    return EngineResult::none();
                }
                if (authorize_ && !authorize_(initiator_static)) {
                    echo::warn("KeylockEngine: rejecting handshake from unknown peer ",
                               crypto::encode(initiator_static).c_str());
                    return EngineResult::none();
                }
                if (timestamp <= last_accepted_timestamp_) {
                    metrics::inc_datagrams_dropped_replay();
                    return EngineResult::none();
                }

                // Both sides initiated: the lower static key keeps the initiator role
                if (phase_ == Phase::InitSent && detail::key_less(static_public_, initiator_static)) {
                    return EngineResult::none(true);
                }

                last_accepted_timestamp_ = timestamp;
                peer_ = initiator_static;

                clear_handshake();
                init_key_ = std::move(candidate_key);
                remote_index_ = sender_index;

                auto [eph_priv, eph_pub] = crypto::generate_keypair();
                auto dh_ee = crypto::shared_secret(eph_priv, initiator_ephemeral);
                auto dh_se = crypto::shared_secret(eph_priv, initiator_static);
                if (!dh_ee.has_value() || !dh_se.has_value()) {
                    return EngineResult::failed(SessionErrorKind::HandshakeFailed, String("degenerate ephemeral key"));
                }

                auto keys = derive_transport_keys(dh_ee.value(), dh_se.value());
                recv_key_ = keys[1];
                send_key_ = keys[2];
                send_counter_ = 0;
                replay_.reset();
                local_index_ = crypto::random_index();

                Vector<u8> reply;
                reply.reserve(RESPONSE_SIZE);
                reply.push_back(MSG_HANDSHAKE_RESPONSE);
                detail::put_u32(reply, local_index_);
                detail::put_u32(reply, remote_index_);
                detail::put_key(reply, eph_pub.raw());

                auto tag = crypto::seal(keys[0], 0, nullptr, 0, reply.data(), reply.size());
                if (tag.is_err()) {
                    return EngineResult::failed(SessionErrorKind::HandshakeFailed, String("sealing response failed"));
                }
                for (const auto b : tag.value()) {
                    reply.push_back(b);
                }

                phase_ = Phase::ResponseSent;
                return EngineResult::with(EngineAction::SendToNetwork, std::move(reply), true);
            }

            auto handle_response(const Vector<u8> &msg) -> EngineResult {
                if (msg.size() != RESPONSE_SIZE || phase_ != Phase::InitSent) {
                    metrics::inc_datagrams_dropped_invalid();
                    return EngineResult::none();
                }

                u32 sender_index = detail::get_u32(msg, 1);
                u32 receiver_index = detail::get_u32(msg, 5);
                if (receiver_index != local_index_) {
                    metrics::inc_datagrams_dropped_invalid();
                    return EngineResult::none();
                }
                PublicKey responder_ephemeral(msg.data() + 9);

                auto dh_ee = crypto::shared_secret(ephemeral_private_, responder_ephemeral);
                auto dh_se = crypto::shared_secret(static_private_, responder_ephemeral);
                if (!dh_ee.has_value() || !dh_se.has_value()) {
                    return EngineResult::failed(SessionErrorKind::HandshakeFailed, String("degenerate responder key"));
                }

                auto keys = derive_transport_keys(dh_ee.value(), dh_se.value());
                auto check = crypto::unseal(keys[0], 0, msg.data() + RESPONSE_HEADER_SIZE, crypto::TAG_SIZE,
                                            msg.data(), RESPONSE_HEADER_SIZE);
                if (check.is_err()) {
                    metrics::inc_datagrams_dropped_invalid();
                    return EngineResult::none();
                }

                send_key_ = keys[1];
                recv_key_ = keys[2];
                remote_index_ = sender_index;
                send_counter_ = 0;
                replay_.reset();

                u32 keep_index = local_index_;
                clear_handshake();
                local_index_ = keep_index;
                phase_ = Phase::Ready;
                return EngineResult::with(EngineAction::HandshakeComplete, Vector<u8>{}, true);
            }

            auto handle_transport(const Vector<u8> &msg) -> EngineResult {
                if (msg.size() < TRANSPORT_MIN_SIZE || (phase_ != Phase::Ready && phase_ != Phase::ResponseSent)) {
                    metrics::inc_datagrams_dropped_invalid();
                    return EngineResult::none();
                }
                if (detail::get_u32(msg, 1) != local_index_) {
                    metrics::inc_datagrams_dropped_invalid();
                    return EngineResult::none();
                }

                u64 counter = detail::get_u64(msg, 5);
                if (!replay_.would_accept(counter)) {
                    metrics::inc_datagrams_dropped_replay();
                    return EngineResult::none();
                }

                auto plain = crypto::unseal(recv_key_, counter, msg.data() + TRANSPORT_HEADER_SIZE,
                                            msg.size() - TRANSPORT_HEADER_SIZE, msg.data(), TRANSPORT_HEADER_SIZE);
                if (plain.is_err()) {
                    metrics::inc_datagrams_dropped_invalid();
                    return EngineResult::none();
                }
                replay_.mark(counter);

                // First authenticated transport datagram confirms the responder side
                if (phase_ == Phase::ResponseSent) {
                    u32 keep_index = local_index_;
                    clear_handshake();
                    local_index_ = keep_index;
                    phase_ = Phase::Ready;
                    return EngineResult::with(EngineAction::HandshakeComplete, Vector<u8>{}, true);
                }

                auto &packet = plain.value();
                if (packet.empty()) {
                    return EngineResult::none(true);
                }

                u8 version = packet[0] >> 4;
                if (version == 4) {
                    return EngineResult::with(EngineAction::DeliverV4, std::move(packet), true);
                }
                if (version == 6) {
                    return EngineResult::with(EngineAction::DeliverV6, std::move(packet), true);
                }
                echo::debug("KeylockEngine: dropping plaintext with IP version ", static_cast<u32>(version));
                metrics::inc_datagrams_dropped_invalid();
                return EngineResult::none(true);
            }
        };

    } // namespace session

} // namespace tunlink
