/* SPDX-License-Identifier: MIT */
/*
 * Tunlink Cipher
 * HKDF-SHA256 key schedule, XChaCha20-Poly1305 sealing and replay protection
 */

#pragma once

#include <datapod/datapod.hpp>
#include <keylock/crypto/aead_xchacha20poly1305_ietf/aead.hpp>
#include <keylock/keylock.hpp>
#include <tunlink/core/result.hpp>
#include <tunlink/core/types.hpp>

#include <sodium.h>

namespace tunlink {

    using namespace dp;

    namespace crypto {

        // =============================================================================
        // Constants
        // =============================================================================

        inline constexpr usize SESSION_KEY_SIZE = 32;
        inline constexpr usize NONCE_SIZE = 24;                                              // XChaCha20-Poly1305
        inline constexpr usize TAG_SIZE = keylock::crypto::aead_xchacha20poly1305::ABYTES; // 16 bytes
        inline constexpr usize HASH_SIZE = 32;

        // =============================================================================
        // Session Key
        // =============================================================================

        struct SessionKey {
            Array<u8, SESSION_KEY_SIZE> data{};

            SessionKey() = default;

            SessionKey(const SessionKey &other) : data(other.data) {}

            auto operator=(const SessionKey &other) -> SessionKey & {
                if (this != &other) {
                    data = other.data;
                }
                return *this;
            }

            SessionKey(SessionKey &&other) noexcept : data(other.data) { other.clear(); }

            auto operator=(SessionKey &&other) noexcept -> SessionKey & {
                if (this != &other) {
                    data = other.data;
                    other.clear();
                }
                return *this;
            }

            ~SessionKey() { clear(); }

            auto clear() -> void { keylock::utils::Common::secure_clear(data.data(), data.size()); }

            [[nodiscard]] auto raw() -> u8 * { return data.data(); }
            [[nodiscard]] auto raw() const -> const u8 * { return data.data(); }
        };

        // =============================================================================
        // HKDF (RFC 5869) over HMAC-SHA256
        // =============================================================================

        inline auto hkdf_extract(const u8 *salt, usize salt_len, const u8 *ikm, usize ikm_len) -> Array<u8, HASH_SIZE> {
            Array<u8, HASH_SIZE> prk{};

            crypto_auth_hmacsha256_state state;
            crypto_auth_hmacsha256_init(&state, salt, salt_len);
            crypto_auth_hmacsha256_update(&state, ikm, ikm_len);
            crypto_auth_hmacsha256_final(&state, prk.data());

            return prk;
        }

        inline auto hkdf_expand(const Array<u8, HASH_SIZE> &prk, const char *label, usize output_len) -> Vector<u8> {
            Vector<u8> output;
            output.reserve(output_len);

            Array<u8, HASH_SIZE> t{};
            u8 counter = 1;
            usize label_len = 0;
            while (label[label_len] != '\0') {
                ++label_len;
            }

            while (output.size() < output_len) {
                crypto_auth_hmacsha256_state state;
                crypto_auth_hmacsha256_init(&state, prk.data(), prk.size());
                if (counter > 1) {
                    crypto_auth_hmacsha256_update(&state, t.data(), t.size());
                }
                crypto_auth_hmacsha256_update(&state, reinterpret_cast<const u8 *>(label), label_len);
                crypto_auth_hmacsha256_update(&state, &counter, 1);
                crypto_auth_hmacsha256_final(&state, t.data());

                for (usize i = 0; i < t.size() && output.size() < output_len; ++i) {
                    output.push_back(t[i]);
                }
                ++counter;
            }

            keylock::utils::Common::secure_clear(t.data(), t.size());
            return output;
        }

        // Derive `count` independent session keys from input key material under a label
        inline auto derive_keys(const Vector<u8> &ikm, const char *label, usize count) -> Vector<SessionKey> {
            auto prk = hkdf_extract(nullptr, 0, ikm.data(), ikm.size());
            auto okm = hkdf_expand(prk, label, count * SESSION_KEY_SIZE);

            Vector<SessionKey> keys;
            keys.resize(count);
            for (usize k = 0; k < count; ++k) {
                for (usize i = 0; i < SESSION_KEY_SIZE; ++i) {
                    keys[k].data[i] = okm[k * SESSION_KEY_SIZE + i];
                }
            }

            keylock::utils::Common::secure_clear(prk.data(), prk.size());
            keylock::utils::Common::secure_clear(okm.data(), okm.size());
            return keys;
        }

        // =============================================================================
        // AEAD
        // =============================================================================

        // Counter in the first 8 bytes (little endian), remainder zero
        inline auto nonce_from_counter(u64 counter) -> Array<u8, NONCE_SIZE> {
            Array<u8, NONCE_SIZE> nonce{};
            for (usize i = 0; i < 8; ++i) {
                nonce[i] = static_cast<u8>((counter >> (i * 8)) & 0xFF);
            }
            return nonce;
        }

        inline auto seal(const SessionKey &key, u64 counter, const u8 *plaintext, usize plaintext_len, const u8 *ad,
                         usize ad_len) -> Res<Vector<u8>> {
            Vector<u8> ciphertext;
            ciphertext.resize(plaintext_len + TAG_SIZE);
            unsigned long long ciphertext_len = 0;
            auto nonce = nonce_from_counter(counter);

            int rc = keylock::crypto::aead_xchacha20poly1305::encrypt(ciphertext.data(), &ciphertext_len, plaintext,
                                                                      plaintext_len, ad, ad_len, nullptr, nonce.data(),
                                                                      key.raw());
            if (rc != 0) {
                return result::err(err::invalid("AEAD encryption failed"));
            }

            ciphertext.resize(static_cast<usize>(ciphertext_len));
            return result::ok(std::move(ciphertext));
        }

        inline auto unseal(const SessionKey &key, u64 counter, const u8 *ciphertext, usize ciphertext_len, const u8 *ad,
                         usize ad_len) -> Res<Vector<u8>> {
            if (ciphertext_len < TAG_SIZE) {
                return result::err(err::invalid("Ciphertext too short"));
            }

            Vector<u8> plaintext;
            plaintext.resize(ciphertext_len - TAG_SIZE);
            unsigned long long plaintext_len = 0;
            auto nonce = nonce_from_counter(counter);

            int rc = keylock::crypto::aead_xchacha20poly1305::decrypt(plaintext.data(), &plaintext_len, nullptr,
                                                                      ciphertext, ciphertext_len, ad, ad_len,
                                                                      nonce.data(), key.raw());
            if (rc != 0) {
                return result::err(err::invalid("AEAD authentication failed"));
            }

            plaintext.resize(static_cast<usize>(plaintext_len));
            return result::ok(std::move(plaintext));
        }

        // =============================================================================
        // Replay Protection
        // =============================================================================

        // Sliding window over the last 64 counters; counters start at 1
        struct ReplayWindow {
            u64 last_seen = 0;
            u64 window_bitmap = 0;
            static constexpr u64 WINDOW_SIZE = 64;

            // Read-only check, so a forged datagram cannot advance the window
            [[nodiscard]] auto would_accept(u64 counter) const -> boolean {
                if (counter == 0) {
                    return false;
                }
                if (counter > last_seen) {
                    return true;
                }
                u64 diff = last_seen - counter;
                if (diff >= WINDOW_SIZE) {
                    return false;
                }
                return (window_bitmap & (1ULL << diff)) == 0;
            }

            // Record an authenticated counter
            auto mark(u64 counter) -> void {
                if (counter > last_seen) {
                    u64 shift = counter - last_seen;
                    window_bitmap = shift >= WINDOW_SIZE ? 0 : window_bitmap << shift;
                    window_bitmap |= 1;
                    last_seen = counter;
                } else {
                    window_bitmap |= 1ULL << (last_seen - counter);
                }
            }

            auto reset() -> void {
                last_seen = 0;
                window_bitmap = 0;
            }

            auto members() noexcept { return std::tie(last_seen, window_bitmap); }
            auto members() const noexcept { return std::tie(last_seen, window_bitmap); }
        };

        // =============================================================================
        // Random Session Index
        // =============================================================================

        inline auto random_index() -> u32 {
            auto random = keylock::utils::Common::generate_random_bytes(4);
            u32 id = static_cast<u32>(random[0]) | (static_cast<u32>(random[1]) << 8) |
                     (static_cast<u32>(random[2]) << 16) | (static_cast<u32>(random[3]) << 24);
            return id == 0 ? 1 : id;
        }

    } // namespace crypto

} // namespace tunlink
