/* SPDX-License-Identifier: MIT */
/*
 * Tunlink Keys
 * X25519 key pairs and their base64 text form
 */

#pragma once

#include <datapod/datapod.hpp>
#include <keylock/crypto/box_seal_x25519/x25519.hpp>
#include <keylock/keylock.hpp>
#include <tunlink/core/result.hpp>
#include <tunlink/core/types.hpp>

namespace tunlink {

    using namespace dp;

    namespace crypto {

        // =============================================================================
        // Base64 (standard alphabet, padded)
        // =============================================================================

        namespace detail {

            inline constexpr char B64_CHARS[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

            inline auto b64_encode(const u8 *data, usize len) -> String {
                String result;
                result.reserve(((len + 2) / 3) * 4);

                for (usize i = 0; i < len; i += 3) {
                    u32 n = static_cast<u32>(data[i]) << 16;
                    if (i + 1 < len)
                        n |= static_cast<u32>(data[i + 1]) << 8;
                    if (i + 2 < len)
                        n |= static_cast<u32>(data[i + 2]);

                    result.push_back(B64_CHARS[(n >> 18) & 0x3F]);
                    result.push_back(B64_CHARS[(n >> 12) & 0x3F]);
                    result.push_back(i + 1 < len ? B64_CHARS[(n >> 6) & 0x3F] : '=');
                    result.push_back(i + 2 < len ? B64_CHARS[n & 0x3F] : '=');
                }

                return result;
            }

            inline auto b64_decode_char(char c) -> i8 {
                if (c >= 'A' && c <= 'Z')
                    return static_cast<i8>(c - 'A');
                if (c >= 'a' && c <= 'z')
                    return static_cast<i8>(c - 'a' + 26);
                if (c >= '0' && c <= '9')
                    return static_cast<i8>(c - '0' + 52);
                if (c == '+')
                    return 62;
                if (c == '/')
                    return 63;
                return -1;
            }

            inline auto b64_decode(const String &text) -> Result<Vector<u8>, KeyError> {
                const usize len = text.size();
                if (len == 0 || len % 4 != 0) {
                    return result::err(KeyError{KeyErrorKind::InvalidEncoding, String("base64 length not a multiple of 4")});
                }

                usize padding = 0;
                if (text[len - 1] == '=')
                    ++padding;
                if (text[len - 2] == '=')
                    ++padding;

                Vector<u8> out;
                out.reserve((len / 4) * 3);

                for (usize i = 0; i < len; i += 4) {
                    u32 n = 0;
                    for (usize j = 0; j < 4; ++j) {
                        char c = text[i + j];
                        // '=' is only legal in the trailing padding positions
                        if (c == '=' && i + j >= len - padding) {
                            n <<= 6;
                            continue;
                        }
                        i8 v = b64_decode_char(c);
                        if (v < 0) {
                            return result::err(KeyError{KeyErrorKind::InvalidEncoding, String("invalid base64 character")});
                        }
                        n = (n << 6) | static_cast<u32>(v);
                    }
                    out.push_back(static_cast<u8>((n >> 16) & 0xFF));
                    out.push_back(static_cast<u8>((n >> 8) & 0xFF));
                    out.push_back(static_cast<u8>(n & 0xFF));
                }

                out.resize(out.size() - padding);
                return result::ok(std::move(out));
            }

        } // namespace detail

        // =============================================================================
        // Key Generation
        // =============================================================================

        // Derive X25519 public key from private scalar
        [[nodiscard]] inline auto public_from_private(const PrivateKey &private_key) -> PublicKey {
            PublicKey public_key;
            keylock::crypto::x25519::public_key(public_key.raw(), private_key.raw());
            return public_key;
        }

        // Generate a fresh X25519 key pair from the system CSPRNG
        [[nodiscard]] inline auto generate_keypair() -> Pair<PrivateKey, PublicKey> {
            PrivateKey private_key;

            auto random = keylock::utils::Common::generate_random_bytes(KEY_SIZE);
            for (usize i = 0; i < KEY_SIZE; ++i) {
                private_key.data[i] = random[i];
            }
            keylock::utils::Common::secure_clear(random.data(), random.size());

            PublicKey public_key = public_from_private(private_key);
            return {private_key, public_key};
        }

        // X25519 Diffie-Hellman; empty when the peer key is a low-order point
        [[nodiscard]] inline auto shared_secret(const PrivateKey &my_private, const PublicKey &their_public)
            -> Optional<Array<u8, KEY_SIZE>> {
            Array<u8, KEY_SIZE> shared{};
            keylock::crypto::x25519::scalarmult(shared.data(), my_private.raw(), their_public.raw());

            u8 acc = 0;
            for (usize i = 0; i < KEY_SIZE; ++i) {
                acc |= shared[i];
            }
            if (acc == 0) {
                return dp::nullopt;
            }
            return shared;
        }

        // =============================================================================
        // Text Encoding
        // =============================================================================

        [[nodiscard]] inline auto encode(const PublicKey &key) -> String { return detail::b64_encode(key.raw(), KEY_SIZE); }

        [[nodiscard]] inline auto encode(const PrivateKey &key) -> String {
            return detail::b64_encode(key.raw(), KEY_SIZE);
        }

        // Decode a base64 key; the decoded length must be exactly 32 bytes
        [[nodiscard]] inline auto decode(const String &text) -> Result<Array<u8, KEY_SIZE>, KeyError> {
            auto bytes = detail::b64_decode(text);
            if (bytes.is_err()) {
                return result::err(bytes.error());
            }

            auto &raw = bytes.value();
            if (raw.size() != KEY_SIZE) {
                String msg("expected 32 bytes, got ");
                msg += to_str(static_cast<u64>(raw.size()));
                keylock::utils::Common::secure_clear(raw.data(), raw.size());
                return result::err(KeyError{KeyErrorKind::InvalidLength, msg});
            }

            Array<u8, KEY_SIZE> key{};
            for (usize i = 0; i < KEY_SIZE; ++i) {
                key[i] = raw[i];
            }
            keylock::utils::Common::secure_clear(raw.data(), raw.size());
            return result::ok(key);
        }

        [[nodiscard]] inline auto decode_public_key(const String &text) -> Result<PublicKey, KeyError> {
            auto res = decode(text);
            if (res.is_err()) {
                return result::err(res.error());
            }
            return result::ok(PublicKey(res.value().data()));
        }

        [[nodiscard]] inline auto decode_private_key(const String &text) -> Result<PrivateKey, KeyError> {
            auto res = decode(text);
            if (res.is_err()) {
                return result::err(res.error());
            }
            PrivateKey key(res.value().data());
            keylock::utils::Common::secure_clear(res.value().data(), KEY_SIZE);
            return result::ok(std::move(key));
        }

    } // namespace crypto

} // namespace tunlink
