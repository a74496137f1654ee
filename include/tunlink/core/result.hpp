/* SPDX-License-Identifier: MIT */
/*
 * Tunlink Result Types
 * datapod Result aliases and the typed error families of the tunnel
 */

#pragma once

#include <datapod/datapod.hpp>

namespace tunlink {

    using namespace dp;

    // =============================================================================
    // Result Type Aliases
    // =============================================================================

    // Generic result with custom error type
    template <typename T, typename E = Error> using Result = dp::Result<T, E>;

    // Result with default Error type
    template <typename T> using Res = dp::Res<T>;

    // Void result (operations that don't return a value)
    using VoidRes = dp::VoidRes;

    // =============================================================================
    // Result Factory Functions
    // =============================================================================

    namespace result {

        using dp::result::err;
        using dp::result::Err;
        using dp::result::ok;
        using dp::result::Ok;

    } // namespace result

    // =============================================================================
    // Generic Error Helpers
    // =============================================================================

    namespace err {

        inline auto invalid(const char *msg) -> Error { return Error::invalid_argument(msg); }

        inline auto network(const char *msg) -> Error { return Error::io_error(msg); }

        inline auto config(const char *msg) -> Error { return Error::invalid_argument(msg); }

    } // namespace err

    // =============================================================================
    // ConfigError - configuration text, keys and endpoints
    // =============================================================================

    enum class ConfigErrorKind : u8 {
        MissingField = 0,    // Required key never set (PrivateKey, Address, ...)
        InvalidEndpoint = 1, // Peer endpoint does not parse or resolve
        SyntaxError = 2,     // Malformed line or section header
        InvalidKey = 3,      // Key value is not a base64 32-byte key
        DuplicatePeer = 4,   // Same public key configured twice
        Io = 5,              // Config file unreadable
        InvalidOption = 6,   // TunnelOptions value out of range
        InvalidState = 7,    // Tunnel already started or stopped
    };

    [[nodiscard]] inline auto config_error_kind_to_string(ConfigErrorKind kind) -> const char * {
        switch (kind) {
        case ConfigErrorKind::MissingField:
            return "missing_field";
        case ConfigErrorKind::InvalidEndpoint:
            return "invalid_endpoint";
        case ConfigErrorKind::SyntaxError:
            return "syntax_error";
        case ConfigErrorKind::InvalidKey:
            return "invalid_key";
        case ConfigErrorKind::DuplicatePeer:
            return "duplicate_peer";
        case ConfigErrorKind::Io:
            return "io";
        case ConfigErrorKind::InvalidOption:
            return "invalid_option";
        case ConfigErrorKind::InvalidState:
            return "invalid_state";
        default:
            return "unknown";
        }
    }

    struct ConfigError {
        ConfigErrorKind kind = ConfigErrorKind::SyntaxError;
        String field;
        String message;

        [[nodiscard]] auto describe() const -> String {
            String out(config_error_kind_to_string(kind));
            if (!field.empty()) {
                out += " [";
                out += field;
                out += "]";
            }
            if (!message.empty()) {
                out += ": ";
                out += message;
            }
            return out;
        }

        static auto missing_field(const String &field) -> ConfigError {
            return ConfigError{ConfigErrorKind::MissingField, field, String("required field not set")};
        }

        static auto invalid_endpoint(const String &field, const String &message) -> ConfigError {
            return ConfigError{ConfigErrorKind::InvalidEndpoint, field, message};
        }

        static auto syntax(const String &field, const String &message) -> ConfigError {
            return ConfigError{ConfigErrorKind::SyntaxError, field, message};
        }

        static auto invalid_key(const String &field, const String &message) -> ConfigError {
            return ConfigError{ConfigErrorKind::InvalidKey, field, message};
        }

        static auto duplicate_peer(const String &field) -> ConfigError {
            return ConfigError{ConfigErrorKind::DuplicatePeer, field, String("public key already configured")};
        }

        static auto io(const String &field, const String &message) -> ConfigError {
            return ConfigError{ConfigErrorKind::Io, field, message};
        }

        static auto invalid_option(const String &field, const String &message) -> ConfigError {
            return ConfigError{ConfigErrorKind::InvalidOption, field, message};
        }

        static auto invalid_state(const String &message) -> ConfigError {
            return ConfigError{ConfigErrorKind::InvalidState, String("Tunnel"), message};
        }
    };

    // =============================================================================
    // KeyError - base64 key decoding
    // =============================================================================

    enum class KeyErrorKind : u8 {
        InvalidLength = 0,   // Decoded bytes are not exactly 32
        InvalidEncoding = 1, // Input is not valid base64
    };

    struct KeyError {
        KeyErrorKind kind = KeyErrorKind::InvalidEncoding;
        String message;

        [[nodiscard]] auto describe() const -> String {
            String out(kind == KeyErrorKind::InvalidLength ? "invalid_length" : "invalid_encoding");
            out += ": ";
            out += message;
            return out;
        }
    };

    // =============================================================================
    // SessionError - per-peer protocol session
    // =============================================================================

    enum class SessionErrorKind : u8 {
        NotEstablished = 0,  // No transport keys yet
        Expired = 1,         // Lifetime exceeded or session torn down
        HandshakeFailed = 2, // Peer handshake could not be authenticated
    };

    [[nodiscard]] inline auto session_error_kind_to_string(SessionErrorKind kind) -> const char * {
        switch (kind) {
        case SessionErrorKind::NotEstablished:
            return "not_established";
        case SessionErrorKind::Expired:
            return "expired";
        case SessionErrorKind::HandshakeFailed:
            return "handshake_failed";
        default:
            return "unknown";
        }
    }

    struct SessionError {
        SessionErrorKind kind = SessionErrorKind::NotEstablished;
        String message;

        [[nodiscard]] auto describe() const -> String {
            String out(session_error_kind_to_string(kind));
            if (!message.empty()) {
                out += ": ";
                out += message;
            }
            return out;
        }
    };

    // =============================================================================
    // TransportError - datagram socket
    // =============================================================================

    enum class TransportErrorKind : u8 {
        BindFailed = 0,
        SendFailed = 1,
        ReceiveFailed = 2,
    };

    [[nodiscard]] inline auto transport_error_kind_to_string(TransportErrorKind kind) -> const char * {
        switch (kind) {
        case TransportErrorKind::BindFailed:
            return "bind_failed";
        case TransportErrorKind::SendFailed:
            return "send_failed";
        case TransportErrorKind::ReceiveFailed:
            return "receive_failed";
        default:
            return "unknown";
        }
    }

    struct TransportError {
        TransportErrorKind kind = TransportErrorKind::ReceiveFailed;
        String message;

        [[nodiscard]] auto describe() const -> String {
            String out(transport_error_kind_to_string(kind));
            if (!message.empty()) {
                out += ": ";
                out += message;
            }
            return out;
        }
    };

} // namespace tunlink
