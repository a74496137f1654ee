/* SPDX-License-Identifier: MIT */
/*
 * Tunlink Metrics
 * Atomic counters for tunnel runtime statistics
 */

#pragma once

#include <atomic>
#include <tunlink/core/types.hpp>

namespace tunlink {

    using namespace dp;

    namespace metrics {

        // =============================================================================
        // Metric Counters (thread-safe atomic counters)
        // =============================================================================

        struct Counters {
            // Handshake metrics
            std::atomic<u64> handshakes_initiated{0};
            std::atomic<u64> handshakes_completed{0};
            std::atomic<u64> handshakes_failed{0};
            std::atomic<u64> handshakes_timed_out{0};

            // Socket metrics
            std::atomic<u64> datagrams_sent{0};
            std::atomic<u64> datagrams_received{0};
            std::atomic<u64> send_errors{0};
            std::atomic<u64> receive_errors{0};
            std::atomic<u64> bytes_sent{0};
            std::atomic<u64> bytes_received{0};

            // Drop reasons
            std::atomic<u64> datagrams_dropped_oversize{0};
            std::atomic<u64> datagrams_dropped_invalid{0};
            std::atomic<u64> datagrams_dropped_replay{0};
            std::atomic<u64> payloads_dropped_no_session{0};
            std::atomic<u64> packets_dropped_no_sink{0};

            // Session metrics
            std::atomic<u64> sessions_created{0};
            std::atomic<u64> sessions_expired{0};
            std::atomic<u64> sessions_reset{0};

            // Plaintext handed to the downstream consumer
            std::atomic<u64> packets_delivered{0};

            Counters() = default;

            void reset() {
                handshakes_initiated.store(0);
                handshakes_completed.store(0);
                handshakes_failed.store(0);
                handshakes_timed_out.store(0);

                datagrams_sent.store(0);
                datagrams_received.store(0);
                send_errors.store(0);
                receive_errors.store(0);
                bytes_sent.store(0);
                bytes_received.store(0);

                datagrams_dropped_oversize.store(0);
                datagrams_dropped_invalid.store(0);
                datagrams_dropped_replay.store(0);
                payloads_dropped_no_session.store(0);
                packets_dropped_no_sink.store(0);

                sessions_created.store(0);
                sessions_expired.store(0);
                sessions_reset.store(0);

                packets_delivered.store(0);
            }
        };

        // =============================================================================
        // Global Metrics Instance
        // =============================================================================

        inline Counters &global() {
            static Counters instance;
            return instance;
        }

        // =============================================================================
        // Convenience increment functions
        // =============================================================================

        // Handshake
        inline void inc_handshakes_initiated() { global().handshakes_initiated.fetch_add(1); }
        inline void inc_handshakes_completed() { global().handshakes_completed.fetch_add(1); }
        inline void inc_handshakes_failed() { global().handshakes_failed.fetch_add(1); }
        inline void inc_handshakes_timed_out() { global().handshakes_timed_out.fetch_add(1); }

        // Socket
        inline void inc_datagrams_sent(u64 bytes) {
            global().datagrams_sent.fetch_add(1);
            global().bytes_sent.fetch_add(bytes);
        }
        inline void inc_datagrams_received(u64 bytes) {
            global().datagrams_received.fetch_add(1);
            global().bytes_received.fetch_add(bytes);
        }
        inline void inc_send_errors() { global().send_errors.fetch_add(1); }
        inline void inc_receive_errors() { global().receive_errors.fetch_add(1); }

        // Drops
        inline void inc_datagrams_dropped_oversize() { global().datagrams_dropped_oversize.fetch_add(1); }
        inline void inc_datagrams_dropped_invalid() { global().datagrams_dropped_invalid.fetch_add(1); }
        inline void inc_datagrams_dropped_replay() { global().datagrams_dropped_replay.fetch_add(1); }
        inline void inc_payloads_dropped_no_session() { global().payloads_dropped_no_session.fetch_add(1); }
        inline void inc_packets_dropped_no_sink() { global().packets_dropped_no_sink.fetch_add(1); }

        // Sessions
        inline void inc_sessions_created() { global().sessions_created.fetch_add(1); }
        inline void inc_sessions_expired() { global().sessions_expired.fetch_add(1); }
        inline void inc_sessions_reset() { global().sessions_reset.fetch_add(1); }

        inline void inc_packets_delivered() { global().packets_delivered.fetch_add(1); }

    } // namespace metrics

} // namespace tunlink
