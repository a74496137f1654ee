/* SPDX-License-Identifier: MIT */
/*
 * Tunlink Packet Sink
 * Downstream consumer for decrypted IP packets
 */

#pragma once

#include <functional>

#include <datapod/datapod.hpp>
#include <tunlink/core/types.hpp>

namespace tunlink {

    using namespace dp;

    namespace netdev {

        // =============================================================================
        // IP Packet
        // =============================================================================

        enum class IpVersion : u8 {
            V4 = 4,
            V6 = 6,
        };

        struct IpPacket {
            Vector<u8> data;
            IpVersion version = IpVersion::V4;
            Endpoint source; // Remote endpoint of the session that decrypted it

            IpPacket() = default;
            IpPacket(Vector<u8> d, IpVersion v, const Endpoint &src) : data(std::move(d)), version(v), source(src) {}

            [[nodiscard]] auto size() const -> usize { return data.size(); }
            [[nodiscard]] auto is_ipv4() const -> boolean { return version == IpVersion::V4; }
            [[nodiscard]] auto is_ipv6() const -> boolean { return version == IpVersion::V6; }

            auto members() noexcept { return std::tie(data, version, source); }
            auto members() const noexcept { return std::tie(data, version, source); }
        };

        // =============================================================================
        // Packet Sink Interface
        // =============================================================================

        // Called from the orchestration task only
        class PacketSink {
          public:
            virtual ~PacketSink() = default;

            virtual auto deliver(IpPacket packet) -> void = 0;
        };

        // Adapts a callable, handy for examples and tests
        class CallbackSink : public PacketSink {
          private:
            std::function<void(IpPacket)> callback_;

          public:
            explicit CallbackSink(std::function<void(IpPacket)> callback) : callback_(std::move(callback)) {}

            auto deliver(IpPacket packet) -> void override {
                if (callback_) {
                    callback_(std::move(packet));
                }
            }
        };

    } // namespace netdev

} // namespace tunlink
