/* SPDX-License-Identifier: MIT */
/*
 * Tunlink Socket
 * Datagram socket seam and its netpipe UDP implementation
 */

#pragma once

#include <cerrno>
#include <mutex>

#include <datapod/datapod.hpp>
#include <echo/echo.hpp>
#include <netpipe/netpipe.hpp>
#include <tunlink/core/result.hpp>
#include <tunlink/core/time.hpp>
#include <tunlink/core/types.hpp>
#include <tunlink/net/endpoint.hpp>

namespace tunlink {

    using namespace dp;

    namespace net {

        // =============================================================================
        // Datagram
        // =============================================================================

        struct Datagram {
            Vector<u8> data;
            Endpoint endpoint; // Source when received, destination when sent

            Datagram() = default;
            Datagram(Vector<u8> d, const Endpoint &ep) : data(std::move(d)), endpoint(ep) {}

            auto members() noexcept { return std::tie(data, endpoint); }
            auto members() const noexcept { return std::tie(data, endpoint); }
        };

        // =============================================================================
        // Datagram Socket Interface
        // =============================================================================

        // recv_from is called only by the receiver task and send_to only by the sender task,
        // so implementations must tolerate one concurrent reader and one concurrent writer.
        // close() may run while the receiver is inside recv_from and must make it return.
        class DatagramSocket {
          public:
            virtual ~DatagramSocket() = default;

            // Returns the bound port
            virtual auto bind(const String &host, u16 port) -> Result<u16, TransportError> = 0;

            // Empty result means no datagram arrived within the socket's poll window, not an error
            virtual auto recv_from() -> Result<Optional<Datagram>, TransportError> = 0;

            // Returns the number of bytes handed to the network
            virtual auto send_to(const Vector<u8> &data, const Endpoint &ep) -> Result<usize, TransportError> = 0;

            virtual auto close() -> void = 0;
        };

        // =============================================================================
        // netpipe Endpoint Conversion
        // =============================================================================

        using UdpEndpoint = netpipe::UdpEndpoint;

        [[nodiscard]] inline auto to_udp_endpoint(const Endpoint &ep) -> UdpEndpoint {
            return UdpEndpoint{format_host(ep), ep.port};
        }

        [[nodiscard]] inline auto from_udp_endpoint(const UdpEndpoint &ep) -> Endpoint {
            String host = ep.host;
            if (!host.empty() && host[0] == '[') {
                usize end = host.find(']');
                if (end != String::npos) {
                    host = host.substr(1, end - 1);
                }
            }

            auto v4 = parse_ipv4_addr(host);
            if (v4.is_ok()) {
                return Endpoint(v4.value(), ep.port);
            }
            auto v6 = parse_ipv6_addr(host);
            if (v6.is_ok()) {
                return Endpoint(v6.value(), ep.port);
            }
            return Endpoint{};
        }

        // =============================================================================
        // Netpipe Socket
        // =============================================================================

        // errno values a non-blocking receive reports when the socket is merely idle
        [[nodiscard]] inline auto is_idle_receive_errno(int code) -> boolean {
            return code == 0 || code == EAGAIN || code == EWOULDBLOCK || code == EINTR || code == ETIMEDOUT;
        }

        // netpipe receives do not block, so an idle socket is polled every poll_interval_ms.
        class NetpipeSocket : public DatagramSocket {
          private:
            std::mutex mutex_;
            Optional<netpipe::UdpDatagram> socket_;
            u64 poll_interval_ms_;

          public:
            explicit NetpipeSocket(u64 poll_interval_ms = 5) : poll_interval_ms_(poll_interval_ms) {}
            ~NetpipeSocket() override { close(); }

            auto bind(const String &host, u16 port) -> Result<u16, TransportError> override {
                netpipe::UdpDatagram sock;
                auto bind_res = sock.bind(UdpEndpoint{host, port});
                if (bind_res.is_err()) {
                    String msg = host + ":" + to_str(port) + ": " + String(bind_res.error().message.c_str());
                    return result::err(TransportError{TransportErrorKind::BindFailed, msg});
                }
                std::lock_guard<std::mutex> lock(mutex_);
                socket_ = std::move(sock);
                echo::info("NetpipeSocket: bound ", host.c_str(), ":", port);
                return result::ok(port);
            }

            auto recv_from() -> Result<Optional<Datagram>, TransportError> override {
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    if (!socket_.has_value()) {
                        return result::err(
                            TransportError{TransportErrorKind::ReceiveFailed, String("socket not bound")});
                    }

                    errno = 0;
                    auto recv_res = socket_->recv_from();
                    if (recv_res.is_ok()) {
                        auto &[data, sender] = recv_res.value();
                        Endpoint source = from_udp_endpoint(sender);
                        if (!source.is_valid()) {
                            return result::err(TransportError{TransportErrorKind::ReceiveFailed,
                                                              String("unparsable source address ") + sender.host});
                        }
                        return result::ok(Optional<Datagram>(Datagram(std::move(data), source)));
                    }

                    int code = errno;
                    if (!is_idle_receive_errno(code)) {
                        return result::err(TransportError{TransportErrorKind::ReceiveFailed,
                                                          String(recv_res.error().message.c_str())});
                    }
                }

                // Nothing pending; sleep outside the lock so close() is never held up
                time::sleep_ms(poll_interval_ms_);
                return result::ok(Optional<Datagram>{});
            }

            auto send_to(const Vector<u8> &data, const Endpoint &ep) -> Result<usize, TransportError> override {
                std::lock_guard<std::mutex> lock(mutex_);
                if (!socket_.has_value()) {
                    return result::err(TransportError{TransportErrorKind::SendFailed, String("socket not bound")});
                }

                auto send_res = socket_->send_to(data, to_udp_endpoint(ep));
                if (send_res.is_err()) {
                    return result::err(
                        TransportError{TransportErrorKind::SendFailed, String(send_res.error().message.c_str())});
                }
                return result::ok(data.size());
            }

            auto close() -> void override {
                std::lock_guard<std::mutex> lock(mutex_);
                socket_.reset();
            }
        };

    } // namespace net

} // namespace tunlink
