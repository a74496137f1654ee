/* SPDX-License-Identifier: MIT */
/*
 * Tunlink Orchestrator Tests
 * Datagram routing, payload handling and housekeeping on an explicit clock
 */

#include <doctest/doctest.h>

#include "test_support.hpp"

using namespace tunlink;
using namespace tunlink::testing;
using namespace dp;

namespace {

    const PublicKey LOCAL = make_key(1);
    const PublicKey REMOTE = make_key(100);
    const PublicKey OTHER = make_key(200);

    auto init_from(const PublicKey &sender) -> Vector<u8> {
        Vector<u8> msg;
        msg.push_back(FAKE_INIT);
        for (usize i = 0; i < KEY_SIZE; ++i) {
            msg.push_back(sender.data[i]);
        }
        return msg;
    }

    // Orchestrator over fake engines, recording everything it emits
    struct Harness {
        Vector<net::Datagram> sent;
        Vector<runtime::TunnelEvent> events;
        RecordingSink sink;
        std::shared_ptr<FakeStats> stats = std::make_shared<FakeStats>();
        std::unique_ptr<runtime::Orchestrator> orch;
        Endpoint remote_ep = make_endpoint(2);

        explicit Harness(u16 keepalive = 0, TunnelOptions options = {}) {
            Vector<PeerConfig> peers;
            PeerConfig p;
            p.public_key = REMOTE;
            p.endpoint = String("10.0.0.2:51820");
            p.persistent_keepalive = keepalive;
            peers.push_back(p);

            auto dir = net::PeerDirectory::build(peers);
            REQUIRE(dir.is_ok());
            orch = std::make_unique<runtime::Orchestrator>(std::move(dir.value()), options, fake_factory(LOCAL, stats),
                                                           [this](net::Datagram dg) {
                                                               sent.push_back(std::move(dg));
                                                               return true;
                                                           });
            orch->set_sink(&sink);
            orch->set_event_hook([this](const runtime::TunnelEvent &e) { events.push_back(e); });
        }

        auto count(runtime::EventKind kind) const -> usize {
            usize n = 0;
            for (const auto &e : events) {
                if (e.kind == kind) {
                    ++n;
                }
            }
            return n;
        }

        auto first_index(runtime::EventKind kind) const -> Optional<usize> {
            for (usize i = 0; i < events.size(); ++i) {
                if (events[i].kind == kind) {
                    return i;
                }
            }
            return dp::nullopt;
        }

        // Peer initiates and confirms; leaves the session Established as responder
        auto establish_as_responder(u64 now) -> void {
            orch->handle_datagram(net::Datagram(init_from(REMOTE), remote_ep), now);
            orch->handle_datagram(net::Datagram(bytes({FAKE_TRANSPORT}), remote_ep), now);
            REQUIRE(orch->session_state(remote_ep).value() == SessionState::Established);
        }
    };

} // namespace

TEST_SUITE("Orchestrator - Inbound") {

    TEST_CASE("Peer handshake reaches Established before any plaintext is delivered") {
        Harness h;

        h.orch->handle_datagram(net::Datagram(init_from(REMOTE), h.remote_ep), 0);
        REQUIRE(h.sent.size() == 1);
        CHECK(h.sent[0].endpoint == h.remote_ep);
        CHECK(h.sent[0].data == bytes({FAKE_RESPONSE}));
        CHECK(h.orch->session_state(h.remote_ep).value() == SessionState::HandshakeInitiated);

        h.orch->handle_datagram(net::Datagram(bytes({FAKE_TRANSPORT}), h.remote_ep), 1);
        CHECK(h.orch->session_state(h.remote_ep).value() == SessionState::Established);

        Vector<u8> data = bytes({FAKE_TRANSPORT, 0x45, 0x00, 0x09});
        h.orch->handle_datagram(net::Datagram(data, h.remote_ep), 2);

        CHECK(h.count(runtime::EventKind::HandshakeComplete) == 1);
        CHECK(h.count(runtime::EventKind::PlaintextDelivered) == 1);
        REQUIRE(h.first_index(runtime::EventKind::HandshakeComplete).has_value());
        CHECK(h.first_index(runtime::EventKind::HandshakeComplete).value() <
              h.first_index(runtime::EventKind::PlaintextDelivered).value());

        auto packets = h.sink.packets();
        REQUIRE(packets.size() == 1);
        CHECK(packets[0].is_ipv4());
        CHECK(packets[0].data == ipv4_packet(0x09));
        CHECK(packets[0].source == h.remote_ep);
    }

    TEST_CASE("State changes are reported in order") {
        Harness h;
        h.establish_as_responder(0);

        Vector<runtime::TunnelEvent> changes;
        for (const auto &e : h.events) {
            if (e.kind == runtime::EventKind::StateChanged) {
                changes.push_back(e);
            }
        }
        REQUIRE(changes.size() == 2);
        CHECK(changes[0].from == SessionState::Idle);
        CHECK(changes[0].to == SessionState::HandshakeInitiated);
        CHECK(changes[1].from == SessionState::HandshakeInitiated);
        CHECK(changes[1].to == SessionState::Established);
        CHECK(h.events[0].kind == runtime::EventKind::SessionCreated);
    }

    TEST_CASE("IPv6 plaintext is delivered as V6") {
        Harness h;
        h.establish_as_responder(0);
        h.orch->handle_datagram(net::Datagram(bytes({FAKE_TRANSPORT, 0x60, 0x00, 0x01}), h.remote_ep), 1);
        auto packets = h.sink.packets();
        REQUIRE(packets.size() == 1);
        CHECK(packets[0].is_ipv6());
    }

    TEST_CASE("Garbage from an unknown endpoint leaves no session behind") {
        Harness h;
        Endpoint stranger = make_endpoint(77);
        h.orch->handle_datagram(net::Datagram(bytes({0x99, 0x01, 0x02}), stranger), 0);
        CHECK(h.orch->session_count() == 0);
        CHECK(h.sent.empty());
        CHECK(h.count(runtime::EventKind::Dropped) == 1);
        CHECK(h.count(runtime::EventKind::SessionRemoved) == 1);
    }

    TEST_CASE("Without a sink plaintext is counted and dropped") {
        metrics::global().reset();
        Harness h;
        h.orch->set_sink(nullptr);
        h.establish_as_responder(0);
        h.orch->handle_datagram(net::Datagram(bytes({FAKE_TRANSPORT, 0x45, 0x00, 0x01}), h.remote_ep), 1);
        CHECK(metrics::global().packets_dropped_no_sink.load() == 1);
        CHECK(metrics::global().packets_delivered.load() == 0);
        CHECK(h.count(runtime::EventKind::PlaintextDelivered) == 0);
    }

    TEST_CASE("Handshake from a new address roams the peer") {
        Harness h;
        Endpoint roamed = make_endpoint(50, 40000);

        h.orch->handle_datagram(net::Datagram(init_from(REMOTE), roamed), 0);
        h.orch->handle_datagram(net::Datagram(bytes({FAKE_TRANSPORT}), roamed), 1);
        CHECK(h.orch->session_state(roamed).value() == SessionState::Established);
        CHECK(h.orch->directory().resolve(REMOTE)->endpoint == roamed);

        h.sent.clear();
        CHECK(h.orch->handle_payload(REMOTE, ipv4_packet(3), 2));
        REQUIRE(h.sent.size() == 1);
        CHECK(h.sent[0].endpoint == roamed);
    }

    TEST_CASE("Roaming drops the session left at the old address") {
        Harness h(25);
        h.orch->prepare();
        h.orch->handle_tick(0);
        REQUIRE(h.orch->session_state(h.remote_ep).value() == SessionState::HandshakeInitiated);

        Endpoint roamed = make_endpoint(50, 40000);
        h.orch->handle_datagram(net::Datagram(init_from(REMOTE), roamed), 1);
        h.orch->handle_datagram(net::Datagram(bytes({FAKE_TRANSPORT}), roamed), 1);
        REQUIRE(h.orch->session_state(roamed).value() == SessionState::Established);

        CHECK(h.orch->session_count() == 1);
        CHECK_FALSE(h.orch->session_state(h.remote_ep).has_value());
        CHECK(h.count(runtime::EventKind::SessionRemoved) == 1);

        // Housekeeping only ever talks to the new address
        h.sent.clear();
        h.orch->handle_tick(30000);
        REQUIRE_FALSE(h.sent.empty());
        for (const auto &dg : h.sent) {
            CHECK(dg.endpoint == roamed);
        }
    }

    TEST_CASE("Expired session is reset before handling a new datagram") {
        TunnelOptions options;
        options.handshake_timeout_ms = 100;
        Harness h(0, options);

        h.orch->handle_datagram(net::Datagram(init_from(REMOTE), h.remote_ep), 0);
        h.orch->handle_tick(100);
        REQUIRE(h.orch->session_state(h.remote_ep).value() == SessionState::Expired);

        h.sent.clear();
        h.orch->handle_datagram(net::Datagram(init_from(REMOTE), h.remote_ep), 200);
        CHECK(h.orch->session_state(h.remote_ep).value() == SessionState::HandshakeInitiated);
        CHECK(h.sent.size() == 1);
    }
}

TEST_SUITE("Orchestrator - Outbound") {

    TEST_CASE("Payload for an unknown peer is dropped") {
        Harness h;
        CHECK_FALSE(h.orch->handle_payload(OTHER, ipv4_packet(1), 0));
        CHECK(h.sent.empty());
        CHECK(h.count(runtime::EventKind::Dropped) == 1);
    }

    TEST_CASE("Payload before establishment is dropped and starts a handshake") {
        metrics::global().reset();
        Harness h;
        CHECK_FALSE(h.orch->handle_payload(REMOTE, ipv4_packet(1), 0));
        CHECK(metrics::global().payloads_dropped_no_session.load() == 1);

        REQUIRE(h.sent.size() == 1);
        CHECK(h.sent[0].data[0] == FAKE_INIT);
        CHECK(h.sent[0].endpoint == h.remote_ep);
        CHECK(h.orch->session_state(h.remote_ep).value() == SessionState::HandshakeInitiated);

        // Response completes the handshake and the initiator confirms right away
        h.orch->handle_datagram(net::Datagram(bytes({FAKE_RESPONSE}), h.remote_ep), 5);
        CHECK(h.orch->session_state(h.remote_ep).value() == SessionState::Established);
        REQUIRE(h.sent.size() == 2);
        CHECK(h.sent[1].data == bytes({FAKE_TRANSPORT}));

        CHECK(h.orch->handle_payload(REMOTE, ipv4_packet(2), 6));
        REQUIRE(h.sent.size() == 3);
        CHECK(h.sent[2].data[0] == FAKE_TRANSPORT);
    }

    TEST_CASE("Outbound order is preserved per peer") {
        Harness h;
        h.establish_as_responder(0);
        h.sent.clear();
        for (u8 i = 0; i < 10; ++i) {
            CHECK(h.orch->handle_payload(REMOTE, ipv4_packet(i), 1));
        }
        REQUIRE(h.sent.size() == 10);
        for (u8 i = 0; i < 10; ++i) {
            CHECK(h.sent[i].data[3] == i);
        }
    }
}

TEST_SUITE("Orchestrator - Housekeeping") {

    TEST_CASE("prepare creates sessions only for keepalive peers") {
        Harness quiet;
        CHECK(quiet.orch->prepare() == 0);
        CHECK(quiet.orch->session_count() == 0);

        Harness keepalive(25);
        CHECK(keepalive.orch->prepare() == 1);
        CHECK(keepalive.orch->session_count() == 1);
        CHECK(keepalive.orch->next_tick_ms(0) == 0);

        CHECK(keepalive.orch->handle_tick(0) == 1);
        REQUIRE(keepalive.sent.size() == 1);
        CHECK(keepalive.sent[0].data[0] == FAKE_INIT);
    }

    TEST_CASE("Timed out responder sessions are removed") {
        TunnelOptions options;
        options.handshake_timeout_ms = 1000;
        Harness h(0, options);

        h.orch->handle_datagram(net::Datagram(init_from(REMOTE), h.remote_ep), 0);
        h.orch->handle_tick(1000);
        CHECK(h.orch->session_state(h.remote_ep).value() == SessionState::Expired);
        h.orch->handle_tick(1001);
        CHECK(h.orch->session_count() == 0);
        CHECK(h.count(runtime::EventKind::SessionRemoved) == 1);
    }

    TEST_CASE("Keepalive peers re-handshake after expiry") {
        TunnelOptions options;
        options.handshake_timeout_ms = 1000;
        options.max_handshake_attempts = 1;
        Harness h(25, options);

        h.orch->prepare();
        h.orch->handle_tick(0);
        h.orch->handle_tick(1000);
        REQUIRE(h.orch->session_state(h.remote_ep).value() == SessionState::Expired);

        h.sent.clear();
        h.orch->handle_tick(1001);
        CHECK(h.orch->session_state(h.remote_ep).value() == SessionState::HandshakeInitiated);
        REQUIRE(h.sent.size() == 1);
        CHECK(h.sent[0].data[0] == FAKE_INIT);
        CHECK(h.stats->resets == 1);
    }

    TEST_CASE("Persistent keepalive is sent on schedule") {
        Harness h(25);
        h.orch->prepare();
        h.orch->handle_tick(0);
        h.orch->handle_datagram(net::Datagram(bytes({FAKE_RESPONSE}), h.remote_ep), 0);
        REQUIRE(h.orch->session_state(h.remote_ep).value() == SessionState::Established);

        h.sent.clear();
        h.orch->handle_tick(24000);
        CHECK(h.sent.empty());
        h.orch->handle_tick(25000);
        REQUIRE(h.sent.size() == 1);
        CHECK(h.sent[0].data == bytes({FAKE_TRANSPORT}));
    }

    TEST_CASE("next_tick_ms never exceeds the housekeeping interval") {
        TunnelOptions options;
        options.housekeeping_interval_ms = 250;
        Harness h(0, options);
        CHECK(h.orch->next_tick_ms(0) == 250);
    }
}
