/* SPDX-License-Identifier: MIT */
/*
 * Tunlink Keylock Engine Tests
 * Two real engines performing the handshake and exchanging transport datagrams
 */

#include <doctest/doctest.h>

#include "test_support.hpp"

using namespace tunlink;
using namespace tunlink::testing;
using namespace dp;

namespace {

    struct KeyPairs {
        PrivateKey a_priv;
        PublicKey a_pub;
        PrivateKey b_priv;
        PublicKey b_pub;
    };

    auto make_key_pairs() -> KeyPairs {
        KeyPairs p;
        auto [ap, au] = crypto::generate_keypair();
        auto [bp, bu] = crypto::generate_keypair();
        p.a_priv = ap;
        p.a_pub = au;
        p.b_priv = bp;
        p.b_pub = bu;
        return p;
    }

    auto allow_only(const PublicKey &key) -> session::PeerAuthorizer {
        return [key](const PublicKey &candidate) { return candidate == key; };
    }

    // Runs init -> response -> confirmation; initiator `a`, responder `b`
    auto handshake(session::KeylockEngine &a, session::KeylockEngine &b) -> void {
        auto init = a.initiate();
        REQUIRE(init.is_ok());
        CHECK(init.value().size() == session::INIT_SIZE);

        auto resp = b.decapsulate(init.value());
        REQUIRE(resp.action == session::EngineAction::SendToNetwork);
        CHECK(resp.authenticated);
        CHECK(resp.data.size() == session::RESPONSE_SIZE);

        auto done = a.decapsulate(resp.data);
        REQUIRE(done.action == session::EngineAction::HandshakeComplete);

        auto confirm = a.encapsulate(Vector<u8>{});
        REQUIRE(confirm.is_ok());
        auto b_done = b.decapsulate(confirm.value());
        REQUIRE(b_done.action == session::EngineAction::HandshakeComplete);
    }

} // namespace

TEST_SUITE("KeylockEngine - Handshake") {

    TEST_CASE("Full handshake and data in both directions") {
        auto k = make_key_pairs();
        session::KeylockEngine a(k.a_priv, k.b_pub, allow_only(k.b_pub));
        session::KeylockEngine b(k.b_priv, dp::nullopt, allow_only(k.a_pub));

        CHECK_FALSE(b.peer_key().has_value());
        handshake(a, b);
        REQUIRE(b.peer_key().has_value());
        CHECK(b.peer_key().value() == k.a_pub);

        auto ct = a.encapsulate(ipv4_packet(0x11));
        REQUIRE(ct.is_ok());
        auto got = b.decapsulate(ct.value());
        CHECK(got.action == session::EngineAction::DeliverV4);
        CHECK(got.data == ipv4_packet(0x11));

        auto back = b.encapsulate(ipv6_packet(0x22));
        REQUIRE(back.is_ok());
        auto got_back = a.decapsulate(back.value());
        CHECK(got_back.action == session::EngineAction::DeliverV6);
        CHECK(got_back.data == ipv6_packet(0x22));
    }

    TEST_CASE("Keepalives are authenticated but deliver nothing") {
        auto k = make_key_pairs();
        session::KeylockEngine a(k.a_priv, k.b_pub, nullptr);
        session::KeylockEngine b(k.b_priv, dp::nullopt, nullptr);
        handshake(a, b);

        auto ka = a.encapsulate(Vector<u8>{});
        REQUIRE(ka.is_ok());
        CHECK(ka.value().size() == session::TRANSPORT_MIN_SIZE);
        auto res = b.decapsulate(ka.value());
        CHECK(res.action == session::EngineAction::NoAction);
        CHECK(res.authenticated);
    }

    TEST_CASE("Unauthorized initiator is ignored") {
        auto k = make_key_pairs();
        session::KeylockEngine a(k.a_priv, k.b_pub, nullptr);
        session::KeylockEngine b(k.b_priv, dp::nullopt, allow_only(make_key(9)));

        auto init = a.initiate();
        REQUIRE(init.is_ok());
        auto res = b.decapsulate(init.value());
        CHECK(res.action == session::EngineAction::NoAction);
        CHECK_FALSE(b.peer_key().has_value());
    }

    TEST_CASE("Init for a different responder fails authentication") {
        auto k = make_key_pairs();
        auto [c_priv, c_pub] = crypto::generate_keypair();
        session::KeylockEngine a(k.a_priv, c_pub, nullptr);
        session::KeylockEngine b(k.b_priv, dp::nullopt, nullptr);

        auto init = a.initiate();
        REQUIRE(init.is_ok());
        auto res = b.decapsulate(init.value());
        CHECK(res.action == session::EngineAction::NoAction);
        CHECK_FALSE(res.authenticated);
    }

    TEST_CASE("Replayed init is dropped") {
        auto k = make_key_pairs();
        session::KeylockEngine a(k.a_priv, k.b_pub, nullptr);
        session::KeylockEngine b(k.b_priv, dp::nullopt, nullptr);

        auto init = a.initiate();
        REQUIRE(init.is_ok());
        REQUIRE(b.decapsulate(init.value()).action == session::EngineAction::SendToNetwork);
        CHECK(b.decapsulate(init.value()).action == session::EngineAction::NoAction);
    }

    TEST_CASE("Tampered init is dropped") {
        auto k = make_key_pairs();
        session::KeylockEngine a(k.a_priv, k.b_pub, nullptr);
        session::KeylockEngine b(k.b_priv, dp::nullopt, nullptr);

        auto init = a.initiate();
        REQUIRE(init.is_ok());
        auto bad = init.value();
        bad[bad.size() - 20] ^= 0x01;
        CHECK(b.decapsulate(bad).action == session::EngineAction::NoAction);
    }

    TEST_CASE("Response is accepted only while waiting for one") {
        auto k = make_key_pairs();
        session::KeylockEngine a(k.a_priv, k.b_pub, nullptr);
        session::KeylockEngine b(k.b_priv, dp::nullopt, nullptr);

        auto init = a.initiate();
        auto resp = b.decapsulate(init.value());
        REQUIRE(resp.action == session::EngineAction::SendToNetwork);
        REQUIRE(a.decapsulate(resp.data).action == session::EngineAction::HandshakeComplete);
        CHECK(a.decapsulate(resp.data).action == session::EngineAction::NoAction);
    }

    TEST_CASE("Simultaneous initiation converges on one handshake") {
        auto k = make_key_pairs();
        session::KeylockEngine a(k.a_priv, k.b_pub, nullptr);
        session::KeylockEngine b(k.b_priv, k.a_pub, nullptr);

        auto init_a = a.initiate();
        auto init_b = b.initiate();
        REQUIRE(init_a.is_ok());
        REQUIRE(init_b.is_ok());

        auto at_b = b.decapsulate(init_a.value());
        auto at_a = a.decapsulate(init_b.value());

        // Exactly one side yields and answers
        boolean b_answers = at_b.action == session::EngineAction::SendToNetwork;
        boolean a_answers = at_a.action == session::EngineAction::SendToNetwork;
        CHECK(b_answers != a_answers);

        auto &initiator = b_answers ? a : b;
        auto &responder = b_answers ? b : a;
        const auto &response = b_answers ? at_b.data : at_a.data;

        REQUIRE(initiator.decapsulate(response).action == session::EngineAction::HandshakeComplete);
        auto confirm = initiator.encapsulate(Vector<u8>{});
        REQUIRE(confirm.is_ok());
        CHECK(responder.decapsulate(confirm.value()).action == session::EngineAction::HandshakeComplete);
    }

    TEST_CASE("Initiate without a peer key fails") {
        auto [priv, pub] = crypto::generate_keypair();
        session::KeylockEngine e(priv, dp::nullopt, nullptr);
        auto res = e.initiate();
        REQUIRE(res.is_err());
        CHECK(res.error().kind == SessionErrorKind::HandshakeFailed);
    }
}

TEST_SUITE("KeylockEngine - Transport") {

    TEST_CASE("Encapsulate before the handshake is NotEstablished") {
        auto k = make_key_pairs();
        session::KeylockEngine a(k.a_priv, k.b_pub, nullptr);
        auto res = a.encapsulate(ipv4_packet(1));
        REQUIRE(res.is_err());
        CHECK(res.error().kind == SessionErrorKind::NotEstablished);
    }

    TEST_CASE("Replayed transport datagram is dropped") {
        auto k = make_key_pairs();
        session::KeylockEngine a(k.a_priv, k.b_pub, nullptr);
        session::KeylockEngine b(k.b_priv, dp::nullopt, nullptr);
        handshake(a, b);

        auto ct = a.encapsulate(ipv4_packet(1));
        REQUIRE(ct.is_ok());
        CHECK(b.decapsulate(ct.value()).action == session::EngineAction::DeliverV4);
        auto again = b.decapsulate(ct.value());
        CHECK(again.action == session::EngineAction::NoAction);
        CHECK_FALSE(again.authenticated);
    }

    TEST_CASE("Out of order delivery within the window") {
        auto k = make_key_pairs();
        session::KeylockEngine a(k.a_priv, k.b_pub, nullptr);
        session::KeylockEngine b(k.b_priv, dp::nullopt, nullptr);
        handshake(a, b);

        auto first = a.encapsulate(ipv4_packet(1)).value();
        auto second = a.encapsulate(ipv4_packet(2)).value();
        CHECK(b.decapsulate(second).action == session::EngineAction::DeliverV4);
        CHECK(b.decapsulate(first).action == session::EngineAction::DeliverV4);
    }

    TEST_CASE("Forged transport datagram does not poison the window") {
        auto k = make_key_pairs();
        session::KeylockEngine a(k.a_priv, k.b_pub, nullptr);
        session::KeylockEngine b(k.b_priv, dp::nullopt, nullptr);
        handshake(a, b);

        auto real = a.encapsulate(ipv4_packet(1)).value();
        auto forged = real;
        forged[forged.size() - 1] ^= 0xFF;
        CHECK(b.decapsulate(forged).action == session::EngineAction::NoAction);
        CHECK(b.decapsulate(real).action == session::EngineAction::DeliverV4);
    }

    TEST_CASE("Non-IP plaintext is dropped") {
        auto k = make_key_pairs();
        session::KeylockEngine a(k.a_priv, k.b_pub, nullptr);
        session::KeylockEngine b(k.b_priv, dp::nullopt, nullptr);
        handshake(a, b);

        auto ct = a.encapsulate(bytes({0x10, 0x20}));
        REQUIRE(ct.is_ok());
        auto res = b.decapsulate(ct.value());
        CHECK(res.action == session::EngineAction::NoAction);
        CHECK(res.authenticated);
    }

    TEST_CASE("Reset drops transport keys") {
        auto k = make_key_pairs();
        session::KeylockEngine a(k.a_priv, k.b_pub, nullptr);
        session::KeylockEngine b(k.b_priv, dp::nullopt, nullptr);
        handshake(a, b);

        auto ct = a.encapsulate(ipv4_packet(1)).value();
        b.reset();
        CHECK(b.decapsulate(ct).action == session::EngineAction::NoAction);
        CHECK(b.encapsulate(ipv4_packet(2)).is_err());
    }

    TEST_CASE("Unknown message types and short datagrams are ignored") {
        auto [priv, pub] = crypto::generate_keypair();
        session::KeylockEngine e(priv, dp::nullopt, nullptr);
        CHECK(e.decapsulate(Vector<u8>{}).action == session::EngineAction::NoAction);
        CHECK(e.decapsulate(bytes({0x09, 0x00})).action == session::EngineAction::NoAction);
        CHECK(e.decapsulate(bytes({session::MSG_HANDSHAKE_INIT, 0x00})).action == session::EngineAction::NoAction);
        CHECK(e.decapsulate(bytes({session::MSG_TRANSPORT, 0x00})).action == session::EngineAction::NoAction);
    }
}
