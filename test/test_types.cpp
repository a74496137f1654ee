/* SPDX-License-Identifier: MIT */
/*
 * Tunlink Core Types Tests
 */

#include <doctest/doctest.h>

#include <tunlink/tunlink.hpp>

using namespace tunlink;
using namespace dp;

TEST_SUITE("Core Types") {

    TEST_CASE("PublicKey") {
        PublicKey key;
        CHECK(key.is_zero());

        key.data[0] = 0x42;
        CHECK_FALSE(key.is_zero());

        PublicKey other;
        other.data[0] = 0x42;
        CHECK(key == other);

        other.data[31] = 0x01;
        CHECK(key != other);
    }

    TEST_CASE("PrivateKey wipes the source on move") {
        PrivateKey key;
        key.data[0] = 0x11;
        key.data[31] = 0x22;

        PrivateKey moved(std::move(key));
        CHECK(moved.data[0] == 0x11);
        CHECK(moved.data[31] == 0x22);
        CHECK(key.is_zero());

        PrivateKey assigned;
        assigned = std::move(moved);
        CHECK(assigned.data[0] == 0x11);
        CHECK(moved.is_zero());
    }

    TEST_CASE("PrivateKey copy keeps both") {
        PrivateKey key;
        key.data[5] = 0x99;
        PrivateKey copy(key);
        CHECK(copy == key);
        CHECK_FALSE(key.is_zero());
    }

    TEST_CASE("Endpoint equality and validity") {
        Endpoint a(IPv4Addr(192, 168, 1, 1), 51820);
        Endpoint b(IPv4Addr(192, 168, 1, 1), 51820);
        Endpoint c(IPv4Addr(192, 168, 1, 1), 51821);

        CHECK(a == b);
        CHECK(a != c);
        CHECK(a.is_valid());
        CHECK(a.is_ipv4());
        CHECK_FALSE(a.is_ipv6());

        Endpoint none;
        CHECK_FALSE(none.is_valid());

        Endpoint zero_port(IPv4Addr(10, 0, 0, 1), 0);
        CHECK_FALSE(zero_port.is_valid());
    }

    TEST_CASE("Endpoint families never compare equal") {
        IPv6Addr v6;
        Endpoint a(v6, 51820);
        Endpoint b(IPv4Addr(0, 0, 0, 0), 51820);
        CHECK(a != b);
    }

    TEST_CASE("Hashers distinguish keys and endpoints") {
        datapod::Hasher<PublicKey> key_hash;
        PublicKey a;
        PublicKey b;
        b.data[0] = 1;
        CHECK(key_hash(a) != key_hash(b));
        CHECK(key_hash(a) == key_hash(PublicKey{}));

        datapod::Hasher<Endpoint> ep_hash;
        Endpoint e1(IPv4Addr(10, 0, 0, 1), 1000);
        Endpoint e2(IPv4Addr(10, 0, 0, 1), 1001);
        CHECK(ep_hash(e1) != ep_hash(e2));
    }

    TEST_CASE("SessionState names") {
        CHECK(String(session_state_to_string(SessionState::Idle)) == "idle");
        CHECK(String(session_state_to_string(SessionState::HandshakeInitiated)) == "handshake_initiated");
        CHECK(String(session_state_to_string(SessionState::Established)) == "established");
        CHECK(String(session_state_to_string(SessionState::Expired)) == "expired");
    }

    TEST_CASE("parse_u16") {
        CHECK(parse_u16("0").value() == 0);
        CHECK(parse_u16("51820").value() == 51820);
        CHECK(parse_u16("65535").value() == 65535);
        CHECK_FALSE(parse_u16("65536").has_value());
        CHECK_FALSE(parse_u16("").has_value());
        CHECK_FALSE(parse_u16("-1").has_value());
        CHECK_FALSE(parse_u16("12ab").has_value());
        CHECK_FALSE(parse_u16("123456").has_value());
    }

    TEST_CASE("to_str") {
        CHECK(to_str(static_cast<u16>(0)) == "0");
        CHECK(to_str(static_cast<u16>(51820)) == "51820");
        CHECK(to_str(static_cast<u64>(18446744073709551615ULL)) == "18446744073709551615");
    }
}

TEST_SUITE("Core - Errors") {

    TEST_CASE("ConfigError describe names the field") {
        auto e = ConfigError::missing_field("PrivateKey");
        CHECK(e.kind == ConfigErrorKind::MissingField);
        CHECK(e.field == "PrivateKey");
        String text = e.describe();
        CHECK(text.find("missing_field") != String::npos);
        CHECK(text.find("PrivateKey") != String::npos);
    }

    TEST_CASE("SessionError and TransportError describe") {
        SessionError s{SessionErrorKind::NotEstablished, String("no keys")};
        CHECK(s.describe() == "not_established: no keys");

        TransportError t{TransportErrorKind::BindFailed, String("in use")};
        CHECK(t.describe() == "bind_failed: in use");
    }
}

TEST_SUITE("Core - Time") {

    TEST_CASE("now_ms increases") {
        u64 a = time::now_ms();
        time::sleep_ms(5);
        u64 b = time::now_ms();
        CHECK(b >= a);
    }

    TEST_CASE("elapsed_ms never underflows") {
        CHECK(time::elapsed_ms(100, 250) == 150);
        CHECK(time::elapsed_ms(250, 100) == 0);
    }

    TEST_CASE("IntervalTimer") {
        IntervalTimer timer(1000, 5000);
        CHECK_FALSE(timer.should_tick(5500));
        CHECK(timer.remaining_ms(5500) == 500);
        CHECK(timer.should_tick(6000));
        CHECK(timer.remaining_ms(6000) == 1000);
        CHECK_FALSE(timer.should_tick(6999));
    }
}

TEST_SUITE("Core - Metrics") {

    TEST_CASE("Datagram counters track bytes") {
        metrics::global().reset();
        metrics::inc_datagrams_sent(100);
        metrics::inc_datagrams_sent(50);
        metrics::inc_datagrams_received(7);

        CHECK(metrics::global().datagrams_sent.load() == 2);
        CHECK(metrics::global().bytes_sent.load() == 150);
        CHECK(metrics::global().datagrams_received.load() == 1);
        CHECK(metrics::global().bytes_received.load() == 7);

        metrics::global().reset();
        CHECK(metrics::global().bytes_sent.load() == 0);
    }
}
