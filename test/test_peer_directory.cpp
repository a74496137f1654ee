/* SPDX-License-Identifier: MIT */
/*
 * Tunlink Peer Directory Tests
 */

#include <doctest/doctest.h>

#include "test_support.hpp"

using namespace tunlink;
using namespace tunlink::testing;
using namespace dp;

namespace {

    auto peer(u8 seed, const char *endpoint, u16 keepalive = 0) -> PeerConfig {
        PeerConfig p;
        p.public_key = make_key(seed);
        p.endpoint = String(endpoint);
        p.allowed_ips.push_back(String("10.0.0.") + to_str(seed) + "/32");
        p.persistent_keepalive = keepalive;
        return p;
    }

} // namespace

TEST_SUITE("PeerDirectory") {

    TEST_CASE("Resolve every configured key and nothing else") {
        Vector<PeerConfig> peers;
        peers.push_back(peer(1, "192.168.1.1:51820"));
        peers.push_back(peer(2, "192.168.1.2:51820", 25));
        peers.push_back(peer(3, "[2001:db8::3]:51820"));

        auto dir = net::PeerDirectory::build(peers);
        REQUIRE(dir.is_ok());
        CHECK(dir.value().size() == 3);

        for (const auto &p : peers) {
            auto policy = dir.value().resolve(p.public_key);
            REQUIRE(policy.has_value());
            CHECK(policy->public_key == p.public_key);
            CHECK(policy->allowed_ips == p.allowed_ips);
        }
        CHECK_FALSE(dir.value().resolve(make_key(99)).has_value());

        auto second = dir.value().resolve(make_key(2));
        CHECK(second->keepalive_secs == 25);
        CHECK(second->keepalive_ms() == 25000);
        CHECK(net::format_endpoint(second->endpoint) == "192.168.1.2:51820");
    }

    TEST_CASE("Keys keep declaration order") {
        Vector<PeerConfig> peers;
        peers.push_back(peer(7, "192.168.1.7:51820"));
        peers.push_back(peer(3, "192.168.1.3:51820"));

        auto dir = net::PeerDirectory::build(peers);
        REQUIRE(dir.is_ok());
        auto keys = dir.value().keys();
        REQUIRE(keys.size() == 2);
        CHECK(keys[0] == make_key(7));
        CHECK(keys[1] == make_key(3));
    }

    TEST_CASE("Unparsable endpoint is InvalidEndpoint naming the peer") {
        Vector<PeerConfig> peers;
        peers.push_back(peer(1, "192.168.1.1"));

        auto dir = net::PeerDirectory::build(peers);
        REQUIRE(dir.is_err());
        CHECK(dir.error().kind == ConfigErrorKind::InvalidEndpoint);
        CHECK(dir.error().field == crypto::encode(make_key(1)));
    }

    TEST_CASE("Duplicate key is DuplicatePeer") {
        Vector<PeerConfig> peers;
        peers.push_back(peer(1, "192.168.1.1:51820"));
        peers.push_back(peer(1, "192.168.1.2:51820"));

        auto dir = net::PeerDirectory::build(peers);
        REQUIRE(dir.is_err());
        CHECK(dir.error().kind == ConfigErrorKind::DuplicatePeer);
    }

    TEST_CASE("Lookup by endpoint and roaming") {
        Vector<PeerConfig> peers;
        peers.push_back(peer(1, "192.168.1.1:51820"));
        auto built = net::PeerDirectory::build(peers);
        REQUIRE(built.is_ok());
        auto dir = std::move(built.value());

        Endpoint original(IPv4Addr(192, 168, 1, 1), 51820);
        Endpoint roamed(IPv4Addr(198, 51, 100, 4), 40000);

        REQUIRE(dir.find_by_endpoint(original).has_value());
        CHECK(dir.find_by_endpoint(original).value() == make_key(1));
        CHECK_FALSE(dir.find_by_endpoint(roamed).has_value());

        CHECK(dir.update_endpoint(make_key(1), roamed));
        CHECK_FALSE(dir.update_endpoint(make_key(1), roamed));
        CHECK_FALSE(dir.update_endpoint(make_key(2), roamed));

        CHECK(dir.resolve(make_key(1))->endpoint == roamed);
        CHECK(dir.find_by_endpoint(roamed).has_value());
        CHECK_FALSE(dir.find_by_endpoint(original).has_value());
    }

    TEST_CASE("Empty peer list") {
        auto dir = net::PeerDirectory::build(Vector<PeerConfig>{});
        REQUIRE(dir.is_ok());
        CHECK(dir.value().empty());
    }
}
