/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "keylightkit/keylight/device.hpp"

#include <catch2/catch_all.hpp>

namespace {

kl::dnssd::ServiceRecord make_record(const std::string& name, const char* ip) {
    kl::dnssd::ServiceRecord record;
    record.hostname = name;
    record.service_type = "_elg._tcp";
    record.domain = "local";
    record.ip = boost::asio::ip::make_address(ip);
    record.port = 9123;
    return record;
}

}  // namespace

TEST_CASE("keylight | Device") {
    SECTION("From record") {
        const auto device = kl::keylight::Device::from_record(make_record("Elgato Key Light 8D7C", "192.168.0.92"));
        REQUIRE(device.name == "Elgato Key Light 8D7C");
        REQUIRE(device.ip == boost::asio::ip::make_address("192.168.0.92"));
        REQUIRE(device.port == 9123);
    }

    SECTION("From outcome") {
        REQUIRE(kl::keylight::Device::from_outcome(make_record("Light", "10.0.0.1")).has_value());

        kl::dnssd::UnresolvedService unresolved;
        unresolved.advertisement.hostname = "Light";
        REQUIRE_FALSE(kl::keylight::Device::from_outcome(unresolved).has_value());
    }

    SECTION("Url") {
        const kl::keylight::Device v4 {"Light", boost::asio::ip::make_address("192.168.0.92"), 9123};
        REQUIRE(v4.url().buffer() == "http://192.168.0.92:9123");

        const kl::keylight::Device v6 {"Light", boost::asio::ip::make_address("2001:db8::1"), 9123};
        REQUIRE(v6.url().buffer() == "http://[2001:db8::1]:9123");
        REQUIRE_FALSE(v6.is_scoped());
    }

    SECTION("Link-local address keeps its scope in the endpoint") {
        auto link_local = boost::asio::ip::make_address_v6("fe80::3e6a:9dff:fe21:b16e");
        link_local.scope_id(3);
        const kl::keylight::Device device {"Light", link_local, 9123};

        REQUIRE(device.is_scoped());
        REQUIRE(device.url().buffer() == "http://[fe80::3e6a:9dff:fe21:b16e]:9123");

        const auto endpoint = device.endpoint();
        REQUIRE(endpoint.port() == 9123);
        REQUIRE(endpoint.address().is_v6());
        REQUIRE(endpoint.address().to_v6().scope_id() == 3);
    }

    SECTION("Unique devices") {
        kl::dnssd::UnresolvedService unresolved;
        unresolved.advertisement.hostname = "Light C";

        const std::vector<kl::dnssd::DiscoveryOutcome> outcomes {
            make_record("Light A", "192.168.0.10"),
            make_record("Light B", "192.168.0.11"),
            unresolved,
            make_record("Light A", "fe80::1"),
        };

        const auto devices = kl::keylight::unique_devices(outcomes);
        REQUIRE(devices.size() == 2);
        REQUIRE(devices[0].name == "Light A");
        REQUIRE(devices[0].ip == boost::asio::ip::make_address("192.168.0.10"));
        REQUIRE(devices[1].name == "Light B");
    }
}
