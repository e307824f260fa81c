/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "keylightkit/core/exception.hpp"
#include "keylightkit/keylight/device_client.hpp"

#include "fake_accessory.test.hpp"

#include <catch2/catch_all.hpp>

namespace {

kl::keylight::DeviceState make_state(const bool on, const int brightness, const int temperature) {
    kl::keylight::DeviceState state;
    state.on = on;
    state.brightness = brightness;
    state.temperature = temperature;
    return state;
}

boost::json::value last_put_body(const kl::test::FakeAccessory& accessory) {
    const auto bodies = accessory.get_put_bodies();
    REQUIRE_FALSE(bodies.empty());
    return boost::json::parse(bodies.back());
}

}  // namespace

TEST_CASE("keylight | DeviceClient") {
    using namespace std::chrono_literals;

    kl::test::FakeAccessory accessory(make_state(false, 42, 200));
    kl::keylight::DeviceClient client(accessory.address(), accessory.port());

    SECTION("Default options") {
        REQUIRE(client.get_options().api_path == "/elgato/lights");
        REQUIRE(client.get_options().temperature_range == kl::keylight::k_default_temperature_range);
        REQUIRE(kl::keylight::DeviceClient::k_default_port == 9123);
    }

    SECTION("Get state") {
        const auto state = client.get_state();
        REQUIRE(state.has_value());
        REQUIRE(*state == make_state(false, 42, 200));
        REQUIRE(accessory.get_requests() == std::vector<std::string> {"GET /elgato/lights"});
    }

    SECTION("Set state") {
        const auto state = client.set_state(make_state(true, 80, 300));
        REQUIRE(state.has_value());
        REQUIRE(*state == make_state(true, 80, 300));
        REQUIRE(accessory.get_state() == make_state(true, 80, 300));

        const auto body = last_put_body(accessory);
        REQUIRE(body.at("numberOfLights") == 1);
        REQUIRE(body.at("lights").at(0).at("on") == 1);
        REQUIRE(body.at("lights").at(0).at("brightness") == 80);
        REQUIRE(body.at("lights").at(0).at("temperature") == 300);
    }

    SECTION("Values are clamped before they are sent") {
        const auto state = client.set_state(make_state(true, 150, 500));
        REQUIRE(state.has_value());

        const auto body = last_put_body(accessory);
        REQUIRE(body.at("lights").at(0).at("brightness") == 100);
        REQUIRE(body.at("lights").at(0).at("temperature") == 344);

        REQUIRE(client.set_state(make_state(true, -10, 10)).has_value());
        const auto low = last_put_body(accessory);
        REQUIRE(low.at("lights").at(0).at("brightness") == 0);
        REQUIRE(low.at("lights").at(0).at("temperature") == 143);
    }

    SECTION("Returns the state the accessory reports back") {
        accessory.set_brightness_adjustment(1);
        const auto state = client.set_state(make_state(true, 50, 200));
        REQUIRE(state.has_value());
        REQUIRE(state->brightness == 51);
    }

    SECTION("Toggle") {
        auto state = client.toggle();
        REQUIRE(state.has_value());
        REQUIRE(*state == make_state(true, 42, 200));
        REQUIRE(last_put_body(accessory).at("lights").at(0).at("on") == 1);
        REQUIRE(
            accessory.get_requests() == std::vector<std::string> {"GET /elgato/lights", "PUT /elgato/lights"}
        );

        state = client.toggle();
        REQUIRE(state.has_value());
        REQUIRE(*state == make_state(false, 42, 200));
        REQUIRE(last_put_body(accessory).at("lights").at(0).at("on") == 0);
    }

    SECTION("Set power") {
        REQUIRE(client.set_power(true)->on);
        REQUIRE(client.set_power(true)->on);
        REQUIRE_FALSE(client.set_power(false)->on);
        REQUIRE(accessory.get_state() == make_state(false, 42, 200));
        REQUIRE(accessory.get_put_bodies().size() == 3);
    }

    SECTION("Step brightness") {
        auto state = client.step_brightness(kl::keylight::Direction::up);
        REQUIRE(state.has_value());
        REQUIRE(state->brightness == 52);
        REQUIRE(state->temperature == 200);

        state = client.step_brightness(kl::keylight::Direction::down);
        REQUIRE(state.has_value());
        REQUIRE(state->brightness == 42);

        accessory.set_state(make_state(true, 95, 200));
        for (auto i = 0; i < 3; ++i) {
            state = client.step_brightness(kl::keylight::Direction::up);
            REQUIRE(state.has_value());
            REQUIRE(state->brightness == 100);
        }
    }

    SECTION("Step temperature") {
        auto state = client.step_temperature(kl::keylight::Direction::up);
        REQUIRE(state.has_value());
        REQUIRE(state->temperature == 220);
        REQUIRE(state->brightness == 42);

        accessory.set_state(make_state(true, 42, 150));
        state = client.step_temperature(kl::keylight::Direction::down);
        REQUIRE(state.has_value());
        REQUIRE(state->temperature == 143);
    }

    SECTION("Custom temperature range") {
        kl::keylight::DeviceClient::Options options;
        options.temperature_range = {150, 250};
        kl::keylight::DeviceClient narrow_client(accessory.address(), accessory.port(), options);

        const auto state = narrow_client.set_state(make_state(true, 50, 300));
        REQUIRE(state.has_value());
        REQUIRE(state->temperature == 250);
    }

    SECTION("Inverted temperature range is rejected") {
        kl::keylight::DeviceClient::Options options;
        options.temperature_range = {300, 200};
        REQUIRE_THROWS_AS(
            kl::keylight::DeviceClient(accessory.address(), accessory.port(), options), kl::Exception
        );

        const kl::keylight::Device device {"Light", accessory.address(), accessory.port()};
        REQUIRE_THROWS_AS(kl::keylight::DeviceClient(device, options), kl::Exception);

        options.temperature_range = {200, 200};
        REQUIRE_NOTHROW(kl::keylight::DeviceClient(accessory.address(), accessory.port(), options));
        REQUIRE(accessory.get_requests().empty());
    }

    SECTION("Malformed response") {
        accessory.set_canned_response(boost::beast::http::status::ok, R"({"numberOfLights":1,"lights":[]})");
        const auto state = client.get_state();
        REQUIRE_FALSE(state.has_value());
        REQUIRE(state.error().kind == kl::keylight::DeviceError::Kind::malformed_response);
    }

    SECTION("Response which isn't json") {
        accessory.set_canned_response(boost::beast::http::status::ok, "<html></html>");
        const auto state = client.get_state();
        REQUIRE_FALSE(state.has_value());
        REQUIRE(state.error().kind == kl::keylight::DeviceError::Kind::malformed_response);
    }

    SECTION("Reported temperature out of range") {
        accessory.set_state(make_state(true, 42, 400));
        const auto state = client.get_state();
        REQUIRE_FALSE(state.has_value());
        REQUIRE(state.error().kind == kl::keylight::DeviceError::Kind::malformed_response);
    }

    SECTION("Bad status") {
        accessory.set_canned_response(boost::beast::http::status::internal_server_error, "{}");
        const auto state = client.get_state();
        REQUIRE_FALSE(state.has_value());
        REQUIRE(state.error().kind == kl::keylight::DeviceError::Kind::bad_status);
        REQUIRE_THAT(state.error().message, Catch::Matchers::ContainsSubstring("500"));
    }

    SECTION("A failed read doesn't write") {
        accessory.set_canned_response(boost::beast::http::status::service_unavailable, "");
        const auto state = client.toggle();
        REQUIRE_FALSE(state.has_value());
        REQUIRE(state.error().kind == kl::keylight::DeviceError::Kind::bad_status);
        REQUIRE(accessory.get_requests() == std::vector<std::string> {"GET /elgato/lights"});
    }

    SECTION("The client can be used after a failure") {
        accessory.set_canned_response(boost::beast::http::status::internal_server_error, "{}");
        REQUIRE_FALSE(client.get_state().has_value());
        accessory.set_canned_response(
            boost::beast::http::status::ok, kl::keylight::to_json_string(make_state(true, 10, 300))
        );
        const auto state = client.get_state();
        REQUIRE(state.has_value());
        REQUIRE(state->brightness == 10);
    }
}

TEST_CASE("keylight | DeviceClient | Unreachable") {
    using namespace std::chrono_literals;

    SECTION("Connection refused") {
        boost::asio::io_context io_context;
        boost::asio::ip::tcp::acceptor acceptor(io_context, {boost::asio::ip::make_address("127.0.0.1"), 0});
        const auto endpoint = acceptor.local_endpoint();
        acceptor.close();

        kl::keylight::DeviceClient client(endpoint.address(), endpoint.port());
        const auto state = client.get_state();
        REQUIRE_FALSE(state.has_value());
        REQUIRE(state.error().kind == kl::keylight::DeviceError::Kind::unreachable);
    }

    SECTION("Accessory which never answers") {
        // Connections complete in the backlog but nothing is ever read or written
        boost::asio::io_context io_context;
        boost::asio::ip::tcp::acceptor acceptor(io_context, {boost::asio::ip::make_address("127.0.0.1"), 0});
        const auto endpoint = acceptor.local_endpoint();

        kl::keylight::DeviceClient::Options options;
        options.timeout = 200ms;
        kl::keylight::DeviceClient client(endpoint.address(), endpoint.port(), options);

        const auto start = std::chrono::steady_clock::now();
        const auto state = client.set_power(true);
        const auto elapsed = std::chrono::steady_clock::now() - start;

        REQUIRE_FALSE(state.has_value());
        REQUIRE(state.error().kind == kl::keylight::DeviceError::Kind::unreachable);
        REQUIRE(elapsed < 2s);
    }

    SECTION("From device") {
        const kl::keylight::Device device {"Light", boost::asio::ip::make_address("127.0.0.1"), 9};
        kl::keylight::DeviceClient::Options options;
        options.timeout = 500ms;
        kl::keylight::DeviceClient client(device, options);
        REQUIRE_FALSE(client.get_state().has_value());
    }
}
