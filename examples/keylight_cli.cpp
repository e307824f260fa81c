/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "keylightkit/core/log.hpp"
#include "keylightkit/keylight/device_client.hpp"

#include <CLI/App.hpp>
#include <CLI/Config.hpp>
#include <CLI/Formatter.hpp>

#include <iostream>
#include <optional>

/**
 * This example controls a single accessory given its address.
 */

int main(int const argc, char* argv[]) {
    kl::set_log_level_from_env();

    CLI::App app {"Key light controller"};
    argv = app.ensure_utf8(argv);

    std::string host;
    app.add_option("--host", host, "The IP address of the accessory")->required();

    uint16_t port = kl::keylight::DeviceClient::k_default_port;
    app.add_option("--port", port, "The port of the control endpoint")->capture_default_str();

    int timeout_ms = 5000;
    app.add_option("--timeout", timeout_ms, "Timeout per request phase in milliseconds")->capture_default_str();

    app.require_subcommand(1);
    auto* status_cmd = app.add_subcommand("status", "Print on/off, brightness and temperature");
    auto* on_cmd = app.add_subcommand("on", "Switch on");
    auto* off_cmd = app.add_subcommand("off", "Switch off");
    auto* toggle_cmd = app.add_subcommand("toggle", "Toggle on/off");
    auto* incr_brightness_cmd = app.add_subcommand("incr-brightness", "Increase brightness by 10%");
    auto* decr_brightness_cmd = app.add_subcommand("decr-brightness", "Decrease brightness by 10%");
    auto* incr_temperature_cmd = app.add_subcommand("incr-temperature", "Increase temperature by 10%");
    auto* decr_temperature_cmd = app.add_subcommand("decr-temperature", "Decrease temperature by 10%");

    auto* set_cmd = app.add_subcommand("set", "Set brightness and/or temperature");
    std::optional<int> brightness;
    std::optional<int> temperature;
    set_cmd->add_option("-b,--brightness", brightness, "Brightness in percent [0, 100]");
    set_cmd->add_option("-t,--temperature", temperature, "Temperature in mireds [143, 344]");
    set_cmd->require_option(1, 0);

    CLI11_PARSE(app, argc, argv);

    boost::system::error_code ec;
    const auto address = boost::asio::ip::make_address(host, ec);
    if (ec) {
        std::cerr << "Invalid address: " << host << std::endl;
        return 1;
    }

    kl::keylight::DeviceClient::Options options;
    options.timeout = std::chrono::milliseconds(timeout_ms);
    kl::keylight::DeviceClient client(address, port, options);

    tl::expected<kl::keylight::DeviceState, kl::keylight::DeviceError> result;

    if (status_cmd->parsed()) {
        result = client.get_state();
    } else if (on_cmd->parsed()) {
        result = client.set_power(true);
    } else if (off_cmd->parsed()) {
        result = client.set_power(false);
    } else if (toggle_cmd->parsed()) {
        result = client.toggle();
    } else if (incr_brightness_cmd->parsed()) {
        result = client.step_brightness(kl::keylight::Direction::up);
    } else if (decr_brightness_cmd->parsed()) {
        result = client.step_brightness(kl::keylight::Direction::down);
    } else if (incr_temperature_cmd->parsed()) {
        result = client.step_temperature(kl::keylight::Direction::up);
    } else if (decr_temperature_cmd->parsed()) {
        result = client.step_temperature(kl::keylight::Direction::down);
    } else if (set_cmd->parsed()) {
        result = client.get_state().and_then([&](kl::keylight::DeviceState state) {
            state.brightness = brightness.value_or(state.brightness);
            state.temperature = temperature.value_or(state.temperature);
            return client.set_state(state);
        });
    }

    if (!result) {
        std::cerr << kl::keylight::to_string(result.error().kind) << ": " << result.error().message << std::endl;
        return 1;
    }

    std::cout << kl::keylight::to_string(*result) << std::endl;
    return 0;
}
