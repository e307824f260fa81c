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
#include "keylightkit/dnssd/dnssd_browser.hpp"
#include "keylightkit/keylight/device.hpp"

#include <CLI/App.hpp>
#include <CLI/Config.hpp>
#include <CLI/Formatter.hpp>

#include <iostream>

/**
 * This example runs a single discovery pass and prints the accessories found on the local network.
 */

int main(int const argc, char* argv[]) {
    kl::set_log_level_from_env();

    CLI::App app {"Key light discovery"};
    argv = app.ensure_utf8(argv);

    std::string service_type = kl::dnssd::k_keylight_service_type;
    app.add_option("--service-type", service_type, "The service type to browse for")->capture_default_str();

    int timeout_ms = 5000;
    app.add_option("--timeout", timeout_ms, "Discovery timeout in milliseconds")->capture_default_str();

    bool verbose = false;
    app.add_flag("-v,--verbose", verbose, "Also print the services which could not be resolved");

    CLI11_PARSE(app, argc, argv);

    const auto browser = kl::dnssd::Browser::create();
    if (browser == nullptr) {
        std::cerr << "No browser implementation available for this platform" << std::endl;
        return 1;
    }

    const auto result = browser->discover(service_type, std::chrono::milliseconds(timeout_ms));
    if (!result) {
        std::cerr << "Discovery unavailable: " << result.error().message << std::endl;
        return 1;
    }

    for (const auto& device : kl::keylight::unique_devices(*result)) {
        if (device.is_scoped()) {
            // The url can't carry the zone, print the endpoint as well
            std::cout << device.name << " => " << device.url().buffer() << " (" << device.endpoint() << ")"
                      << std::endl;
        } else {
            std::cout << device.name << " => " << device.url().buffer() << std::endl;
        }
    }

    if (verbose) {
        for (const auto& record : kl::dnssd::resolved_records(*result)) {
            std::cout << kl::dnssd::to_string(record) << std::endl;
        }
        for (const auto& unresolved : kl::dnssd::unresolved_services(*result)) {
            std::cout << "Unresolved: " << kl::dnssd::to_string(unresolved.advertisement) << " (" << unresolved.reason
                      << ")" << std::endl;
        }
    }

    return 0;
}
