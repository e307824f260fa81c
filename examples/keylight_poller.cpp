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
#include "keylightkit/dnssd/background_poller.hpp"
#include "keylightkit/keylight/device.hpp"

#include <CLI/App.hpp>
#include <CLI/Config.hpp>
#include <CLI/Formatter.hpp>

#include <iostream>
#include <thread>

/**
 * This example keeps discovering accessories in the background and logs what it finds.
 */

int main(int const argc, char* argv[]) {
    kl::set_log_level_from_env();

    CLI::App app {"Key light discovery poller"};
    argv = app.ensure_utf8(argv);

    int interval_ms = 5000;
    app.add_option("--interval", interval_ms, "Time between discovery passes in milliseconds")->capture_default_str();

    CLI11_PARSE(app, argc, argv);

    const auto browser = kl::dnssd::Browser::create();
    if (browser == nullptr) {
        std::cerr << "No browser implementation available for this platform" << std::endl;
        return 1;
    }

    boost::asio::io_context io_context;  // NOLINT
    auto work_guard = boost::asio::make_work_guard(io_context);

    kl::dnssd::BackgroundPoller::Options options;
    options.interval = std::chrono::milliseconds(interval_ms);
    kl::dnssd::BackgroundPoller poller(*browser, options);

    poller.start(io_context, [](const kl::dnssd::DiscoveryResult& result) {
        if (!result) {
            KL_ERROR("Discovery unavailable: {}", result.error().message);
            return;
        }
        const auto devices = kl::keylight::unique_devices(*result);
        KL_INFO("Found {} device(s)", devices.size());
        for (const auto& device : devices) {
            KL_INFO("{} => {}", device.name, std::string(device.url().buffer()));
        }
    });

    std::thread io_context_thread([&io_context] {
        io_context.run();
    });

    std::cout << "Press enter to exit..." << std::endl;
    std::cin.get();

    poller.stop();
    io_context.stop();
    io_context_thread.join();

    std::cout << "Exit" << std::endl;

    return 0;
}
