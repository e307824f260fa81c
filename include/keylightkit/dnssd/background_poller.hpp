/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#pragma once

#include "dnssd_browser.hpp"

#include <boost/asio/io_context.hpp>

#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <mutex>

namespace kl::dnssd {

/**
 * Periodically runs a discovery pass on a worker thread and publishes each result to a consumer. The consumer
 * receives results on its own io_context, so the callback never runs on the worker thread.
 */
class BackgroundPoller {
  public:
    using Callback = std::function<void(const DiscoveryResult& result)>;

    struct Options {
        std::string service_type {k_keylight_service_type};
        std::chrono::milliseconds interval {std::chrono::seconds(5)};
        std::chrono::milliseconds discover_timeout {std::chrono::seconds(3)};
    };

    /**
     * Constructs a poller. The browser must outlive the poller.
     * @param browser The browser to discover with.
     */
    explicit BackgroundPoller(Browser& browser);

    /**
     * Constructs a poller. The browser must outlive the poller.
     * @param browser The browser to discover with.
     * @param options The options to poll with.
     */
    BackgroundPoller(Browser& browser, Options options);

    ~BackgroundPoller();

    BackgroundPoller(const BackgroundPoller&) = delete;
    BackgroundPoller& operator=(const BackgroundPoller&) = delete;

    BackgroundPoller(BackgroundPoller&&) = delete;
    BackgroundPoller& operator=(BackgroundPoller&&) = delete;

    /**
     * Starts polling. The first discovery pass starts immediately. Must not already be running.
     * @param consumer The io_context to deliver results on. Must stay alive until stop() returned.
     * @param callback The function to call with each result.
     */
    void start(boost::asio::io_context& consumer, Callback callback);

    /**
     * Signals the worker to stop and waits for it to exit. A discovery pass in progress is finished first, the
     * signal is checked between passes. If the poller is not running, nothing happens.
     */
    void stop();

    /**
     * @return True if the worker is running, false otherwise.
     */
    [[nodiscard]] bool is_running() const;

    /**
     * @return The options of this poller.
     */
    [[nodiscard]] const Options& get_options() const {
        return options_;
    }

  private:
    Browser& browser_;
    const Options options_;
    mutable std::mutex mutex_;
    std::condition_variable stop_condition_;
    bool stop_requested_ {false};
    std::future<void> future_;

    void run(boost::asio::io_context& consumer, const Callback& callback);
};

}  // namespace kl::dnssd
