/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "keylightkit/dnssd/background_poller.hpp"

#include "keylightkit/core/exception.hpp"
#include "keylightkit/core/log.hpp"

#include <boost/asio/post.hpp>

kl::dnssd::BackgroundPoller::BackgroundPoller(Browser& browser) : BackgroundPoller(browser, Options {}) {}

kl::dnssd::BackgroundPoller::BackgroundPoller(Browser& browser, Options options) :
    browser_(browser), options_(std::move(options)) {}

kl::dnssd::BackgroundPoller::~BackgroundPoller() {
    stop();
}

void kl::dnssd::BackgroundPoller::start(boost::asio::io_context& consumer, Callback callback) {
    if (is_running()) {
        KL_ERROR("Poller is already running");
        return;
    }

    {
        std::lock_guard lock(mutex_);
        stop_requested_ = false;
    }

    future_ = std::async(std::launch::async, [this, &consumer, callback = std::move(callback)] {
        run(consumer, callback);
    });
}

void kl::dnssd::BackgroundPoller::stop() {
    if (!future_.valid()) {
        return;
    }

    {
        std::lock_guard lock(mutex_);
        stop_requested_ = true;
    }
    stop_condition_.notify_all();

    future_.wait();
    future_ = {};
    KL_TRACE("Poller stopped");
}

bool kl::dnssd::BackgroundPoller::is_running() const {
    using namespace std::chrono_literals;
    if (future_.valid()) {
        return future_.wait_for(0s) != std::future_status::ready;
    }
    return false;
}

void kl::dnssd::BackgroundPoller::run(boost::asio::io_context& consumer, const Callback& callback) {
    KL_TRACE("Start discovery poller for {}", options_.service_type);

    while (true) {
        try {
            auto result = browser_.discover(options_.service_type, options_.discover_timeout);
            if (!result) {
                KL_WARNING("Discovery unavailable: {}", result.error().message);
            }
            boost::asio::post(consumer, [callback, result = std::move(result)] {
                callback(result);
            });
        }
        KL_CATCH_LOG_UNCAUGHT_EXCEPTIONS

        std::unique_lock lock(mutex_);
        if (stop_condition_.wait_for(lock, options_.interval, [this] {
                return stop_requested_;
            })) {
            break;
        }
    }

    KL_TRACE("Discovery poller exiting");
}
