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

#include "keylightkit/dnssd/dnssd_browser.hpp"

#include <deque>
#include <mutex>
#include <string_view>

namespace kl::dnssd {

/**
 * Browser which returns canned results. Mocked results are handed out in order; once a single result is left it is
 * returned for every following call.
 */
class MockBrowser: public Browser {
  public:
    MockBrowser() = default;
    ~MockBrowser() override = default;

    /**
     * Mocks the result of a discover call.
     * @param result The result to return.
     */
    void mock_result(DiscoveryResult result);

    /**
     * Mocks a discover call which returns given outcomes.
     * @param outcomes The outcomes to return.
     */
    void mock_outcomes(std::vector<DiscoveryOutcome> outcomes);

    /**
     * Mocks a discover call which returns the outcomes of parsing given avahi-browse output.
     * @param output The raw output, as avahi-browse --parsable --resolve would produce it.
     */
    void mock_avahi_output(std::string_view output);

    /**
     * Mocks a discover call which fails because the discovery facility is unavailable.
     * @param message The error message.
     */
    void mock_unavailable(std::string message);

    /**
     * @return The number of times discover was called.
     */
    [[nodiscard]] size_t get_discover_count() const;

    /**
     * @return The service types discover was called with, in order.
     */
    [[nodiscard]] std::vector<std::string> get_service_types() const;

    // Browser overrides
    DiscoveryResult discover(const std::string& service_type, std::chrono::milliseconds timeout) override;

  private:
    mutable std::mutex mutex_;
    std::deque<DiscoveryResult> results_;
    std::vector<std::string> service_types_;
};

}  // namespace kl::dnssd
