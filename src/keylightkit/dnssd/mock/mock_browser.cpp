/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "keylightkit/dnssd/mock/mock_browser.hpp"

#include "keylightkit/core/exception.hpp"
#include "keylightkit/dnssd/avahi/avahi_browse_parser.hpp"

void kl::dnssd::MockBrowser::mock_result(DiscoveryResult result) {
    std::lock_guard lock(mutex_);
    results_.push_back(std::move(result));
}

void kl::dnssd::MockBrowser::mock_outcomes(std::vector<DiscoveryOutcome> outcomes) {
    mock_result(std::move(outcomes));
}

void kl::dnssd::MockBrowser::mock_avahi_output(const std::string_view output) {
    AvahiBrowseParser parser;
    parser.feed(output);
    mock_result(parser.outcomes());
}

void kl::dnssd::MockBrowser::mock_unavailable(std::string message) {
    mock_result(tl::unexpected(DiscoveryError {DiscoveryError::Kind::unavailable, std::move(message)}));
}

size_t kl::dnssd::MockBrowser::get_discover_count() const {
    std::lock_guard lock(mutex_);
    return service_types_.size();
}

std::vector<std::string> kl::dnssd::MockBrowser::get_service_types() const {
    std::lock_guard lock(mutex_);
    return service_types_;
}

kl::dnssd::DiscoveryResult
kl::dnssd::MockBrowser::discover(const std::string& service_type, std::chrono::milliseconds) {
    std::lock_guard lock(mutex_);
    if (results_.empty()) {
        KL_THROW_EXCEPTION("No result mocked for: {}", service_type);
    }
    service_types_.push_back(service_type);
    if (results_.size() == 1) {
        return results_.front();
    }
    auto result = std::move(results_.front());
    results_.pop_front();
    return result;
}
