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

#include "discovery_outcome.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace kl::dnssd {

/// The DNS-SD service type Key Light accessories advertise.
constexpr auto k_keylight_service_type = "_elg._tcp";

/**
 * Interface class which represents a one-shot DNS-SD browser: browse for a service type and resolve every instance
 * found, within a bounded amount of time.
 */
class Browser {
  public:
    virtual ~Browser() = default;

    /**
     * Browses for the given service type and resolves every advertisement found. Blocks until the browse completed or
     * the timeout elapsed, whichever comes first. On timeout the outcomes gathered so far are returned, which is not
     * an error.
     * Implementations must be safe to call repeatedly and from multiple threads at the same time.
     * @param service_type The service type (i.e. _elg._tcp).
     * @param timeout The maximum amount of time to spend.
     * @return The outcome per advertised instance, or an error when the discovery facility is unavailable.
     */
    virtual DiscoveryResult discover(const std::string& service_type, std::chrono::milliseconds timeout) = 0;

    /**
     * Creates the most appropriate browser implementation for the platform.
     * @return The created browser instance, or nullptr if no implementation is available.
     */
    static std::unique_ptr<Browser> create();
};

}  // namespace kl::dnssd
