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

#include "service_record.hpp"

#include "keylightkit/core/expected.hpp"

#include <string>
#include <variant>
#include <vector>

namespace kl::dnssd {

/**
 * An advertisement which was seen, but for which no usable address could be obtained.
 */
struct UnresolvedService {
    /// The base fields of the advertisement.
    ServiceAdvertisement advertisement;

    /// Why the advertisement could not be resolved.
    std::string reason;
};

/// The outcome for one advertised instance: either resolved into a full record, or unresolved.
using DiscoveryOutcome = std::variant<ServiceRecord, UnresolvedService>;

/**
 * Error for when a discovery pass could not be performed at all.
 */
struct DiscoveryError {
    enum class Kind {
        /// The discovery facility could not be started (not installed, daemon not running).
        unavailable,
    };

    Kind kind {Kind::unavailable};
    std::string message;
};

/// The result of one discovery pass.
using DiscoveryResult = tl::expected<std::vector<DiscoveryOutcome>, DiscoveryError>;

const char* to_string(DiscoveryError::Kind kind);

/**
 * @return The resolved records from given outcomes, in order.
 */
std::vector<ServiceRecord> resolved_records(const std::vector<DiscoveryOutcome>& outcomes);

/**
 * @return The unresolved outcomes from given outcomes, in order.
 */
std::vector<UnresolvedService> unresolved_services(const std::vector<DiscoveryOutcome>& outcomes);

}  // namespace kl::dnssd
