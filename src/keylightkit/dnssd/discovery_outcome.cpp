/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "keylightkit/dnssd/discovery_outcome.hpp"

const char* kl::dnssd::to_string(const DiscoveryError::Kind kind) {
    switch (kind) {
        case DiscoveryError::Kind::unavailable:
            return "unavailable";
    }
    return "";
}

std::vector<kl::dnssd::ServiceRecord> kl::dnssd::resolved_records(const std::vector<DiscoveryOutcome>& outcomes) {
    std::vector<ServiceRecord> records;
    for (const auto& outcome : outcomes) {
        if (const auto* record = std::get_if<ServiceRecord>(&outcome)) {
            records.push_back(*record);
        }
    }
    return records;
}

std::vector<kl::dnssd::UnresolvedService>
kl::dnssd::unresolved_services(const std::vector<DiscoveryOutcome>& outcomes) {
    std::vector<UnresolvedService> services;
    for (const auto& outcome : outcomes) {
        if (const auto* service = std::get_if<UnresolvedService>(&outcome)) {
            services.push_back(*service);
        }
    }
    return services;
}
