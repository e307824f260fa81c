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

#include "keylightkit/dnssd/discovery_outcome.hpp"

#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/url/url.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace kl::keylight {

/**
 * Handle to a reachable accessory, created from a resolved discovery record.
 */
struct Device {
    /// The advertised friendly name.
    std::string name;
    boost::asio::ip::address ip;
    uint16_t port {};

    /**
     * @return A device for the given record.
     */
    static Device from_record(const dnssd::ServiceRecord& record);

    /**
     * @return A device if the outcome is resolved, otherwise an empty optional.
     */
    static std::optional<Device> from_outcome(const dnssd::DiscoveryOutcome& outcome);

    /**
     * @return The base url of the device (http://ip:port). The zone of a link-local IPv6 address is not part of the
     * url, use endpoint() to connect to such a device.
     */
    [[nodiscard]] boost::urls::url url() const;

    /**
     * @return The endpoint of the control endpoint, including the scope of a link-local IPv6 address.
     */
    [[nodiscard]] boost::asio::ip::tcp::endpoint endpoint() const;

    /**
     * @return True if the address only has meaning together with the interface it was seen on.
     */
    [[nodiscard]] bool is_scoped() const;

    friend bool operator==(const Device& lhs, const Device& rhs) {
        return lhs.name == rhs.name && lhs.ip == rhs.ip && lhs.port == rhs.port;
    }

    friend bool operator!=(const Device& lhs, const Device& rhs) {
        return !(lhs == rhs);
    }
};

/**
 * Collects the resolved outcomes into devices, one per advertised name. An accessory is usually resolved once per
 * interface and protocol; the first resolution of each name is kept.
 * @param outcomes The outcomes of a discovery pass.
 * @return The devices, in the order their names were first seen.
 */
std::vector<Device> unique_devices(const std::vector<dnssd::DiscoveryOutcome>& outcomes);

}  // namespace kl::keylight
