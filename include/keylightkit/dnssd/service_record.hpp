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

#include "txt_record.hpp"

#include <boost/asio/ip/address.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kl::dnssd {

enum class InternetProtocol { v4, v6 };

/**
 * @return The protocol as printed by avahi ("IPv4" or "IPv6").
 */
const char* to_string(InternetProtocol protocol);

/**
 * Parses "IPv4" or "IPv6".
 * @param str The string to parse.
 * @return The protocol, or an empty optional if the string is not a known protocol.
 */
std::optional<InternetProtocol> parse_internet_protocol(std::string_view str);

/**
 * The fields every advertisement carries, whether it was resolved or not. Together they identify one advertised
 * instance on one interface and protocol.
 */
struct ServiceAdvertisement {
    /// The local network interface the advertisement arrived on.
    std::string interface_name;

    /// The protocol family of the advertisement.
    InternetProtocol internet_protocol {InternetProtocol::v4};

    /// The advertised friendly name of the accessory (the DNS-SD instance name), with escapes decoded.
    std::string hostname;

    /// The type of the service (ie. _elg._tcp).
    std::string service_type;

    /// The domain of the service (local).
    std::string domain;

    friend bool operator==(const ServiceAdvertisement& lhs, const ServiceAdvertisement& rhs) {
        return lhs.interface_name == rhs.interface_name && lhs.internet_protocol == rhs.internet_protocol
            && lhs.hostname == rhs.hostname && lhs.service_type == rhs.service_type && lhs.domain == rhs.domain;
    }

    friend bool operator!=(const ServiceAdvertisement& lhs, const ServiceAdvertisement& rhs) {
        return !(lhs == rhs);
    }
};

/**
 * A resolved advertisement: the base fields plus the address information needed to reach the accessory.
 */
struct ServiceRecord: ServiceAdvertisement {
    /// The full instance name (<hostname>.<service_type>.<domain>).
    std::string resolved_name;

    /// The DNS host of the instance (name.local).
    std::string target_host;

    /// The address serving the service.
    boost::asio::ip::address ip;

    /// The port the service is listening on.
    uint16_t port {};

    /// The raw TXT strings, in the order they were received.
    std::vector<std::string> txt;

    /**
     * @return The TXT strings parsed into key/value pairs.
     */
    [[nodiscard]] TxtRecord txt_record() const;

    /**
     * @return The base advertisement fields of this record.
     */
    [[nodiscard]] const ServiceAdvertisement& advertisement() const {
        return *this;
    }
};

/**
 * @return A single line description of the advertisement, handy for logging purposes.
 */
std::string to_string(const ServiceAdvertisement& advertisement);

/**
 * @return A single line description of the record, handy for logging purposes.
 */
std::string to_string(const ServiceRecord& record);

}  // namespace kl::dnssd
