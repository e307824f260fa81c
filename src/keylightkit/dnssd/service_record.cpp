/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "keylightkit/dnssd/service_record.hpp"

#include <fmt/format.h>

const char* kl::dnssd::to_string(const InternetProtocol protocol) {
    switch (protocol) {
        case InternetProtocol::v4:
            return "IPv4";
        case InternetProtocol::v6:
            return "IPv6";
    }
    return "";
}

std::optional<kl::dnssd::InternetProtocol> kl::dnssd::parse_internet_protocol(const std::string_view str) {
    if (str == "IPv4") {
        return InternetProtocol::v4;
    }
    if (str == "IPv6") {
        return InternetProtocol::v6;
    }
    return std::nullopt;
}

kl::dnssd::TxtRecord kl::dnssd::ServiceRecord::txt_record() const {
    return parse_txt_record(txt);
}

std::string kl::dnssd::to_string(const ServiceAdvertisement& advertisement) {
    return fmt::format(
        "name: {}, type: {}, domain: {}, interface: {}, protocol: {}", advertisement.hostname,
        advertisement.service_type, advertisement.domain, advertisement.interface_name,
        to_string(advertisement.internet_protocol)
    );
}

std::string kl::dnssd::to_string(const ServiceRecord& record) {
    std::string txt_description;
    for (const auto& [key, value] : record.txt_record()) {
        txt_description += key;
        txt_description += "=";
        txt_description += value;
        txt_description += ", ";
    }

    return fmt::format(
        "{}, fullname: {}, host: {}, address: {}, port: {}, txt: {{{}}}", to_string(record.advertisement()),
        record.resolved_name, record.target_host, record.ip.to_string(), record.port, txt_description
    );
}
