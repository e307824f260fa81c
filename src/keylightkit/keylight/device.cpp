/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "keylightkit/keylight/device.hpp"

#include <boost/url/ipv4_address.hpp>
#include <boost/url/ipv6_address.hpp>

#include <algorithm>

kl::keylight::Device kl::keylight::Device::from_record(const dnssd::ServiceRecord& record) {
    return {record.hostname, record.ip, record.port};
}

std::optional<kl::keylight::Device> kl::keylight::Device::from_outcome(const dnssd::DiscoveryOutcome& outcome) {
    if (const auto* record = std::get_if<dnssd::ServiceRecord>(&outcome)) {
        return from_record(*record);
    }
    return std::nullopt;
}

boost::urls::url kl::keylight::Device::url() const {
    boost::urls::url url;
    url.set_scheme("http");
    if (ip.is_v6()) {
        url.set_host_ipv6(boost::urls::ipv6_address(ip.to_v6().to_bytes()));
    } else {
        url.set_host_ipv4(boost::urls::ipv4_address(ip.to_v4().to_bytes()));
    }
    url.set_port_number(port);
    return url;
}

boost::asio::ip::tcp::endpoint kl::keylight::Device::endpoint() const {
    return {ip, port};
}

bool kl::keylight::Device::is_scoped() const {
    return ip.is_v6() && ip.to_v6().scope_id() != 0;
}

std::vector<kl::keylight::Device> kl::keylight::unique_devices(const std::vector<dnssd::DiscoveryOutcome>& outcomes) {
    std::vector<Device> devices;
    for (const auto& outcome : outcomes) {
        auto device = Device::from_outcome(outcome);
        if (!device) {
            continue;
        }
        const auto it = std::find_if(devices.begin(), devices.end(), [&device](const Device& d) {
            return d.name == device->name;
        });
        if (it == devices.end()) {
            devices.push_back(std::move(*device));
        }
    }
    return devices;
}
