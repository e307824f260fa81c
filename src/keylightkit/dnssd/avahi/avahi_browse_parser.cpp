/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "keylightkit/dnssd/avahi/avahi_browse_parser.hpp"

#include "keylightkit/core/log.hpp"
#include "keylightkit/core/platform.hpp"
#include "keylightkit/core/string.hpp"
#include "keylightkit/core/string_parser.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>

#if KL_POSIX
    #include <net/if.h>
#endif

namespace {

constexpr auto k_resolve_failure_prefix = "Failed to resolve service '";
constexpr auto k_not_resolved_reason = "not resolved before browse terminated";

bool is_digit(const char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

/**
 * Parses an address as printed by avahi. Link-local IPv6 addresses get the scope of the interface they were seen on,
 * otherwise they can't be connected to.
 */
std::optional<boost::asio::ip::address>
parse_address(const std::string_view str, [[maybe_unused]] const std::string& interface_name) {
    boost::system::error_code ec;
    auto address = boost::asio::ip::make_address(str, ec);
    if (ec) {
        return std::nullopt;
    }

#if KL_POSIX
    if (address.is_v6() && address.to_v6().is_link_local() && address.to_v6().scope_id() == 0) {
        auto v6 = address.to_v6();
        v6.scope_id(if_nametoindex(interface_name.c_str()));
        address = v6;
    }
#endif

    return address;
}

}  // namespace

std::string kl::dnssd::decode_avahi_escapes(const std::string_view str) {
    std::string result;
    result.reserve(str.size());

    for (size_t i = 0; i < str.size(); ++i) {
        if (str[i] != '\\' || i + 1 >= str.size()) {
            result.push_back(str[i]);
            continue;
        }

        if (i + 3 < str.size() && is_digit(str[i + 1]) && is_digit(str[i + 2]) && is_digit(str[i + 3])) {
            const auto value = string_to_int<int>(str.substr(i + 1, 3), true);
            if (value && *value <= 255) {
                result.push_back(static_cast<char>(*value));
                i += 3;
                continue;
            }
        }

        result.push_back(str[i + 1]);
        i += 1;
    }

    return result;
}

tl::expected<kl::dnssd::AvahiBrowseLine, std::string> kl::dnssd::parse_avahi_browse_line(const std::string_view line) {
    StringParser parser(line);

    const auto mode = parser.split(';');
    if (!mode || mode->size() != 1) {
        return tl::unexpected("invalid mode field");
    }

    AvahiBrowseLine result;
    switch (mode->front()) {
        case '+':
            result.kind = AvahiBrowseLine::Kind::added;
            break;
        case '=':
            result.kind = AvahiBrowseLine::Kind::resolved;
            break;
        case '-':
            result.kind = AvahiBrowseLine::Kind::removed;
            break;
        default:
            return tl::unexpected(fmt::format("unknown mode '{}'", *mode));
    }

    const auto interface_name = parser.split(';');
    const auto protocol = parser.split(';');
    const auto name = parser.split(';');
    const auto service_type = parser.split(';');
    const auto domain = parser.split(';');
    if (!interface_name || !protocol || !name || !service_type || !domain) {
        return tl::unexpected("not enough fields");
    }

    const auto internet_protocol = parse_internet_protocol(*protocol);
    if (!internet_protocol) {
        return tl::unexpected(fmt::format("unknown protocol '{}'", *protocol));
    }

    auto& advertisement = result.advertisement;
    advertisement.interface_name = std::string(*interface_name);
    advertisement.internet_protocol = *internet_protocol;
    advertisement.hostname = decode_avahi_escapes(*name);
    advertisement.service_type = std::string(*service_type);
    advertisement.domain = std::string(*domain);

    if (result.kind != AvahiBrowseLine::Kind::resolved) {
        return result;
    }

    const auto target_host = parser.split(';');
    const auto address = parser.split(';');
    const auto port = parser.split(';');
    if (!target_host || !address || !port) {
        return tl::unexpected("not enough fields for resolved service");
    }

    ServiceRecord record;
    static_cast<ServiceAdvertisement&>(record) = advertisement;
    record.resolved_name = fmt::format("{}.{}.{}", advertisement.hostname, advertisement.service_type, advertisement.domain);
    record.target_host = std::string(*target_host);

    const auto ip = parse_address(*address, advertisement.interface_name);
    if (!ip) {
        return tl::unexpected(fmt::format("invalid address '{}'", *address));
    }
    record.ip = *ip;

    const auto port_number = string_to_int<uint16_t>(*port, true);
    if (!port_number) {
        return tl::unexpected(fmt::format("invalid port '{}'", *port));
    }
    record.port = *port_number;

    if (const auto txt = parser.read_until_end()) {
        record.txt.emplace_back(*txt);
    }

    result.record = std::move(record);
    return result;
}

void kl::dnssd::AvahiBrowseParser::feed_line(std::string_view line) {
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
        line.remove_suffix(1);
    }

    if (line.empty()) {
        return;
    }

    auto parsed = parse_avahi_browse_line(line);
    if (!parsed) {
        KL_WARNING("Skipping avahi-browse line ({}): {}", parsed.error(), line);
        lines_skipped_++;
        return;
    }

    lines_parsed_++;

    switch (parsed->kind) {
        case AvahiBrowseLine::Kind::added:
            if (find_entry(parsed->advertisement) == nullptr) {
                entries_.push_back({std::move(parsed->advertisement), std::nullopt});
            }
            break;
        case AvahiBrowseLine::Kind::resolved:
            if (auto* entry = find_entry(parsed->advertisement)) {
                entry->record = std::move(parsed->record);
            } else {
                entries_.push_back({std::move(parsed->advertisement), std::move(parsed->record)});
            }
            break;
        case AvahiBrowseLine::Kind::removed: {
            const auto it = std::remove_if(entries_.begin(), entries_.end(), [&parsed](const Entry& entry) {
                return entry.advertisement == parsed->advertisement;
            });
            entries_.erase(it, entries_.end());
            break;
        }
    }
}

void kl::dnssd::AvahiBrowseParser::feed_error_line(std::string_view line) {
    line = string_trim(line);
    if (line.empty()) {
        return;
    }

    if (!string_starts_with(line, k_resolve_failure_prefix)) {
        KL_DEBUG("avahi-browse: {}", line);
        return;
    }

    // Failed to resolve service 'NAME' of type 'TYPE' in domain 'DOMAIN': REASON
    StringParser parser(line.substr(std::char_traits<char>::length(k_resolve_failure_prefix)));
    const auto name = parser.split("' of type '");
    if (!name) {
        return;
    }
    std::string reason = "resolve failed";
    if (parser.split("': ")) {
        if (const auto remaining = parser.read_until_end()) {
            reason = std::string(string_trim(*remaining));
        }
    }

    KL_DEBUG("avahi-browse failed to resolve '{}': {}", *name, reason);
    resolve_failures_.insert_or_assign(std::string(*name), std::move(reason));
}

void kl::dnssd::AvahiBrowseParser::feed(const std::string_view output) {
    StringParser parser(output);
    while (const auto line = parser.split('\n')) {
        feed_line(*line);
    }
}

std::vector<kl::dnssd::DiscoveryOutcome> kl::dnssd::AvahiBrowseParser::outcomes() const {
    std::vector<DiscoveryOutcome> outcomes;
    outcomes.reserve(entries_.size());

    for (const auto& entry : entries_) {
        if (entry.record) {
            outcomes.emplace_back(*entry.record);
            continue;
        }

        UnresolvedService unresolved {entry.advertisement, k_not_resolved_reason};
        if (const auto it = resolve_failures_.find(entry.advertisement.hostname); it != resolve_failures_.end()) {
            unresolved.reason = it->second;
        }
        outcomes.emplace_back(std::move(unresolved));
    }

    return outcomes;
}

void kl::dnssd::AvahiBrowseParser::reset() {
    entries_.clear();
    resolve_failures_.clear();
    lines_skipped_ = 0;
    lines_parsed_ = 0;
}

kl::dnssd::AvahiBrowseParser::Entry* kl::dnssd::AvahiBrowseParser::find_entry(const ServiceAdvertisement& advertisement) {
    for (auto& entry : entries_) {
        if (entry.advertisement == advertisement) {
            return &entry;
        }
    }
    return nullptr;
}
