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

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kl::dnssd {

/// Simple typedef for representing a TXT record.
using TxtRecord = std::map<std::string, std::string>;

/**
 * Parses the textual form of a TXT record, as printed by avahi-browse: a sequence of quoted "key=value" tokens
 * separated by whitespace. Unquoted tokens are accepted as well. Malformed tokens (no '=', empty key, unmatched quote)
 * are skipped individually, the rest of the record is still parsed. When a key appears more than once, the first
 * occurrence is used.
 * @param txt The raw TXT string.
 * @return The parsed key/value pairs.
 */
TxtRecord parse_txt_record(std::string_view txt);

/**
 * Parses multiple raw TXT strings in order and merges them into one record.
 * @param txt The raw TXT strings.
 * @return The parsed key/value pairs.
 */
TxtRecord parse_txt_record(const std::vector<std::string>& txt);

/**
 * Typed view of the metadata a Key Light accessory advertises in its TXT record.
 */
struct AccessoryInfo {
    std::optional<std::string> protocol_version;  // pv
    std::optional<std::string> model;             // md
    std::optional<std::string> device_id;         // id
    std::optional<std::string> device_type;       // dt
    std::optional<std::string> manufacturer;      // mf

    /**
     * Picks the known keys from given TXT record. Keys which are not present stay empty.
     * @param txt The TXT record.
     * @return The accessory info.
     */
    static AccessoryInfo from_txt(const TxtRecord& txt);
};

}  // namespace kl::dnssd
