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

#include "keylightkit/core/expected.hpp"
#include "keylightkit/dnssd/discovery_outcome.hpp"

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kl::dnssd {

/**
 * Decodes the escapes avahi applies to labels in parsable output. A backslash followed by three decimal digits is
 * replaced by the byte with that value, a backslash followed by any other character is replaced by that character.
 * @param str The escaped label.
 * @return The decoded label.
 */
std::string decode_avahi_escapes(std::string_view str);

/**
 * One line of `avahi-browse --parsable` output.
 */
struct AvahiBrowseLine {
    enum class Kind {
        /// '+': An advertisement appeared.
        added,
        /// '=': An advertisement was resolved.
        resolved,
        /// '-': An advertisement went away.
        removed,
    };

    Kind kind {Kind::added};
    ServiceAdvertisement advertisement;

    /// Only set for resolved lines.
    std::optional<ServiceRecord> record;
};

/**
 * Parses a single line of `avahi-browse --parsable` output.
 * Format: <mode>;<interface>;<protocol>;<name>;<type>;<domain>[;<host>;<address>;<port>;<txt>]
 * @param line The line to parse, without trailing newline.
 * @return The parsed line, or a description of why the line could not be parsed.
 */
tl::expected<AvahiBrowseLine, std::string> parse_avahi_browse_line(std::string_view line);

/**
 * Accumulates the output of one avahi-browse invocation into discovery outcomes. Malformed lines are logged and
 * skipped, they never fail the batch.
 */
class AvahiBrowseParser {
  public:
    AvahiBrowseParser() = default;

    /**
     * Feeds one line of standard output.
     * @param line The line, with or without trailing newline.
     */
    void feed_line(std::string_view line);

    /**
     * Feeds one line of standard error. Resolve failures are remembered so that unresolved outcomes can carry the
     * reason avahi gave.
     * @param line The line, with or without trailing newline.
     */
    void feed_error_line(std::string_view line);

    /**
     * Feeds a block of standard output, split into lines.
     * @param output The output.
     */
    void feed(std::string_view output);

    /**
     * @return The outcomes for every advertisement still present, in the order they were first seen.
     */
    [[nodiscard]] std::vector<DiscoveryOutcome> outcomes() const;

    /**
     * @return The number of lines which could not be parsed.
     */
    [[nodiscard]] size_t lines_skipped() const {
        return lines_skipped_;
    }

    /**
     * @return The number of lines which were parsed successfully.
     */
    [[nodiscard]] size_t lines_parsed() const {
        return lines_parsed_;
    }

    /**
     * Resets the parser to its initial state.
     */
    void reset();

  private:
    struct Entry {
        ServiceAdvertisement advertisement;
        std::optional<ServiceRecord> record;
    };

    std::vector<Entry> entries_;
    std::map<std::string, std::string> resolve_failures_;  // By decoded service name
    size_t lines_skipped_ {};
    size_t lines_parsed_ {};

    Entry* find_entry(const ServiceAdvertisement& advertisement);
};

}  // namespace kl::dnssd
