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

#include "expected.hpp"

#include <boost/json.hpp>
#include <boost/json/value_to.hpp>    // Don't remove or suffer the errors
#include <boost/json/value_from.hpp>  // Don't remove or suffer the errors

#include <fmt/format.h>

#include <cstdint>
#include <limits>
#include <string>
#include <string_view>

namespace kl {

/**
 * Parses a JSON text.
 * @param json_str The JSON text.
 * @return The parsed value, or a description of the parse error.
 */
inline tl::expected<boost::json::value, std::string> parse_json(const std::string_view json_str) {
    boost::system::error_code ec;
    auto jv = boost::json::parse(json_str, ec);
    if (ec) {
        return tl::unexpected(fmt::format("invalid JSON: {}", ec.message()));
    }
    return jv;
}

/**
 * Reads an integer member of an object. Only JSON integers are accepted, fractional numbers and strings are not.
 * @param object The object to read from.
 * @param key The name of the member.
 * @return The value, or a description of why it couldn't be read.
 */
inline tl::expected<int64_t, std::string> json_get_integer(const boost::json::object& object, const std::string_view key) {
    const auto* value = object.if_contains(key);
    if (value == nullptr) {
        return tl::unexpected(fmt::format("missing field '{}'", key));
    }
    if (const auto* i = value->if_int64()) {
        return *i;
    }
    if (const auto* u = value->if_uint64()) {
        if (*u > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            return tl::unexpected(fmt::format("field '{}' out of range", key));
        }
        return static_cast<int64_t>(*u);
    }
    return tl::unexpected(fmt::format("field '{}' is not an integer", key));
}

}  // namespace kl
