/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "keylightkit/core/log.hpp"

#include <catch2/catch_all.hpp>

TEST_CASE("kl::parse_log_level") {
    REQUIRE(kl::parse_log_level("TRACE") == kl::LogLevel::trace);
    REQUIRE(kl::parse_log_level("debug") == kl::LogLevel::debug);
    REQUIRE(kl::parse_log_level("Info") == kl::LogLevel::info);
    REQUIRE(kl::parse_log_level("WARN") == kl::LogLevel::warning);
    REQUIRE(kl::parse_log_level("warning") == kl::LogLevel::warning);
    REQUIRE(kl::parse_log_level("ERROR") == kl::LogLevel::error);
    REQUIRE(kl::parse_log_level("critical") == kl::LogLevel::critical);
    REQUIRE(kl::parse_log_level("OFF") == kl::LogLevel::off);

    REQUIRE_FALSE(kl::parse_log_level("").has_value());
    REQUIRE_FALSE(kl::parse_log_level("verbose").has_value());
    REQUIRE_FALSE(kl::parse_log_level("INFO ").has_value());
}
