/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "keylightkit/dnssd/txt_record.hpp"

#include <catch2/catch_all.hpp>

TEST_CASE("dnssd | parse_txt_record") {
    SECTION("Quoted tokens") {
        const auto txt = kl::dnssd::parse_txt_record(
            std::string_view(R"("pv=1.0" "md=Elgato Key Light 20GAK9901" "id=FF:6A:9D:30:B1:6E")")
        );
        REQUIRE(txt.size() == 3);
        REQUIRE(txt.at("pv") == "1.0");
        REQUIRE(txt.at("md") == "Elgato Key Light 20GAK9901");
        REQUIRE(txt.at("id") == "FF:6A:9D:30:B1:6E");
    }

    SECTION("Unknown keys are kept verbatim") {
        const auto txt = kl::dnssd::parse_txt_record(std::string_view(R"("dt=53" "mf=Elgato" "x-Custom=A b=c")"));
        REQUIRE(txt.at("dt") == "53");
        REQUIRE(txt.at("mf") == "Elgato");
        REQUIRE(txt.at("x-Custom") == "A b=c");
    }

    SECTION("Empty value") {
        const auto txt = kl::dnssd::parse_txt_record(std::string_view(R"("key=")"));
        REQUIRE(txt.at("key").empty());
    }

    SECTION("Unquoted tokens") {
        const auto txt = kl::dnssd::parse_txt_record(std::string_view("pv=1.0  md=Light\tid=1"));
        REQUIRE(txt.size() == 3);
        REQUIRE(txt.at("md") == "Light");
    }

    SECTION("Escapes inside quotes") {
        const auto txt = kl::dnssd::parse_txt_record(std::string_view(R"("md=Say \"hi\"" "p=a\\b")"));
        REQUIRE(txt.at("md") == R"(Say "hi")");
        REQUIRE(txt.at("p") == R"(a\b)");
    }

    SECTION("Malformed tokens are skipped individually") {
        const auto txt = kl::dnssd::parse_txt_record(std::string_view(R"("novalue" "=empty" "pv=1.0" "md=Light")"));
        REQUIRE(txt.size() == 2);
        REQUIRE(txt.at("pv") == "1.0");
        REQUIRE(txt.at("md") == "Light");
    }

    SECTION("Unmatched quote drops only the remainder") {
        const auto txt = kl::dnssd::parse_txt_record(std::string_view(R"("pv=1.0" "md=Light)"));
        REQUIRE(txt.size() == 1);
        REQUIRE(txt.at("pv") == "1.0");
    }

    SECTION("First occurrence wins") {
        const auto txt = kl::dnssd::parse_txt_record(std::string_view(R"("pv=1.0" "pv=2.0")"));
        REQUIRE(txt.at("pv") == "1.0");
    }

    SECTION("Empty input") {
        REQUIRE(kl::dnssd::parse_txt_record(std::string_view()).empty());
        REQUIRE(kl::dnssd::parse_txt_record(std::string_view("   ")).empty());
    }

    SECTION("Multiple strings are merged in order") {
        const std::vector<std::string> strings {R"("pv=1.0" "md=Light")", R"("md=Other" "id=1")"};
        const auto txt = kl::dnssd::parse_txt_record(strings);
        REQUIRE(txt.size() == 3);
        REQUIRE(txt.at("md") == "Light");
        REQUIRE(txt.at("id") == "1");
    }
}

TEST_CASE("dnssd | AccessoryInfo") {
    SECTION("All keys present") {
        const auto txt = kl::dnssd::parse_txt_record(
            std::string_view(R"("pv=1.0" "md=Elgato Key Light 20GAK9901" "id=3C:6A:9D:21:B1:6E" "dt=53" "mf=Elgato")")
        );
        const auto info = kl::dnssd::AccessoryInfo::from_txt(txt);
        REQUIRE(info.protocol_version == "1.0");
        REQUIRE(info.model == "Elgato Key Light 20GAK9901");
        REQUIRE(info.device_id == "3C:6A:9D:21:B1:6E");
        REQUIRE(info.device_type == "53");
        REQUIRE(info.manufacturer == "Elgato");
    }

    SECTION("Missing keys stay empty") {
        const auto info = kl::dnssd::AccessoryInfo::from_txt({{"md", "Light"}});
        REQUIRE(info.model == "Light");
        REQUIRE_FALSE(info.protocol_version.has_value());
        REQUIRE_FALSE(info.device_id.has_value());
        REQUIRE_FALSE(info.device_type.has_value());
        REQUIRE_FALSE(info.manufacturer.has_value());
    }
}
