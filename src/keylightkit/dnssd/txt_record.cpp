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

#include "keylightkit/core/log.hpp"
#include "keylightkit/core/string_parser.hpp"

namespace {

constexpr std::string_view k_whitespace = " \t\r\n";

bool is_whitespace(const char c) {
    return k_whitespace.find(c) != std::string_view::npos;
}

/**
 * Reads a quoted token. Expects the opening quote to be consumed already.
 * @return The unescaped token, or an empty optional if the closing quote is missing.
 */
std::optional<std::string> read_quoted_token(kl::StringParser& parser) {
    std::string token;
    while (const auto c = parser.read_char()) {
        if (*c == '"') {
            return token;
        }
        if (*c == '\\') {
            if (const auto escaped = parser.read_char()) {
                token.push_back(*escaped);
                continue;
            }
            break;
        }
        token.push_back(*c);
    }
    return std::nullopt;
}

std::string read_bare_token(kl::StringParser& parser) {
    std::string token;
    while (const auto c = parser.peek()) {
        if (is_whitespace(*c)) {
            break;
        }
        token.push_back(*c);
        parser.read_char();
    }
    return token;
}

void insert_token(kl::dnssd::TxtRecord& record, const std::string_view token) {
    const auto pos = token.find('=');
    if (pos == std::string_view::npos) {
        KL_DEBUG("Skipping TXT token without '=': {}", token);
        return;
    }
    if (pos == 0) {
        KL_DEBUG("Skipping TXT token with empty key: {}", token);
        return;
    }
    // First occurrence wins
    record.emplace(std::string(token.substr(0, pos)), std::string(token.substr(pos + 1)));
}

std::optional<std::string> find(const kl::dnssd::TxtRecord& txt, const char* key) {
    if (const auto it = txt.find(key); it != txt.end()) {
        return it->second;
    }
    return std::nullopt;
}

}  // namespace

kl::dnssd::TxtRecord kl::dnssd::parse_txt_record(const std::string_view txt) {
    TxtRecord record;
    StringParser parser(txt);

    while (true) {
        parser.skip_any_of(k_whitespace);
        if (parser.exhausted()) {
            break;
        }

        if (parser.skip('"')) {
            const auto token = read_quoted_token(parser);
            if (!token) {
                KL_DEBUG("Skipping TXT token with unmatched quote in: {}", txt);
                break;
            }
            insert_token(record, *token);
        } else {
            insert_token(record, read_bare_token(parser));
        }
    }

    return record;
}

kl::dnssd::TxtRecord kl::dnssd::parse_txt_record(const std::vector<std::string>& txt) {
    TxtRecord record;
    for (const auto& str : txt) {
        // Keys already present are kept by merge, so the first occurrence wins across strings too.
        auto parsed = parse_txt_record(std::string_view(str));
        record.merge(parsed);
    }
    return record;
}

kl::dnssd::AccessoryInfo kl::dnssd::AccessoryInfo::from_txt(const TxtRecord& txt) {
    AccessoryInfo info;
    info.protocol_version = find(txt, "pv");
    info.model = find(txt, "md");
    info.device_id = find(txt, "id");
    info.device_type = find(txt, "dt");
    info.manufacturer = find(txt, "mf");
    return info;
}
