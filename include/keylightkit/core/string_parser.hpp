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

#include <cstring>
#include <optional>
#include <string>
#include <string_view>

namespace kl {

/**
 * A handy utility class for parsing strings. It works like a stream, where it maintains a position in the string and
 * subsequent calls will read from that position.
 */
class StringParser {
  public:
    /**
     * Constructs a parser from given string view. Doesn't take ownership of the string, so make sure for the original
     * string to outlive this parser instance.
     * @param str The string to parse.
     */
    explicit StringParser(const std::string_view str) : str_(str) {}

    /**
     * Constructs a parser from given string. Doesn't take ownership of the string, so make sure for the original string
     * to outlive this parser instance.
     * @param str The string to parse.
     */
    explicit StringParser(const std::string& str) : str_(str) {}

    /**
     * Reads a string until the given delimiter. If delimiter is not found, the whole remaining string is returned.
     * @param delimiter The character to read until.
     * @param include_delimiter Whether to include the delimiter in the returned string.
     * @return The read string, or an empty optional if the string is exhausted.
     */
    std::optional<std::string_view> split(const char delimiter, const bool include_delimiter = false) {
        if (str_.empty()) {
            return std::nullopt;
        }

        const auto pos = str_.find(delimiter);
        if (pos == std::string_view::npos) {
            auto str = str_;
            str_ = {};
            return str;
        }

        const auto substr = str_.substr(0, include_delimiter ? pos + 1 : pos);
        str_.remove_prefix(pos + 1);
        return substr;  // NOLINT: The address of the local variable 'substr' may escape the function
    }

    /**
     * Reads a string until the given delimiter. If delimiter is not found, the whole remaining string is returned.
     * @param delimiter The character sequence to read until.
     * @param include_delimiter Whether to include the delimiter in the returned string.
     * @return The read string, or an empty optional if the string is exhausted.
     */
    std::optional<std::string_view> split(const char* delimiter, const bool include_delimiter = false) {
        if (str_.empty()) {
            return std::nullopt;
        }

        const auto delimiter_length = std::strlen(delimiter);
        const auto pos = str_.find(delimiter);
        if (pos == std::string_view::npos) {
            auto str = str_;
            str_ = {};
            return str;
        }

        const auto substr = str_.substr(0, include_delimiter ? pos + delimiter_length : pos);
        str_.remove_prefix(pos + delimiter_length);
        return substr;  // NOLINT: The address of the local variable 'substr' may escape the function
    }

    /**
     * Reads the rest of the string.
     * @return The read string, or an empty optional if the string is exhausted.
     */
    std::optional<std::string_view> read_until_end() {
        if (str_.empty()) {
            return std::nullopt;
        }
        auto str = str_;
        str_ = {};
        return str;
    }

    /**
     * Skips the given character from the beginning of the string.
     * @param chr The character to skip.
     * @return True if the character was skipped, or false otherwise.
     */
    bool skip(const char chr) {
        if (!str_.empty() && str_.front() == chr) {
            str_.remove_prefix(1);
            return true;
        }
        return false;
    }

    /**
     * Skips all leading characters which are part of the given set.
     * @param chars The set of characters to skip.
     * @return The number of characters skipped.
     */
    size_t skip_any_of(const std::string_view chars) {
        const auto pos = str_.find_first_not_of(chars);
        const auto count = pos == std::string_view::npos ? str_.size() : pos;
        str_.remove_prefix(count);
        return count;
    }

    /**
     * @return The next character without consuming it, or an empty optional if the string is exhausted.
     */
    [[nodiscard]] std::optional<char> peek() const {
        if (str_.empty()) {
            return std::nullopt;
        }
        return str_.front();
    }

    /**
     * Consumes and returns the next character.
     * @return The character, or an empty optional if the string is exhausted.
     */
    std::optional<char> read_char() {
        if (str_.empty()) {
            return std::nullopt;
        }
        const auto chr = str_.front();
        str_.remove_prefix(1);
        return chr;
    }

    /**
     * @return True if the string is exhausted, or false otherwise.
     */
    [[nodiscard]] bool exhausted() const {
        return str_.empty();
    }

  private:
    std::string_view str_;
};

}  // namespace kl
