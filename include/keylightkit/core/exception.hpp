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

#include "platform.hpp"

#include <stdexcept>
#include <string>

#include <fmt/format.h>

#define KL_THROW_EXCEPTION(...) \
    throw kl::Exception(fmt::format(__VA_ARGS__), kl::SourceLocation {__FILE__, __LINE__, KL_FUNCTION})

namespace kl {

/**
 * The place in the source code an exception was thrown from.
 */
struct SourceLocation {
    const char* file {};
    int line {-1};
    const char* function_name {};
};

/**
 * Thrown for programming errors and misuse of test doubles. Failures a caller is expected to handle (an unreachable
 * accessory, a missing discovery daemon) are returned as values instead.
 */
class Exception: public std::runtime_error {
  public:
    explicit Exception(const std::string& message, const SourceLocation& location = {}) :
        std::runtime_error(message), location_(location) {}

    /**
     * @return Where the exception was thrown from. The file is null when unknown.
     */
    [[nodiscard]] const SourceLocation& location() const {
        return location_;
    }

    /**
     * @return The message followed by the file and line it was thrown from, if known.
     */
    [[nodiscard]] std::string to_string() const {
        if (location_.file == nullptr) {
            return what();
        }
        return fmt::format("{} ({}:{})", what(), location_.file, location_.line);
    }

  private:
    SourceLocation location_;
};

}  // namespace kl
