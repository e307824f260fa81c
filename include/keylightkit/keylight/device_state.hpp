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
#include "keylightkit/core/json.hpp"

#include <string>
#include <string_view>

namespace kl::keylight {

constexpr int k_min_brightness = 0;
constexpr int k_max_brightness = 100;

/// The amount of percentage points a brightness step moves.
constexpr int k_brightness_step = 10;

/**
 * The valid color temperature range of an accessory, in mireds (inclusive).
 */
struct TemperatureRange {
    int min {143};
    int max {344};

    /**
     * @return The value clamped into this range.
     */
    [[nodiscard]] int clamp(int value) const;

    /**
     * @return True if the value lies within this range.
     */
    [[nodiscard]] bool contains(int value) const;

    /**
     * @return The step size: 10% of the span, rounded to the nearest integer.
     */
    [[nodiscard]] int step() const;

    /**
     * @return True if min is not larger than max.
     */
    [[nodiscard]] bool is_valid() const;

    friend bool operator==(const TemperatureRange& lhs, const TemperatureRange& rhs) {
        return lhs.min == rhs.min && lhs.max == rhs.max;
    }

    friend bool operator!=(const TemperatureRange& lhs, const TemperatureRange& rhs) {
        return !(lhs == rhs);
    }
};

/// The range of the common accessories (roughly 7000K down to 2900K).
constexpr TemperatureRange k_default_temperature_range {143, 344};

/**
 * @return The brightness clamped into [0, 100].
 */
int clamp_brightness(int brightness);

enum class Direction { up, down };

const char* to_string(Direction direction);

/**
 * The operating state of an accessory.
 */
struct DeviceState {
    bool on {false};

    /// Percentage [0, 100].
    int brightness {k_min_brightness};

    /// Color temperature in mireds.
    int temperature {k_default_temperature_range.min};

    /// The number of controllable lights in the accessory.
    int number_of_lights {1};

    /**
     * @param range The temperature range to clamp into.
     * @return A copy with brightness and temperature clamped into their valid domains.
     */
    [[nodiscard]] DeviceState clamped(const TemperatureRange& range = k_default_temperature_range) const;

    /**
     * @return A copy with the brightness moved one step in the given direction, clamped.
     */
    [[nodiscard]] DeviceState stepped_brightness(Direction direction) const;

    /**
     * @param direction The direction to step in.
     * @param range The temperature range to step and clamp within.
     * @return A copy with the temperature moved one step in the given direction, clamped.
     */
    [[nodiscard]] DeviceState
    stepped_temperature(Direction direction, const TemperatureRange& range = k_default_temperature_range) const;

    friend bool operator==(const DeviceState& lhs, const DeviceState& rhs) {
        return lhs.on == rhs.on && lhs.brightness == rhs.brightness && lhs.temperature == rhs.temperature
            && lhs.number_of_lights == rhs.number_of_lights;
    }

    friend bool operator!=(const DeviceState& lhs, const DeviceState& rhs) {
        return !(lhs == rhs);
    }
};

/**
 * Converts mireds to Kelvin (1,000,000 / mireds, rounded).
 * @param mireds The value in mireds, must be positive.
 * @return The value in Kelvin, or 0 if mireds is not positive.
 */
int mired_to_kelvin(int mireds);

/**
 * Converts Kelvin to mireds (1,000,000 / kelvin, rounded).
 * @param kelvin The value in Kelvin, must be positive.
 * @return The value in mireds, or 0 if kelvin is not positive.
 */
int kelvin_to_mired(int kelvin);

/**
 * @return A single line description of the state.
 */
std::string to_string(const DeviceState& state);

/**
 * Writes the state in the control endpoint's shape. Every light carries the same state.
 */
void tag_invoke(const boost::json::value_from_tag&, boost::json::value& jv, const DeviceState& state);

/**
 * @return The state in the control endpoint's shape, pretty printed.
 */
std::string to_json_string(const DeviceState& state);

/**
 * Reads a state from the control endpoint's shape. The first light determines the state. Unknown fields are ignored.
 * @param jv The JSON value.
 * @param range The temperature range the reported temperature must lie in.
 * @return The state, or a description of what is wrong with the value.
 */
tl::expected<DeviceState, std::string>
device_state_from_json(const boost::json::value& jv, const TemperatureRange& range = k_default_temperature_range);

/**
 * Parses a state from JSON text in the control endpoint's shape.
 * @param json_str The JSON text.
 * @param range The temperature range the reported temperature must lie in.
 * @return The state, or a description of what is wrong with the text.
 */
tl::expected<DeviceState, std::string>
parse_device_state(std::string_view json_str, const TemperatureRange& range = k_default_temperature_range);

}  // namespace kl::keylight
