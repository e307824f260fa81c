/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "keylightkit/keylight/device_state.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <limits>

namespace {

int rounded_ratio(const int value) {
    if (value <= 0) {
        return 0;
    }
    return static_cast<int>(std::lround(1'000'000.0 / value));
}

}  // namespace

int kl::keylight::TemperatureRange::clamp(const int value) const {
    return std::clamp(value, min, max);
}

bool kl::keylight::TemperatureRange::contains(const int value) const {
    return value >= min && value <= max;
}

int kl::keylight::TemperatureRange::step() const {
    return static_cast<int>(std::lround(static_cast<double>(max - min) / 10.0));
}

bool kl::keylight::TemperatureRange::is_valid() const {
    return min <= max;
}

int kl::keylight::clamp_brightness(const int brightness) {
    return std::clamp(brightness, k_min_brightness, k_max_brightness);
}

const char* kl::keylight::to_string(const Direction direction) {
    switch (direction) {
        case Direction::up:
            return "up";
        case Direction::down:
            return "down";
    }
    return "";
}

kl::keylight::DeviceState kl::keylight::DeviceState::clamped(const TemperatureRange& range) const {
    auto copy = *this;
    copy.brightness = clamp_brightness(brightness);
    copy.temperature = range.clamp(temperature);
    copy.number_of_lights = std::max(number_of_lights, 1);
    return copy;
}

kl::keylight::DeviceState kl::keylight::DeviceState::stepped_brightness(const Direction direction) const {
    auto copy = *this;
    const auto delta = direction == Direction::up ? k_brightness_step : -k_brightness_step;
    copy.brightness = clamp_brightness(brightness + delta);
    return copy;
}

kl::keylight::DeviceState
kl::keylight::DeviceState::stepped_temperature(const Direction direction, const TemperatureRange& range) const {
    auto copy = *this;
    const auto delta = direction == Direction::up ? range.step() : -range.step();
    copy.temperature = range.clamp(temperature + delta);
    return copy;
}

int kl::keylight::mired_to_kelvin(const int mireds) {
    return rounded_ratio(mireds);
}

int kl::keylight::kelvin_to_mired(const int kelvin) {
    return rounded_ratio(kelvin);
}

std::string kl::keylight::to_string(const DeviceState& state) {
    return fmt::format(
        "on: {}, brightness: {}%, temperature: {} ({}K), lights: {}", state.on ? "yes" : "no", state.brightness,
        state.temperature, mired_to_kelvin(state.temperature), state.number_of_lights
    );
}

void kl::keylight::tag_invoke(const boost::json::value_from_tag&, boost::json::value& jv, const DeviceState& state) {
    const auto number_of_lights = std::max(state.number_of_lights, 1);

    boost::json::array lights;
    for (int i = 0; i < number_of_lights; ++i) {
        boost::json::object light;
        light["on"] = state.on ? 1 : 0;
        light["brightness"] = state.brightness;
        light["temperature"] = state.temperature;
        lights.emplace_back(std::move(light));
    }

    jv = {{"numberOfLights", number_of_lights}, {"lights", std::move(lights)}};
}

std::string kl::keylight::to_json_string(const DeviceState& state) {
    return boost::json::serialize(boost::json::value_from(state));
}

tl::expected<kl::keylight::DeviceState, std::string>
kl::keylight::device_state_from_json(const boost::json::value& jv, const TemperatureRange& range) {
    const auto* object = jv.if_object();
    if (object == nullptr) {
        return tl::unexpected("expected an object");
    }

    const auto number_of_lights = json_get_integer(*object, "numberOfLights");
    if (!number_of_lights) {
        return tl::unexpected(number_of_lights.error());
    }
    if (*number_of_lights < 1 || *number_of_lights > std::numeric_limits<int>::max()) {
        return tl::unexpected(fmt::format("invalid numberOfLights: {}", *number_of_lights));
    }

    const auto* lights_value = object->if_contains("lights");
    if (lights_value == nullptr || !lights_value->is_array()) {
        return tl::unexpected("missing array 'lights'");
    }
    const auto& lights = lights_value->get_array();
    if (lights.empty()) {
        return tl::unexpected("empty array 'lights'");
    }

    const auto* light = lights.front().if_object();
    if (light == nullptr) {
        return tl::unexpected("light is not an object");
    }

    DeviceState state;
    state.number_of_lights = static_cast<int>(*number_of_lights);

    const auto* on = light->if_contains("on");
    if (on == nullptr) {
        return tl::unexpected("missing field 'on'");
    }
    if (const auto* b = on->if_bool()) {
        state.on = *b;
    } else {
        const auto on_value = json_get_integer(*light, "on");
        if (!on_value) {
            return tl::unexpected(on_value.error());
        }
        if (*on_value != 0 && *on_value != 1) {
            return tl::unexpected(fmt::format("invalid value for 'on': {}", *on_value));
        }
        state.on = *on_value == 1;
    }

    const auto brightness = json_get_integer(*light, "brightness");
    if (!brightness) {
        return tl::unexpected(brightness.error());
    }
    if (*brightness < k_min_brightness || *brightness > k_max_brightness) {
        return tl::unexpected(fmt::format("brightness out of range [0, 100]: {}", *brightness));
    }
    state.brightness = static_cast<int>(*brightness);

    const auto temperature = json_get_integer(*light, "temperature");
    if (!temperature) {
        return tl::unexpected(temperature.error());
    }
    if (*temperature < range.min || *temperature > range.max) {
        return tl::unexpected(
            fmt::format("temperature out of range [{}, {}]: {}", range.min, range.max, *temperature)
        );
    }
    state.temperature = static_cast<int>(*temperature);

    return state;
}

tl::expected<kl::keylight::DeviceState, std::string>
kl::keylight::parse_device_state(const std::string_view json_str, const TemperatureRange& range) {
    return parse_json(json_str).and_then([&range](const boost::json::value& jv) {
        return device_state_from_json(jv, range);
    });
}
