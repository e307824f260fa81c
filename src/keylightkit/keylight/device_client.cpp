/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "keylightkit/keylight/device_client.hpp"

#include "keylightkit/core/exception.hpp"
#include "keylightkit/core/log.hpp"

#include <fmt/format.h>

#include <optional>

namespace {

kl::keylight::DeviceError make_error(const kl::keylight::DeviceError::Kind kind, std::string message) {
    return {kind, std::move(message)};
}

}  // namespace

const char* kl::keylight::to_string(const DeviceError::Kind kind) {
    switch (kind) {
        case DeviceError::Kind::unreachable:
            return "unreachable";
        case DeviceError::Kind::malformed_response:
            return "malformed_response";
        case DeviceError::Kind::bad_status:
            return "bad_status";
    }
    return "";
}

kl::keylight::DeviceClient::DeviceClient(const boost::asio::ip::address& ip, const uint16_t port) :
    DeviceClient(ip, port, Options {}) {}

kl::keylight::DeviceClient::DeviceClient(const boost::asio::ip::address& ip, const uint16_t port, Options options) :
    options_(std::move(options)), http_client_(io_context_, ip, port, options_.timeout) {
    if (!options_.temperature_range.is_valid()) {
        KL_THROW_EXCEPTION(
            "Invalid temperature range [{}, {}]", options_.temperature_range.min, options_.temperature_range.max
        );
    }
    http_client_.set_keep_alive(false);
}

kl::keylight::DeviceClient::DeviceClient(const Device& device) : DeviceClient(device.ip, device.port, Options {}) {}

kl::keylight::DeviceClient::DeviceClient(const Device& device, Options options) :
    DeviceClient(device.ip, device.port, std::move(options)) {}

tl::expected<kl::keylight::DeviceState, kl::keylight::DeviceError> kl::keylight::DeviceClient::get_state() {
    return round_trip(http::verb::get, {});
}

tl::expected<kl::keylight::DeviceState, kl::keylight::DeviceError>
kl::keylight::DeviceClient::set_state(const DeviceState& state) {
    const auto clamped = state.clamped(options_.temperature_range);
    if (clamped != state) {
        KL_DEBUG("Clamped requested state [{}] to [{}]", to_string(state), to_string(clamped));
    }
    return round_trip(http::verb::put, to_json_string(clamped));
}

tl::expected<kl::keylight::DeviceState, kl::keylight::DeviceError> kl::keylight::DeviceClient::toggle() {
    return get_state().and_then([this](DeviceState state) {
        state.on = !state.on;
        return set_state(state);
    });
}

tl::expected<kl::keylight::DeviceState, kl::keylight::DeviceError> kl::keylight::DeviceClient::set_power(const bool on) {
    return get_state().and_then([this, on](DeviceState state) {
        state.on = on;
        return set_state(state);
    });
}

tl::expected<kl::keylight::DeviceState, kl::keylight::DeviceError>
kl::keylight::DeviceClient::step_brightness(const Direction direction) {
    return get_state().and_then([this, direction](const DeviceState& state) {
        return set_state(state.stepped_brightness(direction));
    });
}

tl::expected<kl::keylight::DeviceState, kl::keylight::DeviceError>
kl::keylight::DeviceClient::step_temperature(const Direction direction) {
    return get_state().and_then([this, direction](const DeviceState& state) {
        return set_state(state.stepped_temperature(direction, options_.temperature_range));
    });
}

tl::expected<kl::keylight::DeviceState, kl::keylight::DeviceError>
kl::keylight::DeviceClient::round_trip(const http::verb method, std::string body) {
    std::optional<boost::system::result<HttpClient::Response>> result;

    http_client_.request_async(
        method, options_.api_path, std::move(body), "application/json",
        [&result](boost::system::result<HttpClient::Response> response) {
            result = std::move(response);
        }
    );

    io_context_.restart();
    io_context_.run();

    const auto endpoint = fmt::format("{}:{}", http_client_.get_host(), http_client_.get_service());

    if (!result) {
        http_client_.cancel_outstanding_requests();
        KL_ERROR("No response from {}", endpoint);
        return tl::unexpected(
            make_error(DeviceError::Kind::unreachable, fmt::format("No response from {}", endpoint))
        );
    }

    if (result->has_error()) {
        const auto message = fmt::format("{} unreachable: {}", endpoint, result->error().message());
        KL_ERROR("{}", message);
        return tl::unexpected(make_error(DeviceError::Kind::unreachable, message));
    }

    const auto& response = result->value();
    if (response.result_int() < 200 || response.result_int() >= 300) {
        const auto message = fmt::format(
            "{} {} {} returned status {}", endpoint, std::string(http::to_string(method)), options_.api_path,
            response.result_int()
        );
        KL_ERROR("{}", message);
        return tl::unexpected(make_error(DeviceError::Kind::bad_status, message));
    }

    auto state = parse_device_state(response.body(), options_.temperature_range);
    if (!state) {
        const auto message = fmt::format("Malformed response from {}: {}", endpoint, state.error());
        KL_ERROR("{}", message);
        return tl::unexpected(make_error(DeviceError::Kind::malformed_response, message));
    }

    KL_TRACE("{} {} -> {}", std::string(http::to_string(method)), endpoint, to_string(*state));
    return *state;
}
