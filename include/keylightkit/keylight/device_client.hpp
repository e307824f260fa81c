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

#include "device.hpp"
#include "device_state.hpp"

#include "keylightkit/core/expected.hpp"
#include "keylightkit/core/net/http/http_client.hpp"

#include <chrono>
#include <string>

namespace kl::keylight {

/**
 * Error for when an operation against an accessory failed.
 */
struct DeviceError {
    enum class Kind {
        /// Connecting, sending or receiving failed or timed out.
        unreachable,
        /// The accessory answered with a payload which doesn't have the expected shape.
        malformed_response,
        /// The accessory answered with a non-2xx status.
        bad_status,
    };

    Kind kind {Kind::unreachable};
    std::string message;
};

const char* to_string(DeviceError::Kind kind);

/**
 * Client for the control endpoint of one accessory. Every operation is a blocking, single attempt round trip bounded
 * by the configured timeout; nothing is retried and no state is cached between calls.
 *
 * The compound operations (toggle, set_power, step_brightness, step_temperature) read the current state and write
 * back a modified copy. The accessory offers no compare-and-swap, so an external change made between the read and
 * the write is overwritten (last write wins).
 *
 * This class is not thread safe. Clients for different accessories don't share state and may be used concurrently.
 */
class DeviceClient {
  public:
    /// The path of the control endpoint.
    static constexpr auto k_api_path = "/elgato/lights";

    /// The port accessories usually serve the control endpoint on.
    static constexpr uint16_t k_default_port = 9123;

    struct Options {
        /// Time allowed for one HTTP call, from connecting until the response is read.
        std::chrono::milliseconds timeout {HttpClient::k_default_timeout};

        /// Temperatures are clamped into this range before sending, and reported temperatures must lie within it.
        TemperatureRange temperature_range {k_default_temperature_range};

        std::string api_path {k_api_path};
    };

    DeviceClient(const boost::asio::ip::address& ip, uint16_t port);

    /**
     * @throws kl::Exception if the temperature range in the options is inverted.
     */
    DeviceClient(const boost::asio::ip::address& ip, uint16_t port, Options options);
    explicit DeviceClient(const Device& device);
    DeviceClient(const Device& device, Options options);

    DeviceClient(const DeviceClient&) = delete;
    DeviceClient& operator=(const DeviceClient&) = delete;

    /**
     * Reads the current state.
     * @return The state, or an error.
     */
    tl::expected<DeviceState, DeviceError> get_state();

    /**
     * Replaces the state. Brightness and temperature are clamped into their valid domains before sending. The full
     * state is sent.
     * @param state The requested state.
     * @return The state the accessory reports back, which may differ from the requested state due to rounding on the
     * accessory.
     */
    tl::expected<DeviceState, DeviceError> set_state(const DeviceState& state);

    /**
     * Reads the state, flips the power and writes it back.
     * @return The state the accessory reports back.
     */
    tl::expected<DeviceState, DeviceError> toggle();

    /**
     * Reads the state, sets the power and writes it back.
     * @param on True to switch on.
     * @return The state the accessory reports back.
     */
    tl::expected<DeviceState, DeviceError> set_power(bool on);

    /**
     * Reads the state, moves the brightness by 10 percentage points and writes it back.
     * @param direction The direction to step in.
     * @return The state the accessory reports back.
     */
    tl::expected<DeviceState, DeviceError> step_brightness(Direction direction);

    /**
     * Reads the state, moves the temperature by 10% of the temperature range and writes it back.
     * @param direction The direction to step in.
     * @return The state the accessory reports back.
     */
    tl::expected<DeviceState, DeviceError> step_temperature(Direction direction);

    [[nodiscard]] const Options& get_options() const {
        return options_;
    }

  private:
    const Options options_;
    boost::asio::io_context io_context_;
    HttpClient http_client_;

    tl::expected<DeviceState, DeviceError> round_trip(http::verb method, std::string body);
};

}  // namespace kl::keylight
