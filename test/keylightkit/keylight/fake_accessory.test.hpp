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

#include "keylightkit/core/log.hpp"
#include "keylightkit/keylight/device_state.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/bind_handler.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/http/write.hpp>

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace kl::test {

/**
 * In-process stand-in for an accessory's control endpoint. Listens on 127.0.0.1 on a random port and serves
 * /elgato/lights from its own thread. A PUT replaces the stored state and answers with it, like the accessory does.
 */
class FakeAccessory {
  public:
    using Request = boost::beast::http::request<boost::beast::http::string_body>;
    using Response = boost::beast::http::response<boost::beast::http::string_body>;

    explicit FakeAccessory(const keylight::DeviceState& initial_state = {}) :
        acceptor_(io_context_, {boost::asio::ip::make_address("127.0.0.1"), 0}),
        endpoint_(acceptor_.local_endpoint()),
        state_(initial_state) {
        do_accept();
        thread_ = std::thread([this] {
            io_context_.run();
        });
    }

    ~FakeAccessory() {
        io_context_.stop();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    FakeAccessory(const FakeAccessory&) = delete;
    FakeAccessory& operator=(const FakeAccessory&) = delete;

    [[nodiscard]] boost::asio::ip::address address() const {
        return endpoint_.address();
    }

    [[nodiscard]] uint16_t port() const {
        return endpoint_.port();
    }

    void set_state(const keylight::DeviceState& state) {
        std::lock_guard lock(mutex_);
        state_ = state;
    }

    [[nodiscard]] keylight::DeviceState get_state() const {
        std::lock_guard lock(mutex_);
        return state_;
    }

    /**
     * Makes every following request get this response instead of the regular one.
     */
    void set_canned_response(const boost::beast::http::status status, std::string body) {
        std::lock_guard lock(mutex_);
        canned_response_ = std::make_pair(status, std::move(body));
    }

    /**
     * Makes the accessory move the brightness of every PUT by given amount before storing it, like the rounding a
     * real accessory applies.
     */
    void set_brightness_adjustment(const int adjustment) {
        std::lock_guard lock(mutex_);
        brightness_adjustment_ = adjustment;
    }

    /**
     * @return The bodies of all PUT requests received so far, in order.
     */
    [[nodiscard]] std::vector<std::string> get_put_bodies() const {
        std::lock_guard lock(mutex_);
        return put_bodies_;
    }

    /**
     * @return The method and target of all requests received so far, in order (ie. "GET /elgato/lights").
     */
    [[nodiscard]] std::vector<std::string> get_requests() const {
        std::lock_guard lock(mutex_);
        return requests_;
    }

  private:
    class Session: public std::enable_shared_from_this<Session> {
      public:
        Session(boost::asio::ip::tcp::socket&& socket, FakeAccessory& owner) :
            stream_(std::move(socket)), owner_(owner) {}

        void do_read() {
            request_ = {};
            stream_.expires_after(std::chrono::seconds(10));
            boost::beast::http::async_read(
                stream_, buffer_, request_, boost::beast::bind_front_handler(&Session::on_read, shared_from_this())
            );
        }

      private:
        boost::beast::tcp_stream stream_;
        FakeAccessory& owner_;
        boost::beast::flat_buffer buffer_;
        Request request_;
        Response response_;

        void on_read(const boost::beast::error_code& ec, std::size_t) {
            if (ec) {
                return do_close();
            }

            response_ = owner_.handle(request_);
            boost::beast::http::async_write(
                stream_, response_, boost::beast::bind_front_handler(&Session::on_write, shared_from_this())
            );
        }

        void on_write(const boost::beast::error_code& ec, std::size_t) {
            if (ec || !response_.keep_alive()) {
                return do_close();
            }
            do_read();
        }

        void do_close() {
            boost::beast::error_code ec;
            stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
        }
    };

    boost::asio::io_context io_context_;
    boost::asio::ip::tcp::acceptor acceptor_;
    const boost::asio::ip::tcp::endpoint endpoint_;
    std::thread thread_;

    mutable std::mutex mutex_;
    keylight::DeviceState state_;
    std::optional<std::pair<boost::beast::http::status, std::string>> canned_response_;
    int brightness_adjustment_ {};
    std::vector<std::string> put_bodies_;
    std::vector<std::string> requests_;

    void do_accept() {
        acceptor_.async_accept([this](const boost::system::error_code& ec, boost::asio::ip::tcp::socket socket) {
            if (ec) {
                return;  // Acceptor closed
            }
            std::make_shared<Session>(std::move(socket), *this)->do_read();
            do_accept();
        });
    }

    Response handle(const Request& request) {
        std::lock_guard lock(mutex_);

        requests_.push_back(
            fmt::format("{} {}", std::string(request.method_string()), std::string(request.target()))
        );

        Response response {boost::beast::http::status::ok, request.version()};
        response.keep_alive(request.keep_alive());
        response.set(boost::beast::http::field::content_type, "application/json");

        if (canned_response_) {
            response.result(canned_response_->first);
            response.body() = canned_response_->second;
        } else if (request.target() != "/elgato/lights") {
            response.result(boost::beast::http::status::not_found);
        } else if (request.method() == boost::beast::http::verb::get) {
            response.body() = keylight::to_json_string(state_);
        } else if (request.method() == boost::beast::http::verb::put) {
            put_bodies_.push_back(request.body());
            // Accept anything the client sends, so tests can inspect what was transmitted.
            auto state = keylight::parse_device_state(request.body(), {0, 100'000});
            if (state) {
                state->brightness = keylight::clamp_brightness(state->brightness + brightness_adjustment_);
                state_ = *state;
                response.body() = keylight::to_json_string(state_);
            } else {
                KL_WARNING("Fake accessory received invalid state: {}", state.error());
                response.result(boost::beast::http::status::bad_request);
            }
        } else {
            response.result(boost::beast::http::status::method_not_allowed);
        }

        response.prepare_payload();
        return response;
    }
};

}  // namespace kl::test
