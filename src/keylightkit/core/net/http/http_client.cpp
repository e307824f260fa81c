/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "keylightkit/core/net/http/http_client.hpp"

#include "keylightkit/core/assert.hpp"
#include "keylightkit/core/log.hpp"

#include <utility>

kl::HttpClient::HttpClient(
    boost::asio::io_context& io_context, const boost::urls::url_view& url, const std::chrono::milliseconds timeout
) :
    io_context_(io_context), timeout_(timeout), host_(url.host_address()), service_(url.port()) {}

kl::HttpClient::HttpClient(
    boost::asio::io_context& io_context, const tcp::endpoint& endpoint, const std::chrono::milliseconds timeout
) :
    HttpClient(io_context, endpoint.address(), endpoint.port(), timeout) {}

kl::HttpClient::HttpClient(
    boost::asio::io_context& io_context, const boost::asio::ip::address& address, const uint16_t port,
    const std::chrono::milliseconds timeout
) :
    io_context_(io_context), timeout_(timeout), host_(address.to_string()), service_(std::to_string(port)) {}

kl::HttpClient::~HttpClient() {
    if (session_) {
        session_->clear_owner();
    }
}

void kl::HttpClient::set_keep_alive(const bool keep_alive) {
    keep_alive_ = keep_alive;
}

void kl::HttpClient::get_async(const std::string_view target, CallbackType callback) {
    request_async(http::verb::get, target, {}, {}, std::move(callback));
}

void kl::HttpClient::put_async(
    const std::string_view target, std::string body, CallbackType callback, const std::string_view content_type
) {
    request_async(http::verb::put, target, std::move(body), content_type, std::move(callback));
}

void kl::HttpClient::request_async(
    const http::verb method, const std::string_view target, std::string body, const std::string_view content_type,
    CallbackType callback
) {
    auto request = Request(method, target.empty() ? "/" : target, 11);

    // IPv6 literals must be enclosed in brackets in the Host field.
    if (host_.find(':') != std::string::npos) {
        request.set(http::field::host, "[" + host_ + "]:" + service_);
    } else {
        request.set(http::field::host, service_.empty() ? host_ : host_ + ":" + service_);
    }

    request.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    request.set(http::field::accept, "application/json");
    request.keep_alive(keep_alive_);

    if (!body.empty()) {
        request.set(http::field::content_type, content_type);
        request.body() = std::move(body);
        request.prepare_payload();
    }

    requests_.emplace(std::move(request), std::move(callback));

    if (!session_) {
        session_ = std::make_shared<Session>(io_context_, this, timeout_);
    }

    session_->send_requests();
}

void kl::HttpClient::cancel_outstanding_requests() {
    requests_ = {};
}

const std::string& kl::HttpClient::get_host() const {
    return host_;
}

const std::string& kl::HttpClient::get_service() const {
    return service_;
}

kl::HttpClient::Session::Session(
    boost::asio::io_context& io_context, HttpClient* owner, const std::chrono::milliseconds timeout
) :
    owner_(owner), timeout_(timeout), resolver_(io_context), stream_(io_context) {}

void kl::HttpClient::Session::send_requests() {
    KL_ASSERT_RETURN(owner_ != nullptr, "HttpClient::Session must have an owner");
    if (owner_->requests_.empty()) {
        return;
    }
    if (state_ == State::disconnected) {
        async_connect();  // Start the connection process
    } else if (state_ == State::connected) {
        stream_.expires_after(timeout_);
        async_send();  // If already connected, just write the next request
    }
}

void kl::HttpClient::Session::clear_owner() {
    owner_ = nullptr;
    boost::beast::error_code ec;
    stream_.socket().close(ec);
}

void kl::HttpClient::Session::async_connect() {
    KL_ASSERT_RETURN(owner_ != nullptr, "HttpClient::Session must have an owner");
    resolver_.async_resolve(
        owner_->host_, owner_->service_.empty() ? k_default_port : owner_->service_,
        boost::beast::bind_front_handler(&Session::on_resolve, shared_from_this())
    );
    state_ = State::resolving;
}

void kl::HttpClient::Session::async_send() {
    // Send the HTTP request to the remote host
    http::async_write(
        stream_, owner_->requests_.front().first,
        boost::beast::bind_front_handler(&Session::on_write, shared_from_this())
    );

    state_ = State::waiting_for_send;
}

void kl::HttpClient::Session::fail_front_request(const boost::beast::error_code& ec) {
    state_ = State::disconnected;

    boost::beast::error_code close_ec;
    stream_.socket().close(close_ec);
    buffer_.clear();

    if (owner_->requests_.empty()) {
        return;
    }

    // Move the callback out first, the callback is allowed to clear the queue.
    auto callback = std::move(owner_->requests_.front().second);
    owner_->requests_.pop();
    if (callback) {
        callback(ec);
    }

    if (owner_ != nullptr && !owner_->requests_.empty()) {
        async_connect();  // The remaining requests get a fresh connection
    }
}

void kl::HttpClient::Session::on_resolve(
    const boost::beast::error_code& ec, const tcp::resolver::results_type& results
) {
    if (owner_ == nullptr) {
        return;  // Session was abandoned, nothing to do.
    }

    KL_ASSERT(!owner_->requests_.empty(), "No requests available");

    if (ec) {
        KL_DEBUG("HttpClient: failed to resolve {}: {}", owner_->host_, ec.message());
        fail_front_request(ec);
        return;
    }

    // One deadline covers connecting, writing the request and reading the response
    stream_.expires_after(timeout_);

    // Make the connection on the IP address we get from a lookup
    stream_.async_connect(results, boost::beast::bind_front_handler(&Session::on_connect, shared_from_this()));

    state_ = State::connecting;
}

void kl::HttpClient::Session::
    on_connect(const boost::beast::error_code& ec, const tcp::resolver::results_type::endpoint_type&) {
    if (owner_ == nullptr) {
        return;  // Session was abandoned, nothing to do.
    }

    KL_ASSERT(!owner_->requests_.empty(), "No requests available");

    if (ec) {
        KL_DEBUG("HttpClient: failed to connect to {}:{}: {}", owner_->host_, owner_->service_, ec.message());
        fail_front_request(ec);
        return;
    }

    state_ = State::connected;

    async_send();  // Start writing the first request
}

void kl::HttpClient::Session::on_write(const boost::beast::error_code& ec, std::size_t bytes_transferred) {
    boost::ignore_unused(bytes_transferred);

    if (owner_ == nullptr) {
        return;  // Session was abandoned, nothing to do.
    }

    KL_ASSERT(!owner_->requests_.empty(), "No requests available");

    if (ec) {
        fail_front_request(ec);
        return;
    }

    response_ = {};

    // Receive the HTTP response
    http::async_read(
        stream_, buffer_, response_, boost::beast::bind_front_handler(&Session::on_read, shared_from_this())
    );

    state_ = State::waiting_for_response;
}

void kl::HttpClient::Session::on_read(boost::beast::error_code ec, std::size_t bytes_transferred) {
    boost::ignore_unused(bytes_transferred);

    if (owner_ == nullptr) {
        return;  // Session was abandoned, nothing to do.
    }

    KL_ASSERT(!owner_->requests_.empty(), "No requests available");

    if (ec) {
        fail_front_request(ec);
        return;
    }

    // Move the callback function so that the lifetime is extended to until the callback returned, in case requests are
    // cleared through cancel_outstanding_requests.
    auto callback = std::move(owner_->requests_.front().second);
    owner_->requests_.pop();

    const bool keep_alive = response_.keep_alive();

    if (callback) {
        callback(std::move(response_));
    }

    if (owner_ == nullptr) {
        return;  // The owner went away from within the callback.
    }

    if (!keep_alive) {
        // Gracefully close the socket
        stream_.socket().shutdown(tcp::socket::shutdown_both, ec);

        // not_connected happens sometimes, so don't bother reporting it.
        if (ec && ec != boost::beast::errc::not_connected) {
            KL_ERROR("HttpClient::Session::on_read: Error closing socket: {}", ec.message());
        }

        stream_.socket().close(ec);
        buffer_.clear();

        if (!owner_->requests_.empty()) {
            async_connect();  // If there are more requests, reconnect.
            return;
        }

        state_ = State::disconnected;
        return;
    }

    if (!owner_->requests_.empty()) {
        stream_.expires_after(timeout_);
        async_send();  // If there are more requests, send the next one.
        return;
    }

    // Otherwise set the state to connected so that send_requests will schedule requests for sending.
    state_ = State::connected;
}
