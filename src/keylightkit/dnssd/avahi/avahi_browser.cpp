/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "keylightkit/dnssd/avahi/avahi_browser.hpp"

#include "keylightkit/core/log.hpp"
#include "keylightkit/core/string.hpp"
#include "keylightkit/dnssd/avahi/avahi_browse_parser.hpp"

#include <boost/asio/buffers_iterator.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/streambuf.hpp>
#include <boost/process/args.hpp>
#include <boost/process/async_pipe.hpp>
#include <boost/process/child.hpp>
#include <boost/process/exe.hpp>
#include <boost/process/io.hpp>
#include <boost/process/search_path.hpp>

#include <fmt/format.h>

#include <functional>

namespace bp = boost::process;

namespace {

/**
 * Reads lines from the pipe until it is closed or an error occurs. A trailing line without newline is delivered too.
 */
void read_lines(
    bp::async_pipe& pipe, boost::asio::streambuf& buffer, std::function<void(std::string_view)> on_line,
    std::function<void()> on_closed
) {
    boost::asio::async_read_until(
        pipe, buffer, '\n',
        [&pipe, &buffer, on_line = std::move(on_line),
         on_closed = std::move(on_closed)](const boost::system::error_code& ec, const size_t bytes_transferred) mutable {
            const auto begin = boost::asio::buffers_begin(buffer.data());

            if (ec) {
                if (buffer.size() > 0) {
                    const std::string rest(begin, begin + static_cast<std::ptrdiff_t>(buffer.size()));
                    buffer.consume(buffer.size());
                    on_line(rest);
                }
                if (ec != boost::asio::error::eof && ec != boost::asio::error::operation_aborted) {
                    KL_DEBUG("Pipe read ended: {}", ec.message());
                }
                on_closed();
                return;
            }

            const std::string line(begin, begin + static_cast<std::ptrdiff_t>(bytes_transferred));
            buffer.consume(bytes_transferred);
            on_line(line);
            read_lines(pipe, buffer, std::move(on_line), std::move(on_closed));
        }
    );
}

kl::dnssd::DiscoveryError unavailable(std::string message) {
    return {kl::dnssd::DiscoveryError::Kind::unavailable, std::move(message)};
}

}  // namespace

kl::dnssd::AvahiBrowser::AvahiBrowser() : AvahiBrowser(Options {}) {}

kl::dnssd::AvahiBrowser::AvahiBrowser(Options options) : options_(std::move(options)) {}

kl::dnssd::DiscoveryResult
kl::dnssd::AvahiBrowser::discover(const std::string& service_type, const std::chrono::milliseconds timeout) {
    if (options_.command.empty()) {
        return tl::unexpected(unavailable("No browse command configured"));
    }

    const auto& program = options_.command.front();
    using Path = decltype(bp::search_path(program));
    const Path executable = program.find('/') == std::string::npos ? bp::search_path(program) : Path(program);
    if (executable.empty()) {
        KL_ERROR("{} not installed", program);
        return tl::unexpected(unavailable(fmt::format("{} not installed", program)));
    }

    std::vector<std::string> arguments(options_.command.begin() + 1, options_.command.end());
    arguments.insert(arguments.end(), {"--parsable", "--resolve", "--terminate", service_type});

    boost::asio::io_context io_context;
    bp::async_pipe out_pipe(io_context);
    bp::async_pipe err_pipe(io_context);

    std::error_code spawn_error;
    bp::child child(
        bp::exe = executable, bp::args = arguments, bp::std_out > out_pipe, bp::std_err > err_pipe, bp::std_in.close(),
        spawn_error
    );

    if (spawn_error) {
        KL_ERROR("Failed to start {}: {}", program, spawn_error.message());
        return tl::unexpected(unavailable(fmt::format("Failed to start {}: {}", program, spawn_error.message())));
    }

    AvahiBrowseParser parser;
    std::string error_output;
    bool timed_out = false;
    int open_pipes = 2;

    boost::asio::steady_timer timer(io_context, timeout);
    timer.async_wait([&](const boost::system::error_code& ec) {
        if (ec) {
            return;  // Cancelled because both pipes closed
        }
        timed_out = true;
        KL_DEBUG("{} did not finish within {}ms, terminating", program, timeout.count());
        std::error_code terminate_error;
        child.terminate(terminate_error);
        if (terminate_error) {
            KL_WARNING("Failed to terminate {}: {}", program, terminate_error.message());
        }
        boost::system::error_code close_error;
        out_pipe.close(close_error);
        err_pipe.close(close_error);
    });

    const auto on_closed = [&open_pipes, &timer] {
        if (--open_pipes == 0) {
            timer.cancel();
        }
    };

    boost::asio::streambuf out_buffer;
    read_lines(
        out_pipe, out_buffer,
        [&parser](const std::string_view line) {
            parser.feed_line(line);
        },
        on_closed
    );

    boost::asio::streambuf err_buffer;
    read_lines(
        err_pipe, err_buffer,
        [&parser, &error_output](const std::string_view line) {
            parser.feed_error_line(line);
            error_output += string_trim(line);
            error_output += '\n';
        },
        on_closed
    );

    io_context.run();

    if (timed_out) {
        KL_DEBUG("Discovery of {} timed out, returning partial results", service_type);
        return parser.outcomes();
    }

    std::error_code wait_error;
    child.wait(wait_error);
    if (wait_error) {
        KL_WARNING("Failed to wait for {}: {}", program, wait_error.message());
    }

    const auto exit_code = child.exit_code();
    if (exit_code != 0 && parser.lines_parsed() == 0) {
        const auto message = std::string(string_trim(error_output));
        KL_ERROR("{} exited with code {}: {}", program, exit_code, message);
        return tl::unexpected(unavailable(
            message.empty() ? fmt::format("{} exited with code {}", program, exit_code) : message
        ));
    }

    if (parser.lines_skipped() > 0) {
        KL_DEBUG("Skipped {} malformed line(s) from {}", parser.lines_skipped(), program);
    }

    return parser.outcomes();
}
