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

#include "keylightkit/dnssd/dnssd_browser.hpp"

#include <string>
#include <vector>

namespace kl::dnssd {

/**
 * Browser implementation which runs `avahi-browse --parsable --resolve --terminate` and parses its output.
 */
class AvahiBrowser: public Browser {
  public:
    struct Options {
        /// The program to run plus any leading arguments. The browse arguments are appended. When the program
        /// contains no '/' it is looked up in PATH.
        std::vector<std::string> command {"avahi-browse"};
    };

    AvahiBrowser();
    explicit AvahiBrowser(Options options);

    /**
     * @return The options this browser was created with.
     */
    [[nodiscard]] const Options& get_options() const {
        return options_;
    }

    // Browser overrides
    DiscoveryResult discover(const std::string& service_type, std::chrono::milliseconds timeout) override;

  private:
    const Options options_;
};

}  // namespace kl::dnssd
