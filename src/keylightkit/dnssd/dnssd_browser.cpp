/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "keylightkit/core/platform.hpp"
#include "keylightkit/dnssd/dnssd_browser.hpp"
#include "keylightkit/dnssd/avahi/avahi_browser.hpp"

std::unique_ptr<kl::dnssd::Browser> kl::dnssd::Browser::create() {
#if KL_LINUX || KL_BSD
    return std::make_unique<AvahiBrowser>();
#else
    return {};
#endif
}
