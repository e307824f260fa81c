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

// Every platform macro is defined as either 0 or 1.

#if defined(__linux__)
    #define KL_LINUX 1
#else
    #define KL_LINUX 0
#endif

#if defined(__FreeBSD__) || defined(__OpenBSD__) || defined(__NetBSD__)
    #define KL_BSD 1
#else
    #define KL_BSD 0
#endif

#if defined(__APPLE__)
    #define KL_MACOS 1
#else
    #define KL_MACOS 0
#endif

#if KL_LINUX || KL_BSD || KL_MACOS
    #define KL_POSIX 1
#else
    #define KL_POSIX 0
#endif

#if defined(_MSC_VER)
    #define KL_FUNCTION __FUNCSIG__
#else
    #define KL_FUNCTION __PRETTY_FUNCTION__
#endif
