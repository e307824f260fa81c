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

#include "exception.hpp"
#include "log.hpp"

#include <cstdlib>

/**
 * When KL_THROW_EXCEPTION_ON_ASSERT is 1, a failed assertion throws a kl::Exception after logging. Default is off.
 */
#ifndef KL_THROW_EXCEPTION_ON_ASSERT
    #define KL_THROW_EXCEPTION_ON_ASSERT 0
#endif

/**
 * When KL_ABORT_ON_ASSERT is 1, a failed assertion aborts the program after logging. Default is off.
 */
#ifndef KL_ABORT_ON_ASSERT
    #define KL_ABORT_ON_ASSERT 0
#endif

#define KL_ASSERT_FAILED(message)                                 \
    KL_CRITICAL("Assertion failure: {}", message);                \
    if (KL_THROW_EXCEPTION_ON_ASSERT) {                           \
        KL_THROW_EXCEPTION("Assertion failure: {}", message);     \
    }                                                             \
    if (KL_ABORT_ON_ASSERT) {                                     \
        std::abort();                                             \
    }

/**
 * Checks a condition which must hold if the code is correct. When it doesn't, the failure is logged and, depending on
 * configuration, an exception is thrown or the program aborts.
 * @param condition The condition to test.
 * @param message A string literal describing the failure.
 */
#define KL_ASSERT(condition, message)     \
    do {                                  \
        if (!(condition)) {               \
            KL_ASSERT_FAILED(message)     \
        }                                 \
    } while (false)

/**
 * Same as KL_ASSERT, but also returns from the calling function when the condition doesn't hold.
 */
#define KL_ASSERT_RETURN(condition, message) \
    do {                                     \
        if (!(condition)) {                  \
            KL_ASSERT_FAILED(message)        \
            return;                          \
        }                                    \
    } while (false)
