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

#include "assert.hpp"

// Accessing the value of an expected holding an error (or the reverse) goes through KL_ASSERT instead of assert().
#ifndef TL_ASSERT
    #define TL_ASSERT(condition) KL_ASSERT(condition, "tl::expected precondition failed: " #condition)
#endif

#include <tl/expected.hpp>
