/* This file is part of mpinc project: an incremental MessagePack decoder
 * Copyright (c) 2026 The mpinc authors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the mpinc source tree */
#ifndef MPINC_BUILDER_HPP
#define MPINC_BUILDER_HPP

#include <mpinc/bytes.hpp>
#include <mpinc/value.hpp>

namespace mpinc::builder {
    // The assembled payload of a value: opaque bytes or the decoded elements of a container.
    struct payload {
        uint8_vector bytes {};
        array items {};
    };

    // Formats without a payload use only n; the others use only the payload.
    using build_fn = value (*)(uint64_t n, payload &&p);

    extern value build_nil(uint64_t n, payload &&p);
    extern value build_false(uint64_t n, payload &&p);
    extern value build_true(uint64_t n, payload &&p);
    extern value build_positive_fixint(uint64_t n, payload &&p);
    extern value build_negative_fixint(uint64_t n, payload &&p);
    extern value build_uint(uint64_t n, payload &&p);
    extern value build_int(uint64_t n, payload &&p);
    extern value build_float32(uint64_t n, payload &&p);
    extern value build_float64(uint64_t n, payload &&p);
    extern value build_str(uint64_t n, payload &&p);
    extern value build_bin(uint64_t n, payload &&p);
    extern value build_array(uint64_t n, payload &&p);
    extern value build_map(uint64_t n, payload &&p);
    extern value build_ext(uint64_t n, payload &&p);
}

#endif // !MPINC_BUILDER_HPP
