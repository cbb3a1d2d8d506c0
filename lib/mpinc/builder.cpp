/* This file is part of mpinc project: an incremental MessagePack decoder
 * Copyright (c) 2026 The mpinc authors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the mpinc source tree */

#include <bit>
#include <limits>
#include <utf8cpp/utf8.h>
#include <mpinc/builder.hpp>

namespace mpinc::builder {
    template<typename T>
    static T fixed_from_be(const buffer bytes, const char *name)
    {
        if (bytes.size() != sizeof(T)) [[unlikely]]
            throw error(fmt::format("{} requires {} bytes but got {}", name, sizeof(T), bytes.size()));
        return std::bit_cast<T>(static_cast<std::make_unsigned_t<T>>(uint_from_be(bytes)));
    }

    value build_nil(uint64_t, payload &&)
    {
        return nil {};
    }

    value build_false(uint64_t, payload &&)
    {
        return false;
    }

    value build_true(uint64_t, payload &&)
    {
        return true;
    }

    value build_positive_fixint(const uint64_t n, payload &&)
    {
        return static_cast<int64_t>(n);
    }

    value build_negative_fixint(const uint64_t n, payload &&)
    {
        return -static_cast<int64_t>(n);
    }

    value build_uint(uint64_t, payload &&p)
    {
        if (p.bytes.empty()) [[unlikely]]
            throw error("an unsigned integer payload cannot be empty");
        return uint_from_be(p.bytes);
    }

    value build_int(uint64_t, payload &&p)
    {
        const size_t num_bits = p.bytes.size() * 8;
        if (num_bits == 0) [[unlikely]]
            throw error("a signed integer payload cannot be empty");
        auto x = uint_from_be(p.bytes);
        // sign-extend the narrower two's complement representations
        if (num_bits < 64 && (x >> (num_bits - 1)) & 1)
            x |= std::numeric_limits<uint64_t>::max() << num_bits;
        return static_cast<int64_t>(x);
    }

    value build_float32(uint64_t, payload &&p)
    {
        return std::bit_cast<float>(fixed_from_be<uint32_t>(p.bytes, "float32"));
    }

    value build_float64(uint64_t, payload &&p)
    {
        return std::bit_cast<double>(fixed_from_be<uint64_t>(p.bytes, "float64"));
    }

    value build_str(uint64_t, payload &&p)
    {
        if (const auto it = utf8::find_invalid(p.bytes.begin(), p.bytes.end()); it != p.bytes.end()) [[unlikely]]
            throw format_error(format_error_kind::invalid_utf8,
                fmt::format("an invalid utf8 sequence at offset {} of a {}-byte string", it - p.bytes.begin(), p.bytes.size()));
        return std::string { p.bytes.str() };
    }

    value build_bin(uint64_t, payload &&p)
    {
        return std::move(p.bytes);
    }

    value build_array(uint64_t, payload &&p)
    {
        return std::move(p.items);
    }

    value build_map(uint64_t, payload &&p)
    {
        if (p.items.size() % 2 != 0) [[unlikely]]
            throw format_error(format_error_kind::odd_map_payload,
                fmt::format("internal error: a map payload must have an even number of items but got {}", p.items.size()));
        return map::from_pairs(std::move(p.items));
    }

    value build_ext(uint64_t, payload &&p)
    {
        if (p.bytes.empty()) [[unlikely]]
            throw error("internal error: an extension payload must contain at least the type byte");
        return ext { static_cast<int8_t>(p.bytes[0]), binary { buffer { p.bytes }.subbuf(1) } };
    }
}
