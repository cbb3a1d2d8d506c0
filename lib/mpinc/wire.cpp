/* This file is part of mpinc project: an incremental MessagePack decoder
 * Copyright (c) 2026 The mpinc authors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the mpinc source tree */

#include <array>
#include <limits>
#include <mpinc/wire.hpp>

namespace mpinc::wire {
    using namespace mpinc::builder;

    static constexpr std::array<format_descriptor, 36> format_table {{
        // name              pattern mask  len  rule                  L  payload                 builder
        { "positive fixint", 0x00, 0x80, 0, length_rule::constant, 0, payload_kind::bytes, build_positive_fixint },
        { "fixmap",          0x80, 0xF0, 0, length_rule::pairs,    0, payload_kind::values, build_map },
        { "fixarray",        0x90, 0xF0, 0, length_rule::identity, 0, payload_kind::values, build_array },
        { "fixstr",          0xA0, 0xE0, 0, length_rule::identity, 0, payload_kind::bytes, build_str },
        { "nil",             0xC0, 0xFF, 0, length_rule::constant, 0, payload_kind::bytes, build_nil },
        { "false",           0xC2, 0xFF, 0, length_rule::constant, 0, payload_kind::bytes, build_false },
        { "true",            0xC3, 0xFF, 0, length_rule::constant, 0, payload_kind::bytes, build_true },
        { "bin8",            0xC4, 0xFF, 1, length_rule::identity, 0, payload_kind::bytes, build_bin },
        { "bin16",           0xC5, 0xFF, 2, length_rule::identity, 0, payload_kind::bytes, build_bin },
        { "bin32",           0xC6, 0xFF, 4, length_rule::identity, 0, payload_kind::bytes, build_bin },
        { "ext8",            0xC7, 0xFF, 1, length_rule::ext,      0, payload_kind::bytes, build_ext },
        { "ext16",           0xC8, 0xFF, 2, length_rule::ext,      0, payload_kind::bytes, build_ext },
        { "ext32",           0xC9, 0xFF, 4, length_rule::ext,      0, payload_kind::bytes, build_ext },
        { "float32",         0xCA, 0xFF, 0, length_rule::constant, 4, payload_kind::bytes, build_float32 },
        { "float64",         0xCB, 0xFF, 0, length_rule::constant, 8, payload_kind::bytes, build_float64 },
        { "uint8",           0xCC, 0xFF, 0, length_rule::constant, 1, payload_kind::bytes, build_uint },
        { "uint16",          0xCD, 0xFF, 0, length_rule::constant, 2, payload_kind::bytes, build_uint },
        { "uint32",          0xCE, 0xFF, 0, length_rule::constant, 4, payload_kind::bytes, build_uint },
        { "uint64",          0xCF, 0xFF, 0, length_rule::constant, 8, payload_kind::bytes, build_uint },
        { "int8",            0xD0, 0xFF, 0, length_rule::constant, 1, payload_kind::bytes, build_int },
        { "int16",           0xD1, 0xFF, 0, length_rule::constant, 2, payload_kind::bytes, build_int },
        { "int32",           0xD2, 0xFF, 0, length_rule::constant, 4, payload_kind::bytes, build_int },
        { "int64",           0xD3, 0xFF, 0, length_rule::constant, 8, payload_kind::bytes, build_int },
        { "fixext1",         0xD4, 0xFF, 0, length_rule::constant, 2, payload_kind::bytes, build_ext },
        { "fixext2",         0xD5, 0xFF, 0, length_rule::constant, 3, payload_kind::bytes, build_ext },
        { "fixext4",         0xD6, 0xFF, 0, length_rule::constant, 5, payload_kind::bytes, build_ext },
        { "fixext8",         0xD7, 0xFF, 0, length_rule::constant, 9, payload_kind::bytes, build_ext },
        { "fixext16",        0xD8, 0xFF, 0, length_rule::constant, 17, payload_kind::bytes, build_ext },
        { "str8",            0xD9, 0xFF, 1, length_rule::identity, 0, payload_kind::bytes, build_str },
        { "str16",           0xDA, 0xFF, 2, length_rule::identity, 0, payload_kind::bytes, build_str },
        { "str32",           0xDB, 0xFF, 4, length_rule::identity, 0, payload_kind::bytes, build_str },
        { "array16",         0xDC, 0xFF, 2, length_rule::identity, 0, payload_kind::values, build_array },
        { "array32",         0xDD, 0xFF, 4, length_rule::identity, 0, payload_kind::values, build_array },
        { "map16",           0xDE, 0xFF, 2, length_rule::pairs,    0, payload_kind::values, build_map },
        { "map32",           0xDF, 0xFF, 4, length_rule::pairs,    0, payload_kind::values, build_map },
        { "negative fixint", 0xE0, 0xE0, 0, length_rule::constant, 0, payload_kind::bytes, build_negative_fixint }
    }};

    std::span<const format_descriptor> formats()
    {
        return format_table;
    }

    const format_descriptor &match_tag(const uint8_t tag)
    {
        for (const auto &desc: format_table) {
            if (desc.matches(tag))
                return desc;
        }
        throw format_error(format_error_kind::unknown_tag, fmt::format("unknown tag: 0x{:02X}", tag));
    }

    uint64_t extract_n(const format_descriptor &desc, const uint8_t tag, const buffer length_field)
    {
        if (length_field.size() != desc.length_size) [[unlikely]]
            throw error(fmt::format("{} requires a {}-byte length field but got {} bytes", desc, desc.length_size, length_field.size()));
        if (desc.length_size == 0)
            return tag & desc.n_mask();
        return uint_from_be(length_field);
    }

    uint64_t derive_l(const format_descriptor &desc, const uint64_t n)
    {
        switch (desc.rule) {
            case length_rule::constant:
                return desc.l_const;
            case length_rule::identity:
                return n;
            case length_rule::pairs:
                if (n > std::numeric_limits<uint64_t>::max() / 2) [[unlikely]]
                    throw limit_error(fmt::format("{} with {} pairs is too large", desc, n));
                return n * 2;
            case length_rule::ext:
                if (n == std::numeric_limits<uint64_t>::max()) [[unlikely]]
                    throw limit_error(fmt::format("{} with {} data bytes is too large", desc, n));
                return n + 1;
            [[unlikely]] default:
                throw error(fmt::format("unsupported length rule: {}", static_cast<int>(desc.rule)));
        }
    }

    value build(const format_descriptor &desc, const uint64_t n, builder::payload &&p)
    {
        return desc.build(n, std::move(p));
    }
}
