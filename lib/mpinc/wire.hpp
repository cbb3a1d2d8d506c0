/* This file is part of mpinc project: an incremental MessagePack decoder
 * Copyright (c) 2026 The mpinc authors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the mpinc source tree */
#ifndef MPINC_WIRE_HPP
#define MPINC_WIRE_HPP

/*
 * The table of MessagePack wire formats. Every format is described by the same set of
 * properties so that the decoder handles all of them with one code path:
 * 1) a tag byte, of which the mask selects the bits identifying the format;
 * 2) a number N: either the tag bits outside of the mask or a big-endian length field
 *    of length_size bytes following the tag;
 * 3) a payload length L derived from N;
 * 4) a payload of L bytes or of L nested values.
 */

#include <span>
#include <string_view>
#include <mpinc/builder.hpp>
#include <mpinc/bytes.hpp>
#include <mpinc/value.hpp>

namespace mpinc::wire {
    enum class length_rule: uint8_t {
        constant,   // L is l_const regardless of N
        identity,   // L = N
        pairs,      // L = 2 * N, maps store keys and values as consecutive items
        ext         // L = N + 1, extensions are prefixed with a type byte
    };

    enum class payload_kind: uint8_t {
        bytes,
        values
    };

    struct format_descriptor {
        std::string_view name;
        uint8_t pattern;
        uint8_t mask;
        uint8_t length_size;
        length_rule rule;
        uint64_t l_const;
        payload_kind kind;
        builder::build_fn build;

        uint8_t n_mask() const noexcept
        {
            return static_cast<uint8_t>(~mask);
        }

        bool matches(const uint8_t tag) const noexcept
        {
            return (tag & mask) == pattern;
        }

        bool holds_values() const noexcept
        {
            return kind == payload_kind::values;
        }
    };

    extern std::span<const format_descriptor> formats();
    extern const format_descriptor &match_tag(uint8_t tag);
    extern uint64_t extract_n(const format_descriptor &desc, uint8_t tag, buffer length_field);
    extern uint64_t derive_l(const format_descriptor &desc, uint64_t n);
    extern value build(const format_descriptor &desc, uint64_t n, builder::payload &&p);
}

namespace fmt {
    template<>
    struct formatter<mpinc::wire::format_descriptor>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}", v.name);
        }
    };
}

#endif // !MPINC_WIRE_HPP
