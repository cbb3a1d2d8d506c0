/* This file is part of mpinc project: an incremental MessagePack decoder
 * Copyright (c) 2026 The mpinc authors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the mpinc source tree */
#ifndef MPINC_CONFIG_HPP
#define MPINC_CONFIG_HPP

#include <cstddef>
#include <string>
#include <string_view>
#include <mpinc/format.hpp>

namespace mpinc {
    /*
     * Resource limits applied while decoding. Every limit is checked as soon as the
     * declared size of a value becomes known, before memory for it is reserved.
     * The JSON representation uses the keys maxDepth, maxCollectionSize and maxPayloadSize.
     *
     * The defaults bound the memory an untrusted peer can make the decoder reserve, so some
     * well-formed encodings (a 300 MiB binary, a map with 2M pairs, 65 nested arrays) are
     * rejected with limit_error. Raise the limits when the input comes from a trusted source.
     */
    struct decoder_config {
        static constexpr size_t default_max_depth = 64;
        static constexpr size_t default_max_collection_size = 0x100'000;
        static constexpr size_t default_max_payload_size = 0x10'000'000;

        // the number of simultaneously open values including the top-level one
        size_t max_depth = default_max_depth;
        // the number of elements of an array or key-value pairs of a map
        size_t max_collection_size = default_max_collection_size;
        // the number of bytes of a string, binary, extension or fixed-size scalar
        size_t max_payload_size = default_max_payload_size;

        static decoder_config from_json(std::string_view text);
        static decoder_config load(const std::string &path);

        bool operator==(const decoder_config &o) const =default;
    };
}

namespace fmt {
    template<>
    struct formatter<mpinc::decoder_config>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "max_depth: {} max_collection_size: {} max_payload_size: {}",
                v.max_depth, v.max_collection_size, v.max_payload_size);
        }
    };
}

#endif // !MPINC_CONFIG_HPP
