/* This file is part of mpinc project: an incremental MessagePack decoder
 * Copyright (c) 2026 The mpinc authors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the mpinc source tree */
#ifndef MPINC_STREAM_DECODER_HPP
#define MPINC_STREAM_DECODER_HPP

#include <vector>
#include <mpinc/message-decoder.hpp>

namespace mpinc {
    // Splits a stream of concatenated values delivered in arbitrary chunks.
    struct stream_decoder {
        explicit stream_decoder(const decoder_config &cfg={});

        // returns the values completed by this chunk in the stream order
        std::vector<value> write(buffer bytes);

        // true when the bytes of an incomplete value are buffered
        bool pending() const noexcept
        {
            return _current.consumed() > 0;
        }

        size_t total_values() const noexcept
        {
            return _total_values;
        }

        size_t total_bytes() const noexcept
        {
            return _total_bytes;
        }
    private:
        decoder_config _cfg;
        message_decoder _current;
        size_t _total_values = 0;
        size_t _total_bytes = 0;
    };
}

#endif // !MPINC_STREAM_DECODER_HPP
