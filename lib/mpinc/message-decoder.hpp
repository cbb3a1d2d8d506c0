/* This file is part of mpinc project: an incremental MessagePack decoder
 * Copyright (c) 2026 The mpinc authors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the mpinc source tree */
#ifndef MPINC_MESSAGE_DECODER_HPP
#define MPINC_MESSAGE_DECODER_HPP

#include <mpinc/decoder.hpp>

namespace mpinc {
    // Decodes exactly one top-level value. To decode the next value of a stream,
    // create a new instance and feed it the bytes the previous write did not consume.
    struct message_decoder {
        explicit message_decoder(const decoder_config &cfg={}):
            _dec { cfg }
        {
        }

        size_t write(const buffer bytes)
        {
            if (_dec.done())
                return 0;
            return _dec.advance(bytes);
        }

        bool is_complete() const noexcept
        {
            return _dec.done();
        }

        const mpinc::value &value() const
        {
            return _dec.value();
        }

        mpinc::value take()
        {
            return _dec.take();
        }

        size_t consumed() const noexcept
        {
            return _dec.consumed();
        }

        decode_phase phase() const noexcept
        {
            return _dec.phase();
        }
    private:
        decoder _dec;
    };

    // Decodes a buffer that must contain exactly one complete value.
    extern value decode(buffer bytes, const decoder_config &cfg={});
}

#endif // !MPINC_MESSAGE_DECODER_HPP
