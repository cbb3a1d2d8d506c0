/* This file is part of mpinc project: an incremental MessagePack decoder
 * Copyright (c) 2026 The mpinc authors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the mpinc source tree */

#include <mpinc/message-decoder.hpp>

namespace mpinc {
    value decode(const buffer bytes, const decoder_config &cfg)
    {
        message_decoder dec { cfg };
        const auto num_consumed = dec.write(bytes);
        if (!dec.is_complete()) [[unlikely]]
            throw error(fmt::format("the input of {} bytes ends before the value is complete", bytes.size()));
        if (num_consumed != bytes.size()) [[unlikely]]
            throw error(fmt::format("the input has {} trailing bytes after a {}-byte value", bytes.size() - num_consumed, num_consumed));
        return dec.take();
    }
}
