/* This file is part of mpinc project: an incremental MessagePack decoder
 * Copyright (c) 2026 The mpinc authors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the mpinc source tree */

#include <mpinc/logger.hpp>
#include <mpinc/stream-decoder.hpp>

namespace mpinc {
    stream_decoder::stream_decoder(const decoder_config &cfg):
        _cfg { cfg }, _current { _cfg }
    {
    }

    std::vector<value> stream_decoder::write(const buffer bytes)
    {
        std::vector<value> res {};
        size_t pos = 0;
        while (pos < bytes.size()) {
            pos += _current.write(bytes.subbuf(pos));
            if (!_current.is_complete())
                break;
            res.emplace_back(_current.take());
            ++_total_values;
            _current = message_decoder { _cfg };
        }
        _total_bytes += pos;
        if (!res.empty() && logger::tracing_enabled())
            logger::trace("a {}-byte chunk completed {} values, {} values in total", bytes.size(), res.size(), _total_values);
        return res;
    }
}
