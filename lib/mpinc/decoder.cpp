/* This file is part of mpinc project: an incremental MessagePack decoder
 * Copyright (c) 2026 The mpinc authors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the mpinc source tree */

#include <algorithm>
#include <mpinc/decoder.hpp>
#include <mpinc/logger.hpp>

namespace mpinc {
    // containers declaring more elements than that grow their item lists as the elements arrive
    static constexpr size_t max_items_reserve = 0x400;

    decoder::decoder(const decoder_config &cfg):
        _cfg { cfg }
    {
        _frames.emplace_back();
    }

    decode_phase decoder::phase() const noexcept
    {
        if (_frames.empty())
            return decode_phase::done;
        return _frames.front().phase;
    }

    size_t decoder::advance(const buffer bytes)
    {
        if (_failed) [[unlikely]]
            throw error("the decoder has failed earlier and cannot be resumed");
        const bool was_done = done();
        size_t pos = 0;
        try {
            while (!done()) {
                // the reference is refreshed on every iteration since pushing a child can reallocate _frames
                auto &f = _frames.back();
                switch (f.phase) {
                    case decode_phase::awaiting_tag:
                        pos += f.tag.feed(bytes.subbuf(pos));
                        if (!f.tag.full())
                            break;
                        _resolve_tag(f);
                        continue;
                    case decode_phase::awaiting_length:
                        pos += f.length.feed(bytes.subbuf(pos));
                        if (!f.length.full())
                            break;
                        _resolve_length(f);
                        continue;
                    case decode_phase::awaiting_payload:
                        if (!f.format->holds_values()) {
                            pos += f.payload.feed(bytes.subbuf(pos));
                            if (!f.payload.full())
                                break;
                            _finish(wire::build(*f.format, f.n, builder::payload { f.payload.take() }));
                        } else if (f.items.size() < f.l) {
                            _push_child();
                        } else {
                            _finish(wire::build(*f.format, f.n, builder::payload { {}, std::move(f.items) }));
                        }
                        continue;
                    [[unlikely]] default:
                        throw error(fmt::format("internal error: a frame in an unexpected phase: {}", f.phase));
                }
                // the input has been exhausted before the current frame could make further progress
                break;
            }
        } catch (const std::exception &ex) {
            _failed = true;
            logger::warn("msgpack decoding failed at byte {}: {}", _consumed + pos, ex.what());
            throw;
        }
        _consumed += pos;
        if (!was_done && done() && logger::tracing_enabled())
            logger::trace("decoded a top-level {} from {} bytes", _value->type(), _consumed);
        return pos;
    }

    void decoder::_require_value() const
    {
        if (!_value) [[unlikely]] {
            if (done())
                throw error("the decoded value has already been taken");
            throw error(fmt::format("the value is not complete yet: {} bytes consumed, phase: {}", _consumed, phase()));
        }
    }

    const mpinc::value &decoder::value() const
    {
        _require_value();
        return *_value;
    }

    mpinc::value decoder::take()
    {
        _require_value();
        auto res = std::move(*_value);
        _value.reset();
        return res;
    }

    void decoder::_resolve_tag(frame &f)
    {
        f.format = &wire::match_tag(f.tag.bytes()[0]);
        f.length = byte_accumulator { f.format->length_size };
        f.phase = decode_phase::awaiting_length;
    }

    void decoder::_resolve_length(frame &f)
    {
        f.n = wire::extract_n(*f.format, f.tag.bytes()[0], f.length.bytes());
        f.l = wire::derive_l(*f.format, f.n);
        if (f.format->holds_values()) {
            if (f.n > _cfg.max_collection_size) [[unlikely]]
                throw limit_error(fmt::format("{} declares {} elements while the limit is {}", *f.format, f.n, _cfg.max_collection_size));
            f.items.reserve(std::min(f.l, static_cast<uint64_t>(max_items_reserve)));
        } else {
            if (f.l > _cfg.max_payload_size) [[unlikely]]
                throw limit_error(fmt::format("{} declares {} payload bytes while the limit is {}", *f.format, f.l, _cfg.max_payload_size));
            f.payload = byte_accumulator { f.l };
        }
        f.phase = decode_phase::awaiting_payload;
    }

    void decoder::_push_child()
    {
        if (_frames.size() >= _cfg.max_depth) [[unlikely]]
            throw limit_error(fmt::format("the nesting depth of msgpack values exceeds the limit of {}", _cfg.max_depth));
        _frames.emplace_back();
    }

    void decoder::_finish(mpinc::value &&v)
    {
        _frames.pop_back();
        if (!_frames.empty()) {
            _frames.back().items.emplace_back(std::move(v));
            return;
        }
        _value.emplace(std::move(v));
    }
}
