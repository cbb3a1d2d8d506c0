/* This file is part of mpinc project: an incremental MessagePack decoder
 * Copyright (c) 2026 The mpinc authors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the mpinc source tree */
#ifndef MPINC_DECODER_HPP
#define MPINC_DECODER_HPP

/*
 * A resumable MessagePack decoder. advance() accepts the encoding of a value in chunks
 * of any size, copies what it needs into its own buffers and returns as soon as the
 * chunk is exhausted. Splitting the same encoding at different boundaries produces the
 * same value and the same total number of consumed bytes.
 *
 * Each value under construction is a frame that passes through the phases
 * awaiting_tag -> awaiting_length -> awaiting_payload -> done. The elements of a
 * container are decoded by a child frame pushed on top of the container's frame,
 * so the nesting depth is bounded by decoder_config::max_depth instead of the native stack.
 */

#include <optional>
#include <vector>
#include <mpinc/accumulator.hpp>
#include <mpinc/config.hpp>
#include <mpinc/value.hpp>
#include <mpinc/wire.hpp>

namespace mpinc {
    enum class decode_phase: uint8_t {
        awaiting_tag,
        awaiting_length,
        awaiting_payload,
        done
    };

    struct decoder {
        explicit decoder(const decoder_config &cfg={});

        // returns the number of bytes consumed from the front of bytes
        size_t advance(buffer bytes);

        // stays true after take()
        bool done() const noexcept
        {
            return _frames.empty();
        }

        decode_phase phase() const noexcept;

        // the number of open frames: 1 for a top-level value in progress, 0 once done
        size_t depth() const noexcept
        {
            return _frames.size();
        }

        size_t consumed() const noexcept
        {
            return _consumed;
        }

        const decoder_config &config() const noexcept
        {
            return _cfg;
        }

        const mpinc::value &value() const;
        // moves the value out, after that value() and take() throw
        mpinc::value take();
    private:
        struct frame {
            decode_phase phase = decode_phase::awaiting_tag;
            const wire::format_descriptor *format = nullptr;
            byte_accumulator tag { 1 };
            byte_accumulator length {};
            uint64_t n = 0;
            uint64_t l = 0;
            byte_accumulator payload {};
            array items {};
        };

        decoder_config _cfg;
        std::vector<frame> _frames {};
        std::optional<mpinc::value> _value {};
        size_t _consumed = 0;
        bool _failed = false;

        void _require_value() const;
        void _resolve_tag(frame &f);
        void _resolve_length(frame &f);
        void _push_child();
        void _finish(mpinc::value &&v);
    };
}

namespace fmt {
    template<>
    struct formatter<mpinc::decode_phase>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using mpinc::decode_phase;
            switch (v) {
                case decode_phase::awaiting_tag: return fmt::format_to(ctx.out(), "awaiting_tag");
                case decode_phase::awaiting_length: return fmt::format_to(ctx.out(), "awaiting_length");
                case decode_phase::awaiting_payload: return fmt::format_to(ctx.out(), "awaiting_payload");
                case decode_phase::done: return fmt::format_to(ctx.out(), "done");
                default: return fmt::format_to(ctx.out(), "decode_phase: {}", static_cast<int>(v));
            }
        }
    };
}

#endif // !MPINC_DECODER_HPP
