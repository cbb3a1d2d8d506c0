/* This file is part of mpinc project: an incremental MessagePack decoder
 * Copyright (c) 2026 The mpinc authors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the mpinc source tree */
#ifndef MPINC_ERROR_HPP
#define MPINC_ERROR_HPP

#include <cstdint>
#include <source_location>
#include <stdexcept>
#include <string>
#include <typeinfo>
#include <mpinc/format.hpp>
#include <mpinc/logger.hpp>

namespace mpinc {
    struct error: std::runtime_error {
        explicit error(const std::string &msg, const std::source_location &loc=std::source_location::current())
            : error { true, fmt::format("{} at {}:{}", msg, loc.file_name(), loc.line()) }
        {
        }

        explicit error(const std::string &msg, const std::exception &ex, const std::source_location &loc=std::source_location::current())
            : error { true, fmt::format("{} at {}:{} caused by {}: {}", msg, loc.file_name(), loc.line(), typeid(ex).name(), ex.what()) }
        {
        }
    protected:
        explicit error(const bool trace, const std::string &msg): std::runtime_error { msg }
        {
            if (trace)
                logger::debug("an exception created: {}", msg);
        }
    };

    enum class format_error_kind: uint8_t {
        unknown_tag,
        invalid_utf8,
        odd_map_payload
    };

    // The input violates the wire format. The stream cannot be resumed past this point.
    struct format_error: error {
        explicit format_error(const format_error_kind kind, const std::string &msg, const std::source_location &loc=std::source_location::current())
            : error { msg, loc }, _kind { kind }
        {
        }

        format_error_kind kind() const noexcept
        {
            return _kind;
        }
    private:
        format_error_kind _kind;
    };

    // A configured resource limit would be exceeded by the declared size of a value.
    struct limit_error: error {
        using error::error;
    };
}

namespace fmt {
    template<>
    struct formatter<mpinc::format_error_kind>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using mpinc::format_error_kind;
            switch (v) {
                case format_error_kind::unknown_tag: return fmt::format_to(ctx.out(), "unknown_tag");
                case format_error_kind::invalid_utf8: return fmt::format_to(ctx.out(), "invalid_utf8");
                case format_error_kind::odd_map_payload: return fmt::format_to(ctx.out(), "odd_map_payload");
                default: return fmt::format_to(ctx.out(), "format_error_kind: {}", static_cast<int>(v));
            }
        }
    };
}

#endif // !MPINC_ERROR_HPP
