/* This file is part of mpinc project: an incremental MessagePack decoder
 * Copyright (c) 2026 The mpinc authors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the mpinc source tree */
#ifndef MPINC_VALUE_HPP
#define MPINC_VALUE_HPP

#include <concepts>
#include <cstdint>
#include <source_location>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>
#include <mpinc/bytes.hpp>
#include <mpinc/error.hpp>
#include <mpinc/format.hpp>

namespace mpinc {
    struct value;

    struct nil {
        bool operator==(const nil &) const noexcept =default;
    };

    using binary = uint8_vector;
    using array = std::vector<value>;
    using map_entry = std::pair<value, value>;

    // Keeps the order in which keys first appeared. A repeated key overwrites the earlier value in place.
    struct map: std::vector<map_entry> {
        using base_type = std::vector<map_entry>;
        using base_type::base_type;

        // items hold keys and values interleaved; keys are located through a hash index
        static map from_pairs(array &&items);

        void emplace_or_assign(value &&k, value &&v);
        const value *find(const value &k) const noexcept;
        const value &at(const value &k, const std::source_location &loc=std::source_location::current()) const;
        bool operator==(const map &o) const;
    };

    struct ext {
        int8_t type = 0;
        binary data {};

        bool operator==(const ext &o) const =default;
    };

    enum class value_type: uint8_t {
        nil,
        boolean,
        int64,
        uint64,
        float32,
        float64,
        str,
        bin,
        array,
        map,
        ext
    };

    struct value {
        using storage_type = std::variant<nil, bool, int64_t, uint64_t, float, double, std::string, binary, array, map, ext>;

        static std::string_view type_name(value_type type);

        value() =default;
        value(const value &) =default;
        value(value &&) =default;

        value(const nil v): _val { std::in_place_type<nil>, v }
        {
        }

        value(const bool v): _val { std::in_place_type<bool>, v }
        {
        }

        template<std::integral T>
            requires (!std::is_same_v<T, bool>)
        value(const T v)
        {
            if constexpr (std::is_signed_v<T>)
                _val.emplace<int64_t>(v);
            else
                _val.emplace<uint64_t>(v);
        }

        value(const float v): _val { std::in_place_type<float>, v }
        {
        }

        value(const double v): _val { std::in_place_type<double>, v }
        {
        }

        value(const char *v): _val { std::in_place_type<std::string>, v }
        {
        }

        value(std::string v): _val { std::in_place_type<std::string>, std::move(v) }
        {
        }

        value(binary v): _val { std::in_place_type<binary>, std::move(v) }
        {
        }

        value(array v): _val { std::in_place_type<array>, std::move(v) }
        {
        }

        value(map v): _val { std::in_place_type<map>, std::move(v) }
        {
        }

        value(ext v): _val { std::in_place_type<ext>, std::move(v) }
        {
        }

        value &operator=(const value &) =default;
        value &operator=(value &&) =default;

        bool operator==(const value &o) const
        {
            return _val == o._val;
        }

        value_type type() const noexcept
        {
            return static_cast<value_type>(_val.index());
        }

        std::string_view type_name() const
        {
            return type_name(type());
        }

        bool is_nil() const noexcept
        {
            return std::holds_alternative<nil>(_val);
        }

        bool as_bool(const std::source_location &loc=std::source_location::current()) const
        {
            return _get<bool>(loc);
        }

        int64_t as_int(const std::source_location &loc=std::source_location::current()) const
        {
            return _get<int64_t>(loc);
        }

        uint64_t as_uint(const std::source_location &loc=std::source_location::current()) const
        {
            return _get<uint64_t>(loc);
        }

        float as_float32(const std::source_location &loc=std::source_location::current()) const
        {
            return _get<float>(loc);
        }

        double as_float64(const std::source_location &loc=std::source_location::current()) const
        {
            return _get<double>(loc);
        }

        const std::string &as_str(const std::source_location &loc=std::source_location::current()) const
        {
            return _get<std::string>(loc);
        }

        const binary &as_bin(const std::source_location &loc=std::source_location::current()) const
        {
            return _get<binary>(loc);
        }

        const array &as_array(const std::source_location &loc=std::source_location::current()) const
        {
            return _get<array>(loc);
        }

        const map &as_map(const std::source_location &loc=std::source_location::current()) const
        {
            return _get<map>(loc);
        }

        const ext &as_ext(const std::source_location &loc=std::source_location::current()) const
        {
            return _get<ext>(loc);
        }

        const storage_type &storage() const noexcept
        {
            return _val;
        }

        std::string to_string() const;
        // equal values have equal hashes, including 0.0 and -0.0
        size_t hash() const noexcept;
    private:
        storage_type _val {};

        template<typename T>
        const T &_get(const std::source_location &loc) const
        {
            if (const auto *ptr = std::get_if<T>(&_val); ptr) [[likely]]
                return *ptr;
            throw error(fmt::format("expected a value of type {} but got {}", type_name(_type_of<T>()), type_name()), loc);
        }

        template<typename T>
        static constexpr value_type _type_of()
        {
            if constexpr (std::is_same_v<T, bool>) return value_type::boolean;
            else if constexpr (std::is_same_v<T, int64_t>) return value_type::int64;
            else if constexpr (std::is_same_v<T, uint64_t>) return value_type::uint64;
            else if constexpr (std::is_same_v<T, float>) return value_type::float32;
            else if constexpr (std::is_same_v<T, double>) return value_type::float64;
            else if constexpr (std::is_same_v<T, std::string>) return value_type::str;
            else if constexpr (std::is_same_v<T, binary>) return value_type::bin;
            else if constexpr (std::is_same_v<T, array>) return value_type::array;
            else if constexpr (std::is_same_v<T, map>) return value_type::map;
            else if constexpr (std::is_same_v<T, ext>) return value_type::ext;
            else return value_type::nil;
        }
    };
}

namespace fmt {
    template<>
    struct formatter<mpinc::value_type>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}", mpinc::value::type_name(v));
        }
    };

    template<>
    struct formatter<mpinc::value>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}", v.to_string());
        }
    };
}

namespace std {
    template<>
    struct hash<mpinc::value> {
        size_t operator()(const mpinc::value &v) const noexcept
        {
            return v.hash();
        }
    };
}

#endif // !MPINC_VALUE_HPP
