/* This file is part of mpinc project: an incremental MessagePack decoder
 * Copyright (c) 2026 The mpinc authors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the mpinc source tree */

#include <array>
#include <functional>
#include <iterator>
#include <unordered_map>
#include <mpinc/value.hpp>

namespace mpinc {
    void map::emplace_or_assign(value &&k, value &&v)
    {
        for (auto &[ek, ev]: *this) {
            if (ek == k) {
                ev = std::move(v);
                return;
            }
        }
        emplace_back(std::move(k), std::move(v));
    }

    const value *map::find(const value &k) const noexcept
    {
        for (const auto &[ek, ev]: *this) {
            if (ek == k)
                return &ev;
        }
        return nullptr;
    }

    const value &map::at(const value &k, const std::source_location &loc) const
    {
        if (const auto *v = find(k); v) [[likely]]
            return *v;
        throw error(fmt::format("map does not contain key {}", k), loc);
    }

    map map::from_pairs(array &&items)
    {
        if (items.size() % 2 != 0) [[unlikely]]
            throw error(fmt::format("map items must come in pairs but got {} items", items.size()));
        map m {};
        m.reserve(items.size() / 2);
        // positions of the entries by the hash of their keys
        std::unordered_multimap<size_t, size_t> index {};
        index.reserve(items.size() / 2);
        for (size_t i = 0; i < items.size(); i += 2) {
            auto &k = items[i];
            auto &v = items[i + 1];
            const auto k_hash = k.hash();
            bool found = false;
            for (auto [it, end] = index.equal_range(k_hash); it != end; ++it) {
                if (auto &entry = m[it->second]; entry.first == k) {
                    entry.second = std::move(v);
                    found = true;
                    break;
                }
            }
            if (!found) {
                index.emplace(k_hash, m.size());
                m.emplace_back(std::move(k), std::move(v));
            }
        }
        return m;
    }

    bool map::operator==(const map &o) const
    {
        return static_cast<const base_type &>(*this) == static_cast<const base_type &>(o);
    }

    std::string_view value::type_name(const value_type type)
    {
        static const std::array<std::string_view, 11> names {
            "nil", "bool", "int", "uint", "float32", "float64",
            "str", "bin", "array", "map", "ext"
        };
        const auto type_idx = static_cast<size_t>(type);
        if (type_idx >= names.size()) [[unlikely]]
            throw error(fmt::format("unsupported value type index: {}", type_idx));
        return names[type_idx];
    }

    static void format_value(std::back_insert_iterator<std::string> out_it, const value &v)
    {
        std::visit([&](const auto &val) {
            using T = std::decay_t<decltype(val)>;
            if constexpr (std::is_same_v<T, nil>) {
                fmt::format_to(out_it, "nil");
            } else if constexpr (std::is_same_v<T, std::string>) {
                fmt::format_to(out_it, "\"{}\"", val);
            } else if constexpr (std::is_same_v<T, binary>) {
                fmt::format_to(out_it, "#{}", static_cast<buffer>(val));
            } else if constexpr (std::is_same_v<T, array>) {
                fmt::format_to(out_it, "[");
                for (auto it = val.begin(); it != val.end(); ++it) {
                    if (it != val.begin())
                        fmt::format_to(out_it, ", ");
                    format_value(out_it, *it);
                }
                fmt::format_to(out_it, "]");
            } else if constexpr (std::is_same_v<T, map>) {
                fmt::format_to(out_it, "{{");
                for (auto it = val.begin(); it != val.end(); ++it) {
                    if (it != val.begin())
                        fmt::format_to(out_it, ", ");
                    format_value(out_it, it->first);
                    fmt::format_to(out_it, ": ");
                    format_value(out_it, it->second);
                }
                fmt::format_to(out_it, "}}");
            } else if constexpr (std::is_same_v<T, ext>) {
                fmt::format_to(out_it, "ext({}, #{})", static_cast<int>(val.type), static_cast<buffer>(val.data));
            } else if constexpr (std::is_same_v<T, uint64_t>) {
                fmt::format_to(out_it, "{}u", val);
            } else {
                fmt::format_to(out_it, "{}", val);
            }
        }, v.storage());
    }

    static size_t hash_combine(const size_t seed, const size_t h) noexcept
    {
        return seed ^ (h + 0x9E37'79B9'7F4A'7C15ULL + (seed << 6) + (seed >> 2));
    }

    size_t value::hash() const noexcept
    {
        const size_t h = std::visit([](const auto &val) -> size_t {
            using T = std::decay_t<decltype(val)>;
            if constexpr (std::is_same_v<T, nil>) {
                return 0;
            } else if constexpr (std::is_same_v<T, float> || std::is_same_v<T, double>) {
                return val == 0 ? 0 : std::hash<T> {}(val);
            } else if constexpr (std::is_same_v<T, binary>) {
                return std::hash<std::string_view> {}(val.str());
            } else if constexpr (std::is_same_v<T, array>) {
                size_t res = val.size();
                for (const auto &item: val)
                    res = hash_combine(res, item.hash());
                return res;
            } else if constexpr (std::is_same_v<T, map>) {
                size_t res = val.size();
                for (const auto &[k, v]: val)
                    res = hash_combine(hash_combine(res, k.hash()), v.hash());
                return res;
            } else if constexpr (std::is_same_v<T, ext>) {
                return hash_combine(static_cast<uint8_t>(val.type), std::hash<std::string_view> {}(val.data.str()));
            } else {
                return std::hash<T> {}(val);
            }
        }, _val);
        return hash_combine(_val.index(), h);
    }

    std::string value::to_string() const
    {
        std::string res {};
        format_value(std::back_inserter(res), *this);
        return res;
    }
}
