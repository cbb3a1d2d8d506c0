/* This file is part of mpinc project: an incremental MessagePack decoder
 * Copyright (c) 2026 The mpinc authors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the mpinc source tree */
#ifndef MPINC_ACCUMULATOR_HPP
#define MPINC_ACCUMULATOR_HPP

#include <algorithm>
#include <mpinc/bytes.hpp>
#include <mpinc/error.hpp>

namespace mpinc {
    /*
     * Collects exactly capacity() bytes delivered across any number of feed calls.
     * The storage grows with the data actually received, so a large declared capacity
     * is not allocated up front. The accumulator knows nothing about what the bytes mean:
     * the decoder uses the same type for the tag byte, the length field and opaque payloads.
     */
    struct byte_accumulator {
        static constexpr size_t max_reserve = 0x10000;

        explicit byte_accumulator(const size_t capacity=0):
            _capacity { capacity }
        {
            _data.reserve(std::min(_capacity, max_reserve));
        }

        // returns the number of bytes taken from the front of bytes
        size_t feed(const buffer bytes)
        {
            const auto num = std::min(_capacity - _data.size(), bytes.size());
            _data.insert(_data.end(), bytes.begin(), bytes.begin() + num);
            return num;
        }

        bool full() const noexcept
        {
            return _data.size() == _capacity;
        }

        size_t size() const noexcept
        {
            return _data.size();
        }

        size_t capacity() const noexcept
        {
            return _capacity;
        }

        buffer bytes() const noexcept
        {
            return _data;
        }

        uint8_vector take()
        {
            if (!full()) [[unlikely]]
                throw error(fmt::format("cannot take a partially filled accumulator: {} of {} bytes", _data.size(), _capacity));
            auto res = std::move(_data);
            _data = uint8_vector {};
            _capacity = 0;
            return res;
        }
    private:
        size_t _capacity;
        uint8_vector _data {};
    };
}

#endif // !MPINC_ACCUMULATOR_HPP
