/* This file is part of mpinc project: an incremental MessagePack decoder
 * Copyright (c) 2026 The mpinc authors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the mpinc source tree */

#include <mpinc/accumulator.hpp>
#include <mpinc/test.hpp>

using namespace mpinc;

suite accumulator_suite = [] {
    "byte_accumulator"_test = [] {
        "zero capacity"_test = [] {
            byte_accumulator acc {};
            expect(acc.full());
            test_same(acc.feed(uint8_vector::from_hex("0102")), 0);
            test_same(acc.take().size(), 0);
        };
        "exact fill"_test = [] {
            byte_accumulator acc { 3 };
            expect(!acc.full());
            test_same(acc.feed(uint8_vector::from_hex("AABBCC")), 3);
            expect(acc.full());
            test_same(acc.take(), uint8_vector::from_hex("AABBCC"));
        };
        "takes only what fits"_test = [] {
            byte_accumulator acc { 2 };
            const auto data = uint8_vector::from_hex("010203");
            test_same(acc.feed(data), 2);
            test_same(acc.feed(data), 0);
            test_same(acc.bytes(), uint8_vector::from_hex("0102"));
        };
        "byte by byte"_test = [] {
            byte_accumulator acc { 4 };
            const auto data = uint8_vector::from_hex("DEADBEEF");
            for (size_t i = 0; i < data.size(); ++i) {
                expect(!acc.full());
                test_same(acc.feed(buffer { data }.subbuf(i, 1)), 1);
                test_same(acc.size(), i + 1);
            }
            expect(acc.full());
            test_same(acc.take(), data);
        };
        "empty input"_test = [] {
            byte_accumulator acc { 2 };
            test_same(acc.feed(buffer {}), 0);
            test_same(acc.size(), 0);
            test_same(acc.capacity(), 2);
        };
        "take requires a full accumulator"_test = [] {
            byte_accumulator acc { 2 };
            acc.feed(uint8_vector::from_hex("01"));
            expect(throws<error>([&] { acc.take(); }));
        };
        "large capacity grows on demand"_test = [] {
            byte_accumulator acc { 0xFFFF'FFFFULL };
            test_same(acc.feed(uint8_vector::from_hex("00112233")), 4);
            test_same(acc.size(), 4);
            expect(!acc.full());
        };
    };
};
