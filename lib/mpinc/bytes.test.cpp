/* This file is part of mpinc project: an incremental MessagePack decoder
 * Copyright (c) 2026 The mpinc authors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the mpinc source tree */

#include <limits>
#include <mpinc/bytes.hpp>
#include <mpinc/test.hpp>

using namespace mpinc;

suite bytes_suite = [] {
    "bytes"_test = [] {
        "from_hex"_test = [] {
            const auto bytes = uint8_vector::from_hex("00FFa5");
            test_same(bytes.size(), 3);
            test_same(bytes[2], uint8_t { 0xA5 });
            expect(throws<error>([] { uint8_vector::from_hex("ABC"); }));
            expect(throws<error>([] { uint8_vector::from_hex("XY"); }));
            expect(throws<error>([] { uint8_vector::from_hex("\xC3\xA9"); }));
        };
        "format"_test = [] {
            test_same(fmt::format("{}", uint8_vector::from_hex("deadbeef")), std::string { "DEADBEEF" });
            test_same(fmt::format("{}", buffer {}), std::string {});
        };
        "subbuf"_test = [] {
            const auto bytes = uint8_vector::from_hex("0102030405");
            const buffer buf { bytes };
            test_same(buf.subbuf(1, 2), uint8_vector::from_hex("0203"));
            test_same(buf.subbuf(5).size(), 0);
            expect(throws<error>([&] { buf.subbuf(4, 2); }));
            expect(throws<error>([&] { buf.subbuf(6); }));
        };
        "uint_from_be"_test = [] {
            test_same(uint_from_be(buffer {}), 0);
            test_same(uint_from_be(uint8_vector::from_hex("0100")), 0x100);
            test_same(uint_from_be(uint8_vector::from_hex("FFFFFFFFFFFFFFFF")), std::numeric_limits<uint64_t>::max());
            expect(throws<error>([] { uint_from_be(uint8_vector::from_hex("010000000000000000")); }));
        };
    };
    "error"_test = [] {
        "message carries the location"_test = [] {
            const error ex { "something failed" };
            expect(std::string_view { ex.what() }.find("something failed at ") == 0);
            expect(std::string_view { ex.what() }.find("bytes.test.cpp") != std::string_view::npos);
        };
        "format_error kind"_test = [] {
            const format_error ex { format_error_kind::odd_map_payload, "odd" };
            test_same(ex.kind(), format_error_kind::odd_map_payload);
            test_same(fmt::format("{}", ex.kind()), std::string { "odd_map_payload" });
            expect(throws<error>([] { throw limit_error("too big"); }));
        };
    };
};
