/* This file is part of mpinc project: an incremental MessagePack decoder
 * Copyright (c) 2026 The mpinc authors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the mpinc source tree */

#include <limits>
#include <mpinc/builder.hpp>
#include <mpinc/test.hpp>

using namespace mpinc;
using namespace mpinc::builder;

namespace {
    payload bytes_of(const std::string_view hex)
    {
        return payload { uint8_vector::from_hex(hex) };
    }
}

suite builder_suite = [] {
    "builder"_test = [] {
        "constants"_test = [] {
            test_same(build_nil(0, {}), value { nil {} });
            test_same(build_false(0, {}), value { false });
            test_same(build_true(0, {}), value { true });
        };
        "fixints"_test = [] {
            test_same(build_positive_fixint(0x7F, {}), value { 127 });
            test_same(build_negative_fixint(0, {}), value { 0 });
            test_same(build_negative_fixint(0x1F, {}), value { -31 });
        };
        "unsigned"_test = [] {
            test_same(build_uint(0, bytes_of("FF")), value { 255U });
            test_same(build_uint(0, bytes_of("FFFFFFFFFFFFFFFF")), value { std::numeric_limits<uint64_t>::max() });
            expect(throws<error>([] { build_uint(0, {}); }));
        };
        "signed"_test = [] {
            test_same(build_int(0, bytes_of("7F")), value { 127 });
            test_same(build_int(0, bytes_of("80")), value { -128 });
            test_same(build_int(0, bytes_of("FF38")), value { -200 });
            test_same(build_int(0, bytes_of("7FFFFFFF")), value { 0x7FFF'FFFF });
            test_same(build_int(0, bytes_of("FFFFFFFFFFFFFF7F")), value { -129 });
            test_same(build_int(0, bytes_of("7FFFFFFFFFFFFFFF")), value { std::numeric_limits<int64_t>::max() });
        };
        "floats"_test = [] {
            test_same(build_float32(0, bytes_of("3F800000")), value { 1.0F });
            test_same(build_float64(0, bytes_of("BFF0000000000000")), value { -1.0 });
            expect(throws<error>([] { build_float32(0, bytes_of("3F80")); }));
        };
        "str"_test = [] {
            test_same(build_str(3, bytes_of("616263")), value { "abc" });
            test_same(build_str(0, {}), value { "" });
            try {
                build_str(1, bytes_of("C0"));
                expect(false);
            } catch (const format_error &ex) {
                test_same(ex.kind(), format_error_kind::invalid_utf8);
            }
        };
        "bin and ext"_test = [] {
            test_same(build_bin(2, bytes_of("0102")), value { binary { uint8_vector::from_hex("0102") } });
            test_same(build_ext(1, bytes_of("FE01")), value { ext { -2, uint8_vector::from_hex("01") } });
            test_same(build_ext(0, bytes_of("05")), value { ext { 5, binary {} } });
            expect(throws<error>([] { build_ext(0, {}); }));
        };
        "array"_test = [] {
            test_same(build_array(2, payload { {}, array { 1, "x" } }), value { array { 1, "x" } });
        };
        "map"_test = [] {
            map expected {};
            expected.emplace_or_assign("k", 2);
            test_same(build_map(2, payload { {}, array { "k", 1, "k", 2 } }), value { expected });
            try {
                build_map(1, payload { {}, array { "k" } });
                expect(false);
            } catch (const format_error &ex) {
                test_same(ex.kind(), format_error_kind::odd_map_payload);
            }
        };
    };
};
