/* This file is part of mpinc project: an incremental MessagePack decoder
 * Copyright (c) 2026 The mpinc authors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the mpinc source tree */

#include <mpinc/message-decoder.hpp>
#include <mpinc/test.hpp>

using namespace mpinc;

suite message_decoder_suite = [] {
    "message_decoder"_test = [] {
        "single write"_test = [] {
            message_decoder dec {};
            expect(!dec.is_complete());
            test_same(dec.write(uint8_vector::from_hex("9301A374776F03")), 7);
            expect(dec.is_complete());
            test_same(dec.value(), value { array { 1, "two", 3 } });
            test_same(dec.consumed(), 7);
        };
        "chunked writes"_test = [] {
            message_decoder dec {};
            test_same(dec.write(uint8_vector::from_hex("93")), 1);
            test_same(dec.write(uint8_vector::from_hex("01A374")), 3);
            expect(!dec.is_complete());
            test_same(dec.phase(), decode_phase::awaiting_payload);
            test_same(dec.write(uint8_vector::from_hex("776F03")), 3);
            test_same(dec.take(), value { array { 1, "two", 3 } });
        };
        "writes after completion are ignored"_test = [] {
            message_decoder dec {};
            test_same(dec.write(uint8_vector::from_hex("C3")), 1);
            test_same(dec.write(uint8_vector::from_hex("C2C2")), 0);
            test_same(dec.write(buffer {}), 0);
            test_same(dec.value(), value { true });
            test_same(dec.consumed(), 1);
        };
        "leftover bytes start the next message"_test = [] {
            const auto bytes = uint8_vector::from_hex("A16101C0");
            const buffer buf { bytes };
            std::vector<value> values {};
            size_t pos = 0;
            while (pos < buf.size()) {
                message_decoder dec {};
                pos += dec.write(buf.subbuf(pos));
                expect(dec.is_complete());
                values.emplace_back(dec.take());
            }
            test_same(values.size(), 3);
            test_same(values.at(0), value { "a" });
            test_same(values.at(1), value { 1 });
            test_same(values.at(2), value { nil {} });
        };
        "value before completion"_test = [] {
            message_decoder dec {};
            dec.write(uint8_vector::from_hex("A3"));
            expect(throws<error>([&] { dec.value(); }));
        };
        "limits"_test = [] {
            decoder_config cfg {};
            cfg.max_payload_size = 2;
            message_decoder dec { cfg };
            expect(throws<limit_error>([&] { dec.write(uint8_vector::from_hex("A3616263")); }));
        };
    };
    "decode"_test = [] {
        "exact input"_test = [] {
            test_same(decode(uint8_vector::from_hex("CB3FB999999999999A")), value { 0.1 });
            test_same(decode(uint8_vector::from_hex("80")), value { map {} });
        };
        "incomplete input"_test = [] {
            expect(throws<error>([] { decode(uint8_vector::from_hex("9301")); }));
            expect(throws<error>([] { decode(buffer {}); }));
        };
        "trailing bytes"_test = [] {
            expect(throws<error>([] { decode(uint8_vector::from_hex("C0C0")); }));
        };
        "format errors"_test = [] {
            expect(throws<format_error>([] { decode(uint8_vector::from_hex("91C1")); }));
        };
    };
};
