/* This file is part of mpinc project: an incremental MessagePack decoder
 * Copyright (c) 2026 The mpinc authors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the mpinc source tree */

#include <mpinc/error.hpp>
#include <mpinc/logger.hpp>
#include <mpinc/test.hpp>

using namespace mpinc;

suite logger_suite = [] {
    "logger"_test = [] {
        "api"_test = [] {
            // checks that the code compiles and does not fail
            logger::trace("OK - trace");
            logger::trace("OK - {}", "trace");
            logger::debug("OK - debug");
            logger::debug("OK - {}", "debug");
            logger::info("OK - info");
            logger::info("OK - {}", "info");
            logger::warn("OK - warn");
            logger::warn("OK - {}", "warn");
            logger::error("OK - error");
            logger::error("OK - {}", "error");
            expect(true);
        };
        "tracing flag"_test = [] {
            const auto prev = logger::tracing_enabled();
            logger::tracing_enabled() = !prev;
            test_same(logger::tracing_enabled(), !prev);
            logger::tracing_enabled() = prev;
        };
        "run_log_errors"_test = [] {
            const auto ex1 = logger::run_log_errors([] {});
            expect(!ex1);
            const auto ex2 = logger::run_log_errors([] { throw error("Something bad!"); });
            expect(static_cast<bool>(ex2));
            size_t num_cleanups = 0;
            logger::run_log_errors([] { throw limit_error("too big"); }, [&] { ++num_cleanups; });
            test_same(num_cleanups, 1);
        };
        "run_log_errors_rethrow"_test = [] {
            expect(nothrow([] { logger::run_log_errors_rethrow([] {}); }));
            expect(throws<limit_error>([] { logger::run_log_errors_rethrow([] { throw limit_error("too big"); }); }));
        };
    };
};
