/* This file is part of mpinc project: an incremental MessagePack decoder
 * Copyright (c) 2026 The mpinc authors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the mpinc source tree */

#include <filesystem>
#include <fstream>
#include <mpinc/config.hpp>
#include <mpinc/test.hpp>

using namespace mpinc;

namespace {
    std::string write_tmp(const std::string &name, const std::string_view text)
    {
        const auto path = (std::filesystem::temp_directory_path() / name).string();
        std::ofstream os { path, std::ios::binary | std::ios::trunc };
        os.write(text.data(), text.size());
        if (!os)
            throw error(fmt::format("unable to write {}", path));
        return path;
    }
}

suite config_suite = [] {
    "config"_test = [] {
        "defaults"_test = [] {
            const decoder_config cfg {};
            test_same(cfg.max_depth, 64);
            test_same(cfg.max_collection_size, 0x100'000);
            test_same(cfg.max_payload_size, 0x10'000'000);
            test_same(decoder_config::from_json("{}"), cfg);
        };
        "from_json"_test = [] {
            const auto cfg = decoder_config::from_json(R"({ "maxDepth": 8, "maxCollectionSize": 1000, "maxPayloadSize": 65536 })");
            test_same(cfg.max_depth, 8);
            test_same(cfg.max_collection_size, 1000);
            test_same(cfg.max_payload_size, 65536);
        };
        "partial"_test = [] {
            const auto cfg = decoder_config::from_json(R"({ "maxPayloadSize": 16 })");
            test_same(cfg.max_depth, decoder_config::default_max_depth);
            test_same(cfg.max_collection_size, decoder_config::default_max_collection_size);
            test_same(cfg.max_payload_size, 16);
        };
        "invalid"_test = [] {
            expect(throws<error>([] { decoder_config::from_json("{"); }));
            expect(throws<error>([] { decoder_config::from_json("[]"); }));
            expect(throws<error>([] { decoder_config::from_json(R"({ "maxDepth": -1 })"); }));
            expect(throws<error>([] { decoder_config::from_json(R"({ "maxDepth": "deep" })"); }));
            expect(throws<error>([] { decoder_config::from_json(R"({ "maxDepth": 0 })"); }));
            expect(throws<error>([] { decoder_config::from_json(R"({ "maxSize": 10 })"); }));
        };
        "load"_test = [] {
            const auto path = write_tmp("mpinc-config-test.json", R"({ "maxDepth": 3 })");
            const auto cfg = decoder_config::load(path);
            test_same(cfg.max_depth, 3);
            std::filesystem::remove(path);
            expect(throws<error>([&] { decoder_config::load(path); }));
        };
    };
};
