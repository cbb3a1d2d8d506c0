/* This file is part of mpinc project: an incremental MessagePack decoder
 * Copyright (c) 2026 The mpinc authors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the mpinc source tree */

#include <fstream>
#include <iterator>
#include <boost/json.hpp>
#include <mpinc/config.hpp>
#include <mpinc/error.hpp>
#include <mpinc/logger.hpp>

namespace mpinc {
    namespace json = boost::json;

    static size_t parse_limit(const json::value &jv, const std::string_view name)
    {
        if (jv.is_uint64())
            return jv.get_uint64();
        if (jv.is_int64() && jv.get_int64() >= 0)
            return static_cast<size_t>(jv.get_int64());
        throw error(fmt::format("config value {} must be a non-negative integer but got: {}", name, json::serialize(jv)));
    }

    decoder_config decoder_config::from_json(const std::string_view text)
    {
        json::value jv;
        try {
            jv = json::parse(json::string_view { text.data(), text.size() });
        } catch (const std::exception &ex) {
            throw error("failed to parse the decoder config", ex);
        }
        if (!jv.is_object())
            throw error(fmt::format("the decoder config must be a JSON object but got: {}", json::serialize(jv)));
        decoder_config cfg {};
        for (const auto &kv: jv.get_object()) {
            const std::string_view key { kv.key().data(), kv.key().size() };
            const auto &val = kv.value();
            if (key == "maxDepth") {
                cfg.max_depth = parse_limit(val, key);
            } else if (key == "maxCollectionSize") {
                cfg.max_collection_size = parse_limit(val, key);
            } else if (key == "maxPayloadSize") {
                cfg.max_payload_size = parse_limit(val, key);
            } else {
                throw error(fmt::format("unsupported decoder config key: {}", key));
            }
        }
        if (cfg.max_depth == 0)
            throw error("maxDepth must be at least 1");
        return cfg;
    }

    decoder_config decoder_config::load(const std::string &path)
    {
        std::ifstream is { path, std::ios::binary };
        if (!is)
            throw error(fmt::format("unable to open the decoder config file: {}", path));
        const std::string text { std::istreambuf_iterator<char> { is }, std::istreambuf_iterator<char> {} };
        auto cfg = from_json(text);
        logger::debug("loaded the decoder config from {}: {}", path, cfg);
        return cfg;
    }
}
