/*
 * AkkaraIO - Splittable bounded sources over AkkaraDB block files and text files
 * Copyright (C) 2026 Swift Storm Studio
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Affero General Public License as
 * published by the Free Software Foundation, either version 3 of the License.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 *
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */

// akkara/akkaraio/src/SourceOptions.cpp
#include "akkaraio/SourceOptions.hpp"
#include "akkaraio/Errors.hpp"

#include <charconv>
#include <cstdlib>
#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

namespace akkaraio {
    using json = nlohmann::json;

    namespace {
        constexpr std::string_view ENV_SUPPRESS = "AKKARAIO_SUPPRESS_REMOTE_ESTIMATION";
        constexpr std::string_view ENV_MIN_BUNDLE = "AKKARAIO_MIN_BUNDLE_SIZE_BYTES";
        constexpr std::string_view ENV_SPLIT_ORDER = "AKKARAIO_SPLIT_ORDER";
        constexpr std::string_view ENV_SHUFFLE_SEED = "AKKARAIO_SHUFFLE_SEED";

        std::optional<std::string> env(std::string_view name) {
            const char* v = std::getenv(std::string(name).c_str());
            if (v == nullptr) return std::nullopt;
            return std::string(v);
        }

        bool parse_bool(std::string_view name, std::string_view v) {
            if (v == "1" || v == "true" || v == "TRUE" || v == "yes") return true;
            if (v == "0" || v == "false" || v == "FALSE" || v == "no") return false;
            throw ConfigurationError(std::string(name) + ": expected a boolean, got '" + std::string(v) + "'");
        }

        uint64_t parse_u64(std::string_view name, std::string_view v) {
            uint64_t out = 0;
            const auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), out);
            if (ec != std::errc{} || ptr != v.data() + v.size() || v.empty()) {
                throw ConfigurationError(std::string(name) + ": expected an unsigned integer, got '" + std::string(v) + "'");
            }
            return out;
        }
    } // anonymous namespace

    std::string_view to_string(SplitOrder order) noexcept {
        switch (order) {
            case SplitOrder::Shuffled: return "shuffled";
            case SplitOrder::DiscoveryOrder: return "discovery";
        }
        return "shuffled";
    }

    SplitOrder parse_split_order(std::string_view text) {
        if (text == "shuffled") return SplitOrder::Shuffled;
        if (text == "discovery") return SplitOrder::DiscoveryOrder;
        throw ConfigurationError("split_order: expected 'shuffled' or 'discovery', got '" + std::string(text) + "'");
    }

    SourceOptions SourceOptions::from_json(std::string_view json_text) {
        json j;
        try { j = json::parse(json_text); }
        catch (const json::parse_error& e) { throw ConfigurationError(std::string("SourceOptions: malformed JSON: ") + e.what()); }

        if (!j.is_object()) { throw ConfigurationError("SourceOptions: top-level JSON value must be an object"); }

        SourceOptions opts;
        try {
            for (const auto& [key, value] : j.items()) {
                if (key == "suppress_remote_estimation") { opts.suppress_remote_estimation = value.get<bool>(); }
                else if (key == "min_bundle_size_bytes") { opts.min_bundle_size_bytes = value.get<uint64_t>(); }
                else if (key == "split_order") { opts.split_order = parse_split_order(value.get<std::string>()); }
                else if (key == "shuffle_seed") {
                    if (value.is_null()) { opts.shuffle_seed.reset(); }
                    else { opts.shuffle_seed = value.get<uint64_t>(); }
                }
                else { throw ConfigurationError("SourceOptions: unknown key '" + key + "'"); }
            }
        }
        catch (const json::type_error& e) { throw ConfigurationError(std::string("SourceOptions: wrong value type: ") + e.what()); }

        return opts;
    }

    SourceOptions SourceOptions::load(const std::filesystem::path& path) {
        std::ifstream in(path, std::ios::binary);
        if (!in) { throw ConfigurationError("SourceOptions: cannot open " + path.string()); }

        std::ostringstream ss;
        ss << in.rdbuf();
        return from_json(ss.str());
    }

    SourceOptions SourceOptions::from_environment() { return from_environment(SourceOptions{}); }

    SourceOptions SourceOptions::from_environment(SourceOptions base) {
        if (auto v = env(ENV_SUPPRESS)) { base.suppress_remote_estimation = parse_bool(ENV_SUPPRESS, *v); }
        if (auto v = env(ENV_MIN_BUNDLE)) { base.min_bundle_size_bytes = parse_u64(ENV_MIN_BUNDLE, *v); }
        if (auto v = env(ENV_SPLIT_ORDER)) { base.split_order = parse_split_order(*v); }
        if (auto v = env(ENV_SHUFFLE_SEED)) { base.shuffle_seed = parse_u64(ENV_SHUFFLE_SEED, *v); }
        return base;
    }

    std::string SourceOptions::to_json() const {
        json j = {
            {"suppress_remote_estimation", suppress_remote_estimation},
            {"min_bundle_size_bytes", min_bundle_size_bytes},
            {"split_order", std::string(akkaraio::to_string(split_order))}
        };
        if (shuffle_seed) { j["shuffle_seed"] = *shuffle_seed; }
        return j.dump();
    }
} // namespace akkaraio
