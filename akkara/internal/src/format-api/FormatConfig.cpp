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

// internal/src/format-api/FormatConfig.cpp
#include "format-api/FormatConfig.hpp"

#include <stdexcept>

namespace akkaraio::format {
    bool config_bool(const FormatConfig& config, std::string_view key, bool fallback) {
        const auto it = config.find(key);
        if (it == config.end()) return fallback;

        const auto& v = it->second;
        if (v == "true" || v == "1") return true;
        if (v == "false" || v == "0") return false;
        throw std::invalid_argument("FormatConfig: '" + std::string(key) + "' is not a boolean: " + v);
    }

    char config_char(const FormatConfig& config, std::string_view key, char fallback) {
        const auto it = config.find(key);
        if (it == config.end()) return fallback;

        const auto& v = it->second;
        if (v.size() != 1) { throw std::invalid_argument("FormatConfig: '" + std::string(key) + "' must be a single character"); }
        return v[0];
    }
} // namespace akkaraio::format
