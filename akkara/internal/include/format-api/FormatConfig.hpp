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

// internal/include/format-api/FormatConfig.hpp
#pragma once

#include <map>
#include <string>
#include <string_view>

namespace akkaraio::format {
    /**
     * FormatConfig - Free-form string overrides handed to a format.
     *
     * Keys a format does not recognize are ignored.
     */
    using FormatConfig = std::map<std::string, std::string, std::less<>>;

    /**
     * Reads a boolean override ("true"/"false"/"1"/"0").
     *
     * @throws std::invalid_argument if the value is present but not a boolean
     */
    [[nodiscard]] bool config_bool(const FormatConfig& config, std::string_view key, bool fallback);

    /**
     * Reads a single-character override.
     *
     * @throws std::invalid_argument if the value is present but not exactly one character
     */
    [[nodiscard]] char config_char(const FormatConfig& config, std::string_view key, char fallback);
} // namespace akkaraio::format
