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

// akkara/akkaraio/include/akkaraio/SourceOptions.hpp
#pragma once

#include "Export.hpp"
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace akkaraio {
    /**
     * Order in which the planner hands out discovered splits.
     */
    enum class SplitOrder : uint8_t {
        Shuffled, ///< Random permutation (spreads load over key-range owners)
        DiscoveryOrder ///< Exactly as the format discovered them
    };

    [[nodiscard]] AKKARAIO_API std::string_view to_string(SplitOrder order) noexcept;

    /**
     * @throws ConfigurationError for anything but "shuffled" / "discovery"
     */
    [[nodiscard]] AKKARAIO_API SplitOrder parse_split_order(std::string_view text);

    /**
     * SourceOptions - Process-level knobs for planning and estimation.
     *
     * Fixed before the first planning or estimation call and read-only
     * afterwards; changing a SourceOptions captured in a live SourceContext
     * is not supported.
     *
     * JSON form (every key optional, unknown keys rejected):
     * ```json
     * {
     *   "suppress_remote_estimation": false,
     *   "min_bundle_size_bytes": 104857600,
     *   "split_order": "shuffled",
     *   "shuffle_seed": 42
     * }
     * ```
     */
    struct AKKARAIO_API SourceOptions {
        static constexpr uint64_t DEFAULT_MIN_BUNDLE_SIZE = 100ULL * 1024 * 1024;

        // Estimation
        bool suppress_remote_estimation = false;

        // Planning
        uint64_t min_bundle_size_bytes = DEFAULT_MIN_BUNDLE_SIZE;
        SplitOrder split_order = SplitOrder::Shuffled;
        std::optional<uint64_t> shuffle_seed;

        /**
         * @throws ConfigurationError on malformed JSON, wrong value types or unknown keys
         */
        [[nodiscard]] static SourceOptions from_json(std::string_view json_text);

        /**
         * @throws ConfigurationError if the file cannot be read or is malformed
         */
        [[nodiscard]] static SourceOptions load(const std::filesystem::path& path);

        /**
         * Overlays AKKARAIO_SUPPRESS_REMOTE_ESTIMATION, AKKARAIO_MIN_BUNDLE_SIZE_BYTES,
         * AKKARAIO_SPLIT_ORDER and AKKARAIO_SHUFFLE_SEED onto base.
         *
         * @throws ConfigurationError on malformed values
         */
        [[nodiscard]] static SourceOptions from_environment(SourceOptions base);

        /**
         * Environment overlay on default options.
         */
        [[nodiscard]] static SourceOptions from_environment();

        [[nodiscard]] std::string to_json() const;

        bool operator==(const SourceOptions&) const = default;
    };
} // namespace akkaraio
