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

// internal/include/format-api/InputFormat.hpp
#pragma once

#include "FormatConfig.hpp"
#include "InputSplit.hpp"
#include "RecordCursor.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace akkaraio::format {
    /**
     * One file matched by a resource identifier.
     */
    struct FileStatus {
        std::string path;
        uint64_t size_bytes{0};
    };

    /**
     * Soft bounds on split size. An unset bound leaves the format default.
     */
    struct SplitSizeHint {
        std::optional<uint64_t> min_bytes;
        std::optional<uint64_t> max_bytes;
    };

    /**
     * InputFormat - Split discovery and record decoding for one file format.
     *
     * Lifecycle:
     * 1. list_status() / get_splits() during planning
     * 2. open_cursor() once per split during reading
     *
     * Implementations hold no per-call state; a single instance may serve
     * any number of planners and readers.
     *
     * Thread-safety: All methods are thread-safe.
     */
    class InputFormat {
    public:
        virtual ~InputFormat() = default;

        /**
         * Format descriptor this implementation is registered under.
         */
        [[nodiscard]] virtual std::string_view id() const noexcept = 0;

        /**
         * Resolves resource to the files it names.
         *
         * @throws std::runtime_error on I/O failure (e.g. a literal path that does not exist)
         * @throws std::invalid_argument if resource uses an unsupported scheme
         */
        [[nodiscard]] virtual std::vector<FileStatus> list_status(
            std::string_view resource,
            const FormatConfig& config
        ) const = 0;

        /**
         * Partitions resource into splits.
         *
         * Splits come back in discovery order (file path order, then offset).
         *
         * @throws std::runtime_error on I/O failure
         */
        [[nodiscard]] virtual std::vector<std::shared_ptr<const InputSplit>> get_splits(
            std::string_view resource,
            const FormatConfig& config,
            const SplitSizeHint& hint
        ) const = 0;

        /**
         * Opens a cursor over split. The cursor checks stop before every
         * blocking step and raises ReadInterrupted once a stop is requested.
         *
         * @throws std::invalid_argument if split was not produced by a compatible format
         * @throws std::runtime_error on I/O failure
         */
        [[nodiscard]] virtual std::unique_ptr<RecordCursor> open_cursor(
            const InputSplit& split,
            const FormatConfig& config,
            std::stop_token stop
        ) const = 0;
    };
} // namespace akkaraio::format
