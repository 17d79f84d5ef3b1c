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

// internal/include/format-file/FileInputFormat.hpp
#pragma once

#include "FileSplit.hpp"
#include "format-api/InputFormat.hpp"

namespace akkaraio::format::file {
    /**
     * FileInputFormat - Base for formats whose splits are byte ranges of
     * local files.
     *
     * Provides listing (via PathResolver) and split computation; subclasses
     * supply open_cursor() and may opt out of splitting.
     *
     * Split computation per file:
     * - split_size = max(min, min(max, default_split_size()))
     * - cut split_size pieces while remaining / split_size > SPLIT_SLOP
     * - the tail (if any) becomes the last split
     * - an empty file yields one empty split
     * - a non-splittable format yields one split per file
     *
     * Thread-safety: Stateless, fully thread-safe.
     */
    class FileInputFormat : public InputFormat {
    public:
        static constexpr uint64_t DEFAULT_SPLIT_SIZE = 32ULL * 1024 * 1024;
        static constexpr double SPLIT_SLOP = 1.1;

        [[nodiscard]] std::vector<FileStatus> list_status(
            std::string_view resource,
            const FormatConfig& config
        ) const override;

        [[nodiscard]] std::vector<std::shared_ptr<const InputSplit>> get_splits(
            std::string_view resource,
            const FormatConfig& config,
            const SplitSizeHint& hint
        ) const override;

        /**
         * Effective split size for a hint; exposed for tests and planners.
         */
        [[nodiscard]] uint64_t compute_split_size(const SplitSizeHint& hint) const noexcept;

    protected:
        [[nodiscard]] virtual bool is_splittable(const FormatConfig& config) const noexcept {
            (void)config;
            return true;
        }

        [[nodiscard]] virtual uint64_t default_split_size() const noexcept { return DEFAULT_SPLIT_SIZE; }

        /**
         * Downcasts split to FileSplit.
         *
         * @throws std::invalid_argument if split is of another type
         */
        [[nodiscard]] static const FileSplit& as_file_split(const InputSplit& split);
    };
} // namespace akkaraio::format::file
