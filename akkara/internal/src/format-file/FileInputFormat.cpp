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

// internal/src/format-file/FileInputFormat.cpp
#include "format-file/FileInputFormat.hpp"
#include "format-file/PathResolver.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>

namespace akkaraio::format::file {
    std::vector<FileStatus> FileInputFormat::list_status(std::string_view resource, const FormatConfig& config) const {
        (void)config;
        return resolve(resource);
    }

    uint64_t FileInputFormat::compute_split_size(const SplitSizeHint& hint) const noexcept {
        const uint64_t min_size = std::max<uint64_t>(1, hint.min_bytes.value_or(1));
        const uint64_t max_size = hint.max_bytes.value_or(std::numeric_limits<uint64_t>::max());
        return std::max(min_size, std::min(max_size, default_split_size()));
    }

    std::vector<std::shared_ptr<const InputSplit>> FileInputFormat::get_splits(
        std::string_view resource,
        const FormatConfig& config,
        const SplitSizeHint& hint
    ) const {
        const auto files = list_status(resource, config);
        const uint64_t split_size = compute_split_size(hint);
        const bool splittable = is_splittable(config);

        std::vector<std::shared_ptr<const InputSplit>> splits;
        for (const auto& f : files) {
            const uint64_t size = f.size_bytes;

            if (size == 0 || !splittable) {
                splits.push_back(std::make_shared<const FileSplit>(f.path, 0, size));
                continue;
            }

            uint64_t remaining = size;
            while (static_cast<double>(remaining) / static_cast<double>(split_size) > SPLIT_SLOP) {
                splits.push_back(std::make_shared<const FileSplit>(f.path, size - remaining, split_size));
                remaining -= split_size;
            }
            if (remaining != 0) { splits.push_back(std::make_shared<const FileSplit>(f.path, size - remaining, remaining)); }
        }
        return splits;
    }

    const FileSplit& FileInputFormat::as_file_split(const InputSplit& split) {
        if (split.type_tag() != FileSplit::TYPE_TAG) {
            throw std::invalid_argument("FileInputFormat: unsupported split type " + std::string(split.type_tag()));
        }
        return static_cast<const FileSplit&>(split);
    }
} // namespace akkaraio::format::file
