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

// internal/include/format-file/PathResolver.hpp
#pragma once

#include "format-api/InputFormat.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace akkaraio::format::file {
    /**
     * Removes an optional "file://" prefix.
     *
     * @throws std::invalid_argument for any other scheme ("s3://...", "hdfs://...")
     */
    [[nodiscard]] std::string strip_scheme(std::string_view resource);

    /**
     * Whether path contains glob metacharacters (*, ?, [).
     */
    [[nodiscard]] bool is_glob(std::string_view path) noexcept;

    /**
     * Names starting with '.' or '_' are hidden (side files, markers).
     */
    [[nodiscard]] bool is_hidden(std::string_view file_name) noexcept;

    /**
     * Resolves a resource identifier to regular files, sorted by path.
     *
     * - Literal file: the file itself.
     * - Literal directory: its non-hidden regular files (one level).
     * - Glob: every non-hidden match, directories expanded one level.
     *
     * @throws std::runtime_error if a literal path does not exist or cannot be read
     * @throws std::invalid_argument on an unsupported scheme
     */
    [[nodiscard]] std::vector<FileStatus> resolve(std::string_view resource);
} // namespace akkaraio::format::file
