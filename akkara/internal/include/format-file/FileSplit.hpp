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

// internal/include/format-file/FileSplit.hpp
#pragma once

#include "core/buffer/BufferView.hpp"
#include "format-api/InputSplit.hpp"
#include <memory>
#include <string>
#include <vector>

namespace akkaraio::format::file {
    /**
     * FileSplit - Byte range [start, start + length) of one file.
     *
     * Payload layout (Little-Endian):
     * [0..3]           path_len (u32)
     * [4..4+path_len)  path (UTF-8, no terminator)
     * [+0..+7]         start (u64)
     * [+8..+15]        length (u64)
     *
     * Locations are a scheduling hint only and are not serialized.
     *
     * Thread-safety: Immutable, fully thread-safe.
     */
    class FileSplit final : public InputSplit {
    public:
        static constexpr std::string_view TYPE_TAG = "akk.file-split";

        FileSplit(std::string path, uint64_t start, uint64_t length, std::vector<std::string> hosts = {});

        /**
         * Reconstructs a split from a payload written by write_to().
         *
         * @throws std::out_of_range if the payload is truncated
         * @throws std::runtime_error if the payload has trailing bytes
         */
        [[nodiscard]] static std::shared_ptr<const FileSplit> decode(core::BufferView payload);

        [[nodiscard]] const std::string& path() const noexcept { return path_; }
        [[nodiscard]] uint64_t start() const noexcept { return start_; }
        [[nodiscard]] uint64_t end() const noexcept { return start_ + length_; }

        [[nodiscard]] std::string_view type_tag() const noexcept override { return TYPE_TAG; }
        [[nodiscard]] uint64_t length() const noexcept override { return length_; }
        [[nodiscard]] std::vector<std::string> locations() const override { return hosts_; }

        void write_to(std::vector<uint8_t>& out) const override;

        [[nodiscard]] std::string describe() const override;

        bool operator==(const FileSplit& other) const noexcept {
            return path_ == other.path_ && start_ == other.start_ && length_ == other.length_;
        }

    private:
        std::string path_;
        uint64_t start_;
        uint64_t length_;
        std::vector<std::string> hosts_;
    };
} // namespace akkaraio::format::file
