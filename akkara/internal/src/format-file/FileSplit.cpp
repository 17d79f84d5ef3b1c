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

// internal/src/format-file/FileSplit.cpp
#include "format-file/FileSplit.hpp"

#include <stdexcept>

namespace akkaraio::format::file {
    FileSplit::FileSplit(std::string path, uint64_t start, uint64_t length, std::vector<std::string> hosts)
        : path_{std::move(path)}, start_{start}, length_{length}, hosts_{std::move(hosts)} {}

    std::shared_ptr<const FileSplit> FileSplit::decode(core::BufferView payload) {
        const uint32_t path_len = payload.read_u32_le(0);
        const size_t path_end = sizeof(uint32_t) + static_cast<size_t>(path_len);
        auto path = std::string(payload.as_string_view(sizeof(uint32_t), path_len));
        const uint64_t start = payload.read_u64_le(path_end);
        const uint64_t length = payload.read_u64_le(path_end + sizeof(uint64_t));

        if (path_end + 2 * sizeof(uint64_t) != payload.size()) { throw std::runtime_error("FileSplit::decode: trailing bytes in payload"); }

        return std::make_shared<const FileSplit>(std::move(path), start, length);
    }

    void FileSplit::write_to(std::vector<uint8_t>& out) const {
        // [path_len:u32][path][start:u64][length:u64]
        const size_t base = out.size();
        const size_t path_end = sizeof(uint32_t) + path_.size();
        out.resize(base + path_end + 2 * sizeof(uint64_t));

        const core::BufferView view{reinterpret_cast<std::byte*>(out.data() + base), out.size() - base};
        view.write_u32_le(0, static_cast<uint32_t>(path_.size()));
        view.copy_from(sizeof(uint32_t), {reinterpret_cast<const uint8_t*>(path_.data()), path_.size()});
        view.write_u64_le(path_end, start_);
        view.write_u64_le(path_end + sizeof(uint64_t), length_);
    }

    std::string FileSplit::describe() const { return path_ + ":" + std::to_string(start_) + "+" + std::to_string(length_); }
} // namespace akkaraio::format::file
