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

// internal/src/core/record/RecordView.cpp
#include "core/record/RecordView.hpp"

#include <stdexcept>

namespace akkaraio::core {
    RecordView RecordView::from_buffer(BufferView buffer, size_t offset) {
        if (offset + sizeof(RecordHeader) > buffer.size()) { throw std::out_of_range("RecordView: buffer too small for header"); }

        const auto* header = reinterpret_cast<const RecordHeader*>(buffer.data() + offset);
        if (offset + header->total_size() > buffer.size()) { throw std::out_of_range("RecordView: record extends beyond buffer"); }

        const auto* key = reinterpret_cast<const uint8_t*>(header + 1);
        return RecordView{header, key, key + header->k_len};
    }

    const RecordHeader& RecordView::header() const {
        if (!header_) { throw std::runtime_error("RecordView: empty view"); }
        return *header_;
    }
} // namespace akkaraio::core
