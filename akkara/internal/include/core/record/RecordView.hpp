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

// internal/include/core/record/RecordView.hpp
#pragma once

#include "RecordHeader.hpp"
#include "core/buffer/BufferView.hpp"
#include <span>
#include <string_view>

namespace akkaraio::core {
    /**
     * RecordView - Zero-copy view of a key/value record.
     *
     * Points into storage owned by whoever produced it (a block buffer, a
     * cursor's line buffer). Cursors reuse that storage, so a view handed out
     * by RecordCursor::next() is only valid until the following next() or
     * close(); callers that keep a record must copy it.
     *
     * Thread-safety: Read-only. The underlying storage must outlive the view.
     */
    class RecordView {
    public:
        constexpr RecordView() noexcept = default;

        constexpr RecordView(const RecordHeader* header, const uint8_t* key, const uint8_t* value) noexcept
            : header_{header}, key_{key}, value_{value} {}

        /**
         * Parses a RecordView at offset.
         *
         * Layout: [RecordHeader][key (k_len)][value (v_len)]
         *
         * @throws std::out_of_range if the record does not fit in buffer
         */
        [[nodiscard]] static RecordView from_buffer(BufferView buffer, size_t offset);

        /**
         * @throws std::runtime_error if the view is empty
         */
        [[nodiscard]] const RecordHeader& header() const;

        [[nodiscard]] std::span<const uint8_t> key() const noexcept {
            if (!header_) return {};
            return {key_, header_->k_len};
        }

        [[nodiscard]] std::span<const uint8_t> value() const noexcept {
            if (!header_) return {};
            return {value_, header_->v_len};
        }

        [[nodiscard]] std::string_view key_string() const noexcept {
            auto k = key();
            return {reinterpret_cast<const char*>(k.data()), k.size()};
        }

        [[nodiscard]] std::string_view value_string() const noexcept {
            auto v = value();
            return {reinterpret_cast<const char*>(v.data()), v.size()};
        }

        [[nodiscard]] bool is_tombstone() const noexcept { return header_ && header_->is_tombstone(); }

        [[nodiscard]] bool empty() const noexcept { return header_ == nullptr; }

    private:
        const RecordHeader* header_{nullptr};
        const uint8_t* key_{nullptr};
        const uint8_t* value_{nullptr};
    };
} // namespace akkaraio::core
