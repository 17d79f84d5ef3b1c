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

// internal/include/core/record/RecordHeader.hpp
#pragma once

#include <cstddef>
#include <cstdint>

namespace akkaraio::core {
    #pragma pack(push, 1)
    /**
     * RecordHeader - 12-byte fixed-size header preceding every key/value
     * record inside a block.
     *
     * Binary layout (Little-Endian, 12 bytes total):
     * [0..3]   k_len (u32)   - Key length
     * [4..7]   v_len (u32)   - Value length
     * [8]      flags (u8)    - Flags (0x01 = TOMBSTONE)
     * [9]      pad0 (u8)     - Reserved (must be 0)
     * [10..11] pad1 (u16)    - Reserved (must be 0)
     */
    struct RecordHeader {
        uint32_t k_len; ///< Key length
        uint32_t v_len; ///< Value length
        uint8_t flags; ///< Flags (see FLAG_* constants)
        uint8_t pad0; ///< Reserved
        uint16_t pad1; ///< Reserved

        static constexpr uint8_t FLAG_NORMAL = 0x00; ///< Normal record
        static constexpr uint8_t FLAG_TOMBSTONE = 0x01; ///< Deleted record

        [[nodiscard]] constexpr bool is_tombstone() const noexcept { return (flags & FLAG_TOMBSTONE) != 0; }

        /**
         * Returns the encoded size of the record (header + key + value).
         */
        [[nodiscard]] constexpr size_t total_size() const noexcept { return sizeof(RecordHeader) + k_len + v_len; }

        [[nodiscard]] static constexpr RecordHeader create(size_t key_len, size_t value_len, uint8_t flags = FLAG_NORMAL) noexcept {
            return RecordHeader{
                .k_len = static_cast<uint32_t>(key_len),
                .v_len = static_cast<uint32_t>(value_len),
                .flags = flags,
                .pad0 = 0,
                .pad1 = 0
            };
        }
    };
    #pragma pack(pop)

    static_assert(sizeof(RecordHeader) == 12, "RecordHeader must be exactly 12 bytes");
} // namespace akkaraio::core
