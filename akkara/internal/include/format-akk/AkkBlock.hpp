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

// internal/include/format-akk/AkkBlock.hpp
#pragma once

#include "core/buffer/BufferView.hpp"
#include <cstddef>
#include <cstdint>

namespace akkaraio::format::akk {
    /**
     * Block layout (32 KiB, Little-Endian):
     * [0..3]          payloadLen (u32)
     * [4..4+N)        payload = repeated { RecordHeader(12B) + key + value }
     * [4+N..32764)    zero padding
     * [32764..32768)  CRC32C over [0..32764) (u32)
     *
     * A block file is a plain concatenation of blocks; its size is always a
     * multiple of BLOCK_SIZE.
     */
    inline constexpr size_t BLOCK_SIZE = 32 * 1024;

    /**
     * Overhead per block (payloadLen + CRC32C).
     */
    inline constexpr size_t BLOCK_OVERHEAD = sizeof(uint32_t) * 2;

    inline constexpr size_t MAX_PAYLOAD = BLOCK_SIZE - BLOCK_OVERHEAD;

    /**
     * Checks size, CRC and payload length of a block.
     *
     * @return payloadLen
     * @throws std::runtime_error if the block is corrupt
     */
    [[nodiscard]] uint32_t verify_block(core::BufferView block);
} // namespace akkaraio::format::akk
