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

// internal/src/format-akk/AkkBlock.cpp
#include "format-akk/AkkBlock.hpp"

#include <stdexcept>

namespace akkaraio::format::akk {
    uint32_t verify_block(core::BufferView block) {
        if (block.size() != BLOCK_SIZE) { throw std::runtime_error("AkkBlock: block size must be 32 KiB"); }

        // CRC over [0..32764)
        const uint32_t stored_crc = block.read_u32_le(BLOCK_SIZE - sizeof(uint32_t));
        const uint32_t computed_crc = block.crc32c(0, BLOCK_SIZE - sizeof(uint32_t));
        if (stored_crc != computed_crc) { throw std::runtime_error("AkkBlock: CRC validation failed"); }

        const uint32_t payload_len = block.read_u32_le(0);
        if (payload_len > MAX_PAYLOAD) { throw std::runtime_error("AkkBlock: invalid payload length"); }
        return payload_len;
    }
} // namespace akkaraio::format::akk
