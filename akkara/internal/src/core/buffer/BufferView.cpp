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

// internal/src/core/buffer/BufferView.cpp
#include "core/buffer/BufferView.hpp"

#include <array>
#include <bit>
#include <stdexcept>
#include <string>

#if defined(__SSE4_2__)
#include <nmmintrin.h>
#endif

static_assert(std::endian::native == std::endian::little, "AkkaraIO stores integers in host order and requires a Little-Endian target");

namespace akkaraio::core {
    namespace {
#if !defined(__SSE4_2__)
        constexpr uint32_t CASTAGNOLI_REFLECTED = 0x82F63B78;

        constexpr std::array<uint32_t, 256> make_crc_table() {
            std::array<uint32_t, 256> table{};
            for (uint32_t n = 0; n < table.size(); ++n) {
                uint32_t c = n;
                for (int k = 0; k < 8; ++k) { c = (c & 1u) ? (c >> 1) ^ CASTAGNOLI_REFLECTED : c >> 1; }
                table[n] = c;
            }
            return table;
        }

        constexpr auto CRC_TABLE = make_crc_table();
#endif

        uint32_t crc_update(uint32_t crc, const uint8_t* p, size_t n) noexcept {
#if defined(__SSE4_2__)
            for (; n >= sizeof(uint64_t); n -= sizeof(uint64_t), p += sizeof(uint64_t)) {
                uint64_t word;
                std::memcpy(&word, p, sizeof(word));
                crc = static_cast<uint32_t>(_mm_crc32_u64(crc, word));
            }
            for (; n > 0; --n, ++p) { crc = _mm_crc32_u8(crc, *p); }
#else
            for (; n > 0; --n, ++p) { crc = CRC_TABLE[(crc ^ *p) & 0xFFu] ^ (crc >> 8); }
#endif
            return crc;
        }
    } // anonymous namespace

    void BufferView::require(size_t offset, size_t length, const char* op) const {
        if (offset > size_ || length > size_ - offset) {
            throw std::out_of_range(std::string("BufferView: ") + op + " of " + std::to_string(length) + " bytes at " + std::to_string(offset) +
                                    " exceeds size " + std::to_string(size_));
        }
    }

    BufferView BufferView::slice(size_t offset, size_t length) const {
        require(offset, length, "slice");
        return BufferView{data_ + offset, length};
    }

    void BufferView::copy_from(size_t offset, std::span<const uint8_t> src) const {
        require(offset, src.size(), "copy");
        if (!src.empty()) { std::memmove(data_ + offset, src.data(), src.size()); }
    }

    void BufferView::fill(size_t offset, size_t length, std::byte value) const {
        require(offset, length, "fill");
        if (length != 0) { std::memset(data_ + offset, std::to_integer<int>(value), length); }
    }

    std::string_view BufferView::as_string_view(size_t offset, size_t length) const {
        require(offset, length, "string view");
        return {reinterpret_cast<const char*>(data_ + offset), length};
    }

    uint32_t BufferView::crc32c(size_t offset, size_t length) const {
        require(offset, length, "crc32c");
        return ~crc_update(0xFFFFFFFFu, reinterpret_cast<const uint8_t*>(data_ + offset), length);
    }
} // namespace akkaraio::core
