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

// internal/src/core/buffer/OwnedBuffer.cpp
#include "core/buffer/OwnedBuffer.hpp"

#include <algorithm>
#include <bit>
#include <cstring>
#include <stdexcept>
#include <string>

namespace akkaraio::core {
    OwnedBuffer OwnedBuffer::allocate(size_t size, size_t alignment) {
        if (!std::has_single_bit(alignment)) {
            throw std::invalid_argument("OwnedBuffer: alignment " + std::to_string(alignment) + " is not a power of 2");
        }

        OwnedBuffer out;
        if (size == 0) return out;

        const auto align = std::align_val_t{std::max(alignment, alignof(std::max_align_t))};
        out.bytes_ = std::unique_ptr<std::byte[], detail::AlignedRelease>(static_cast<std::byte*>(::operator new(size, align)), detail::AlignedRelease{align});
        out.size_ = size;
        std::memset(out.bytes_.get(), 0, size);
        return out;
    }
} // namespace akkaraio::core
