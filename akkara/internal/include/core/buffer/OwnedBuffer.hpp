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

// internal/include/core/buffer/OwnedBuffer.hpp
#pragma once

#include "BufferView.hpp"

#include <memory>
#include <new>
#include <utility>

namespace akkaraio::core {
    namespace detail {
        /**
         * Releases through the aligned operator delete matching the allocation.
         */
        struct AlignedRelease {
            std::align_val_t alignment{alignof(std::max_align_t)};
            void operator()(std::byte* p) const noexcept { ::operator delete(p, alignment); }
        };
    } // namespace detail

    /**
     * OwnedBuffer - Zero-filled, over-aligned heap bytes with a single owner.
     *
     * Holds one block at a time for the block reader and the block writer;
     * the default 4 KiB alignment keeps block reads page aligned.
     *
     * ```cpp
     * auto block = OwnedBuffer::allocate(BLOCK_SIZE);
     * file.read_at(offset, block.data(), block.size());
     * const uint32_t payload_len = block.view().read_u32_le(0);
     * ```
     */
    class OwnedBuffer {
    public:
        OwnedBuffer() noexcept = default;

        /**
         * @throws std::invalid_argument if alignment is not a power of 2
         * @throws std::bad_alloc on allocation failure
         */
        [[nodiscard]] static OwnedBuffer allocate(size_t size, size_t alignment = 4096);

        OwnedBuffer(OwnedBuffer&& other) noexcept
            : bytes_{std::move(other.bytes_)}, size_{std::exchange(other.size_, 0)} {}

        OwnedBuffer& operator=(OwnedBuffer&& other) noexcept {
            bytes_ = std::move(other.bytes_);
            size_ = std::exchange(other.size_, 0);
            return *this;
        }

        OwnedBuffer(const OwnedBuffer&) = delete;
        OwnedBuffer& operator=(const OwnedBuffer&) = delete;

        [[nodiscard]] BufferView view() const noexcept { return BufferView{bytes_.get(), size_}; }
        [[nodiscard]] std::byte* data() noexcept { return bytes_.get(); }
        [[nodiscard]] const std::byte* data() const noexcept { return bytes_.get(); }
        [[nodiscard]] size_t size() const noexcept { return size_; }
        [[nodiscard]] bool empty() const noexcept { return size_ == 0; }

    private:
        std::unique_ptr<std::byte[], detail::AlignedRelease> bytes_;
        size_t size_{0};
    };
} // namespace akkaraio::core
