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

// internal/include/core/buffer/BufferView.hpp
#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <string_view>

namespace akkaraio::core {
    /**
     * BufferView - Bounds-checked window over bytes owned elsewhere.
     *
     * Every fixed-width integer is stored Little-Endian. Block files, split
     * payloads and serialized source frames are all encoded through this type,
     * so a short or corrupt input surfaces as std::out_of_range instead of a
     * stray read.
     *
     * Copying a view never copies the bytes.
     */
    class BufferView {
    public:
        constexpr BufferView() noexcept = default;
        constexpr BufferView(std::byte* data, size_t size) noexcept : data_{data}, size_{size} {}

        /**
         * Views read-only bytes. Only the read accessors may be used on the result.
         */
        static BufferView of(std::span<const uint8_t> bytes) noexcept {
            return BufferView{reinterpret_cast<std::byte*>(const_cast<uint8_t*>(bytes.data())), bytes.size()};
        }

        [[nodiscard]] constexpr std::byte* data() const noexcept { return data_; }
        [[nodiscard]] constexpr size_t size() const noexcept { return size_; }
        [[nodiscard]] constexpr bool empty() const noexcept { return size_ == 0; }
        [[nodiscard]] std::span<const uint8_t> bytes() const noexcept { return {reinterpret_cast<const uint8_t*>(data_), size_}; }

        // ==================== Windows ====================

        [[nodiscard]] BufferView slice(size_t offset, size_t length) const;

        // ==================== Fixed-width integers ====================

        [[nodiscard]] uint32_t read_u32_le(size_t offset) const { return load<uint32_t>(offset); }
        [[nodiscard]] uint64_t read_u64_le(size_t offset) const { return load<uint64_t>(offset); }

        void write_u32_le(size_t offset, uint32_t value) const { store(offset, value); }
        void write_u64_le(size_t offset, uint64_t value) const { store(offset, value); }

        // ==================== Byte ranges ====================

        /**
         * Copies src to [offset, offset + src.size()). Overlap is allowed.
         */
        void copy_from(size_t offset, std::span<const uint8_t> src) const;

        void fill(size_t offset, size_t length, std::byte value) const;

        [[nodiscard]] std::string_view as_string_view(size_t offset, size_t length) const;

        /**
         * CRC32C (Castagnoli, reflected, init and xorout 0xFFFFFFFF) of
         * [offset, offset + length).
         */
        [[nodiscard]] uint32_t crc32c(size_t offset, size_t length) const;

    private:
        std::byte* data_{nullptr};
        size_t size_{0};

        /**
         * @throws std::out_of_range naming op when [offset, offset + length) leaves the view
         */
        void require(size_t offset, size_t length, const char* op) const;

        // Host order is Little-Endian (checked in BufferView.cpp), so a plain copy is LE.
        template <std::unsigned_integral T>
        [[nodiscard]] T load(size_t offset) const {
            require(offset, sizeof(T), "read");
            T value;
            std::memcpy(&value, data_ + offset, sizeof(T));
            return value;
        }

        template <std::unsigned_integral T>
        void store(size_t offset, T value) const {
            require(offset, sizeof(T), "write");
            std::memcpy(data_ + offset, &value, sizeof(T));
        }
    };
} // namespace akkaraio::core
