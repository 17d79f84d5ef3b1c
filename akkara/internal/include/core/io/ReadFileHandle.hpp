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

// internal/include/core/io/ReadFileHandle.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>

namespace akkaraio::core {
    /**
     * ReadFileHandle - Read-only positional file handle.
     *
     * Sequential-scan hint, no O_DIRECT (let the OS page cache work).
     * Reads are positional (pread), so one handle never carries a shared
     * file offset between cursors.
     *
     * Thread-safety: NOT thread-safe for close(); read_at() is safe to call
     * concurrently on an open handle.
     */
    class ReadFileHandle {
    public:
        ReadFileHandle() noexcept = default;
        ~ReadFileHandle() noexcept { close(); }

        ReadFileHandle(const ReadFileHandle&) = delete;
        ReadFileHandle& operator=(const ReadFileHandle&) = delete;

        ReadFileHandle(ReadFileHandle&& o) noexcept;
        ReadFileHandle& operator=(ReadFileHandle&& o) noexcept;

        /**
         * @throws std::runtime_error if the file cannot be opened or stat'ed
         */
        [[nodiscard]] static ReadFileHandle open(const std::filesystem::path& path);

        /**
         * Reads up to size bytes starting at offset.
         * Returns bytes actually read (short only at EOF, never throws on EOF).
         *
         * @throws std::runtime_error on I/O error or if the handle is closed
         */
        [[nodiscard]] size_t read_at(uint64_t offset, void* buf, size_t size) const;

        [[nodiscard]] uint64_t file_size() const noexcept { return file_size_; }
        [[nodiscard]] bool is_open() const noexcept { return fd_ >= 0; }

        void close() noexcept;

    private:
        int fd_{-1};
        uint64_t file_size_{0};
    };
} // namespace akkaraio::core
