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

// internal/include/format-akk/AkkBlockWriter.hpp
#pragma once

#include "AkkBlock.hpp"
#include "core/record/RecordHeader.hpp"
#include <filesystem>
#include <memory>
#include <span>
#include <string_view>

namespace akkaraio::format::akk {
    /**
     * AkkBlockWriter - Packs key/value records into a block file.
     *
     * Records are appended to the open block until the next one no longer
     * fits; the block is then sealed (padding + CRC32C) and written out.
     * close() seals the last partial block. A writer that is destroyed
     * without close() still seals and writes what it holds.
     *
     * Typical usage:
     * ```cpp
     * auto writer = AkkBlockWriter::create("/data/part-00000.akk");
     * writer->append("k1", "v1");
     * writer->append_tombstone("k0");
     * writer->close();
     * ```
     *
     * Thread-safety: NOT thread-safe. Single producer only.
     */
    class AkkBlockWriter {
    public:
        /**
         * Creates (or truncates) the file, creating parent directories.
         *
         * @throws std::runtime_error if the file cannot be created
         */
        [[nodiscard]] static std::unique_ptr<AkkBlockWriter> create(const std::filesystem::path& file_path);

        ~AkkBlockWriter();

        AkkBlockWriter(const AkkBlockWriter&) = delete;
        AkkBlockWriter& operator=(const AkkBlockWriter&) = delete;

        /**
         * @throws std::invalid_argument if the record cannot fit in a single block
         * @throws std::runtime_error on write failure or after close()
         */
        void append(std::span<const uint8_t> key, std::span<const uint8_t> value, uint8_t flags = core::RecordHeader::FLAG_NORMAL);

        void append(std::string_view key, std::string_view value);

        void append_tombstone(std::string_view key);

        /**
         * Seals the open block and closes the file. Idempotent.
         *
         * @throws std::runtime_error on write failure
         */
        void close();

        [[nodiscard]] size_t record_count() const noexcept;
        [[nodiscard]] size_t block_count() const noexcept;

    private:
        explicit AkkBlockWriter(const std::filesystem::path& file_path);

        class Impl;
        std::unique_ptr<Impl> impl_;
    };
} // namespace akkaraio::format::akk
