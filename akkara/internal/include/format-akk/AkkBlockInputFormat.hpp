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

// internal/include/format-akk/AkkBlockInputFormat.hpp
#pragma once

#include "AkkBlock.hpp"
#include "core/buffer/OwnedBuffer.hpp"
#include "core/io/ReadFileHandle.hpp"
#include "format-file/FileInputFormat.hpp"

namespace akkaraio::format::akk {
    /**
     * AkkBlockCursor - Iterates the records of the blocks a FileSplit owns.
     *
     * A split owns every block whose start offset lies in [start, end).
     * Adjacent splits of one file therefore partition its blocks regardless
     * of where the byte boundaries fall.
     *
     * Blocks are read one at a time into a single reusable buffer; a
     * RecordView handed out by next() points into that buffer.
     *
     * Thread-safety: NOT thread-safe.
     */
    class AkkBlockCursor final : public RecordCursor {
    public:
        /**
         * @throws std::runtime_error if the file size is not a multiple of BLOCK_SIZE
         */
        [[nodiscard]] static std::unique_ptr<AkkBlockCursor> create(
            core::ReadFileHandle file,
            const file::FileSplit& split,
            bool skip_tombstones,
            std::stop_token stop
        );

        ~AkkBlockCursor() override { close(); }

        /**
         * @throws ReadInterrupted if a stop is requested before a block read
         * @throws std::runtime_error on a short read or a corrupt block
         */
        [[nodiscard]] bool has_next() override;

        [[nodiscard]] core::RecordView next() override;

        /**
         * Blocks consumed / blocks owned. 1.0 for a split owning no block.
         */
        [[nodiscard]] std::optional<double> progress() const noexcept override;

        void close() noexcept override;

        [[nodiscard]] uint64_t blocks_owned() const noexcept { return end_block_ - first_block_; }

    private:
        AkkBlockCursor(core::ReadFileHandle file, uint64_t first_block, uint64_t end_block, bool skip_tombstones, std::stop_token stop);

        void load_block(uint64_t index);

        core::ReadFileHandle file_;
        core::OwnedBuffer block_;
        std::stop_token stop_;

        uint64_t first_block_;
        uint64_t end_block_;
        uint64_t next_block_;
        uint64_t blocks_consumed_{0};

        bool block_loaded_{false};
        uint32_t payload_len_{0};
        size_t payload_pos_{0};

        bool skip_tombstones_;
        core::RecordView pending_{};
        bool has_pending_{false};
    };

    /**
     * AkkBlockInputFormat - InputFormat over AkkaraDB block files.
     *
     * Format descriptor: "akk.block".
     *
     * Config keys:
     * - akk.skip.tombstones (bool, default true): drop tombstone records
     *
     * Thread-safety: Stateless, fully thread-safe.
     */
    class AkkBlockInputFormat final : public file::FileInputFormat {
    public:
        static constexpr std::string_view ID = "akk.block";
        static constexpr std::string_view SKIP_TOMBSTONES_KEY = "akk.skip.tombstones";

        [[nodiscard]] std::string_view id() const noexcept override { return ID; }

        [[nodiscard]] std::unique_ptr<RecordCursor> open_cursor(
            const InputSplit& split,
            const FormatConfig& config,
            std::stop_token stop
        ) const override;
    };
} // namespace akkaraio::format::akk
