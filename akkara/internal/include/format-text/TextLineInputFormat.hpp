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

// internal/include/format-text/TextLineInputFormat.hpp
#pragma once

#include "core/io/ReadFileHandle.hpp"
#include "core/record/RecordHeader.hpp"
#include "format-file/FileInputFormat.hpp"
#include <array>
#include <vector>

namespace akkaraio::format::text {
    /**
     * TextLineCursor - Yields the lines of a FileSplit.
     *
     * Record layout:
     * - key   = byte offset of the line in the file (u64 LE, 8 bytes)
     * - value = line content without the delimiter (and without a trailing
     *           '\r' when the delimiter is '\n')
     *
     * Boundary rule: a split not starting at offset 0 discards its first
     * (possibly partial) line; every line that starts at or before the split
     * end is read to completion, even past the end. Adjacent splits thus
     * yield each line exactly once.
     *
     * Thread-safety: NOT thread-safe.
     */
    class TextLineCursor final : public RecordCursor {
    public:
        static constexpr size_t CHUNK_SIZE = 64 * 1024;

        [[nodiscard]] static std::unique_ptr<TextLineCursor> create(
            core::ReadFileHandle file,
            const file::FileSplit& split,
            char delimiter,
            std::stop_token stop
        );

        ~TextLineCursor() override { close(); }

        /**
         * @throws ReadInterrupted if a stop is requested before a chunk read
         * @throws std::runtime_error on I/O error
         */
        [[nodiscard]] bool has_next() override;

        [[nodiscard]] core::RecordView next() override;

        /**
         * (pos - start) / length, clamped to [0, 1].
         */
        [[nodiscard]] std::optional<double> progress() const noexcept override;

        void close() noexcept override;

    private:
        TextLineCursor(core::ReadFileHandle file, uint64_t start, uint64_t end, char delimiter, std::stop_token stop);

        /**
         * Reads one line starting at pos_ into line_, advancing pos_ past
         * the delimiter. Returns false at end of file.
         */
        bool read_line();

        /**
         * Ensures buffered data covers pos_. Returns false at end of file.
         */
        bool fill();

        core::ReadFileHandle file_;
        std::stop_token stop_;
        uint64_t start_;
        uint64_t end_;
        uint64_t pos_;
        char delimiter_;

        std::vector<uint8_t> chunk_;
        uint64_t chunk_offset_{0};
        size_t chunk_len_{0};

        bool initialized_{false};
        bool done_{false};
        bool has_pending_{false};

        core::RecordHeader header_{};
        std::array<uint8_t, 8> key_{};
        std::string line_;
    };

    /**
     * TextLineInputFormat - InputFormat over delimiter-separated text files.
     *
     * Format descriptor: "text.line".
     *
     * Config keys:
     * - text.record.delimiter (single character, default '\n')
     *
     * Thread-safety: Stateless, fully thread-safe.
     */
    class TextLineInputFormat final : public file::FileInputFormat {
    public:
        static constexpr std::string_view ID = "text.line";
        static constexpr std::string_view DELIMITER_KEY = "text.record.delimiter";

        [[nodiscard]] std::string_view id() const noexcept override { return ID; }

        [[nodiscard]] std::unique_ptr<RecordCursor> open_cursor(
            const InputSplit& split,
            const FormatConfig& config,
            std::stop_token stop
        ) const override;
    };
} // namespace akkaraio::format::text
