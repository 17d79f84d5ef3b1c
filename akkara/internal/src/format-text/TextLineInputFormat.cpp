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

// internal/src/format-text/TextLineInputFormat.cpp
#include "format-text/TextLineInputFormat.hpp"
#include "core/buffer/BufferView.hpp"

#include <algorithm>
#include <stdexcept>

namespace akkaraio::format::text {
    // ==================== TextLineCursor ====================

    std::unique_ptr<TextLineCursor> TextLineCursor::create(
        core::ReadFileHandle file,
        const file::FileSplit& split,
        char delimiter,
        std::stop_token stop
    ) {
        return std::unique_ptr<TextLineCursor>(new TextLineCursor(std::move(file), split.start(), split.end(), delimiter, std::move(stop)));
    }

    TextLineCursor::TextLineCursor(core::ReadFileHandle file, uint64_t start, uint64_t end, char delimiter, std::stop_token stop)
        : file_{std::move(file)}
        , stop_{std::move(stop)}
        , start_{start}
        , end_{end}
        , pos_{start}
        , delimiter_{delimiter}
        , chunk_(CHUNK_SIZE) {}

    bool TextLineCursor::has_next() {
        if (has_pending_) return true;
        if (done_ || !file_.is_open()) return false;

        if (!initialized_) {
            initialized_ = true;
            // Partial first line belongs to the previous split
            if (start_ != 0 && !read_line()) {
                done_ = true;
                return false;
            }
        }

        const uint64_t line_start = pos_;
        if (line_start > end_ || line_start >= file_.file_size() || !read_line()) {
            done_ = true;
            return false;
        }

        core::BufferView{reinterpret_cast<std::byte*>(key_.data()), key_.size()}.write_u64_le(0, line_start);
        header_ = core::RecordHeader::create(key_.size(), line_.size());
        has_pending_ = true;
        return true;
    }

    core::RecordView TextLineCursor::next() {
        if (!has_next()) { throw std::runtime_error("TextLineCursor::next: no more records"); }
        has_pending_ = false;
        return core::RecordView{&header_, key_.data(), reinterpret_cast<const uint8_t*>(line_.data())};
    }

    std::optional<double> TextLineCursor::progress() const noexcept {
        if (done_) return 1.0;
        if (end_ <= start_) return 0.0;
        const double consumed = static_cast<double>(std::min(pos_, end_) - start_);
        return std::clamp(consumed / static_cast<double>(end_ - start_), 0.0, 1.0);
    }

    void TextLineCursor::close() noexcept {
        file_.close();
        has_pending_ = false;
    }

    bool TextLineCursor::read_line() {
        line_.clear();
        if (!fill()) return false;

        while (true) {
            const size_t from = static_cast<size_t>(pos_ - chunk_offset_);
            const auto* begin = chunk_.data() + from;
            const auto* last = chunk_.data() + chunk_len_;
            const auto* hit = std::find(begin, last, static_cast<uint8_t>(delimiter_));

            line_.append(reinterpret_cast<const char*>(begin), static_cast<size_t>(hit - begin));
            pos_ += static_cast<uint64_t>(hit - begin);

            if (hit != last) {
                ++pos_; // delimiter
                break;
            }
            if (!fill()) break; // last line without delimiter
        }

        if (delimiter_ == '\n' && !line_.empty() && line_.back() == '\r') { line_.pop_back(); }
        return true;
    }

    bool TextLineCursor::fill() {
        if (pos_ >= chunk_offset_ && pos_ < chunk_offset_ + chunk_len_) return true;
        if (pos_ >= file_.file_size()) return false;

        if (stop_.stop_requested()) { throw ReadInterrupted("TextLineCursor: interrupted at offset " + std::to_string(pos_)); }

        chunk_offset_ = pos_;
        chunk_len_ = file_.read_at(pos_, chunk_.data(), chunk_.size());
        return chunk_len_ > 0;
    }

    // ==================== TextLineInputFormat ====================

    std::unique_ptr<RecordCursor> TextLineInputFormat::open_cursor(
        const InputSplit& split,
        const FormatConfig& config,
        std::stop_token stop
    ) const {
        const auto& fs = as_file_split(split);
        const char delimiter = config_char(config, DELIMITER_KEY, '\n');

        if (stop.stop_requested()) { throw ReadInterrupted("TextLineInputFormat: interrupted before opening " + fs.describe()); }

        auto file = core::ReadFileHandle::open(fs.path());
        return TextLineCursor::create(std::move(file), fs, delimiter, std::move(stop));
    }
} // namespace akkaraio::format::text
