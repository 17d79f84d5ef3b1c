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

// internal/src/format-akk/AkkBlockInputFormat.cpp
#include "format-akk/AkkBlockInputFormat.hpp"

#include <algorithm>
#include <stdexcept>

namespace akkaraio::format::akk {
    namespace {
        constexpr uint64_t ceil_div(uint64_t a, uint64_t b) noexcept { return (a + b - 1) / b; }
    } // anonymous namespace

    // ==================== AkkBlockCursor ====================

    std::unique_ptr<AkkBlockCursor> AkkBlockCursor::create(
        core::ReadFileHandle file,
        const file::FileSplit& split,
        bool skip_tombstones,
        std::stop_token stop
    ) {
        const uint64_t file_size = file.file_size();
        if (file_size % BLOCK_SIZE != 0) {
            throw std::runtime_error("AkkBlockCursor: " + split.path() + " is not a whole number of blocks (size=" + std::to_string(file_size) + ")");
        }

        const uint64_t total_blocks = file_size / BLOCK_SIZE;
        const uint64_t first = std::min(ceil_div(split.start(), BLOCK_SIZE), total_blocks);
        const uint64_t end = std::clamp(ceil_div(split.end(), BLOCK_SIZE), first, total_blocks);

        return std::unique_ptr<AkkBlockCursor>(new AkkBlockCursor(std::move(file), first, end, skip_tombstones, std::move(stop)));
    }

    AkkBlockCursor::AkkBlockCursor(
        core::ReadFileHandle file,
        uint64_t first_block,
        uint64_t end_block,
        bool skip_tombstones,
        std::stop_token stop
    ) : file_{std::move(file)}
        , block_{core::OwnedBuffer::allocate(BLOCK_SIZE)}
        , stop_{std::move(stop)}
        , first_block_{first_block}
        , end_block_{end_block}
        , next_block_{first_block}
        , skip_tombstones_{skip_tombstones} {}

    bool AkkBlockCursor::has_next() {
        if (has_pending_) return true;
        if (!file_.is_open()) return false;

        while (true) {
            if (block_loaded_ && payload_pos_ < payload_len_) {
                // Payload starts at offset 4
                const auto payload = block_.view().slice(sizeof(uint32_t), payload_len_);
                const auto record = core::RecordView::from_buffer(payload, payload_pos_);
                payload_pos_ += record.header().total_size();

                if (skip_tombstones_ && record.is_tombstone()) continue;

                pending_ = record;
                has_pending_ = true;
                return true;
            }

            if (block_loaded_) {
                block_loaded_ = false;
                ++blocks_consumed_;
            }

            if (next_block_ >= end_block_) return false;
            load_block(next_block_++);
        }
    }

    core::RecordView AkkBlockCursor::next() {
        if (!has_next()) { throw std::runtime_error("AkkBlockCursor::next: no more records"); }
        has_pending_ = false;
        return pending_;
    }

    std::optional<double> AkkBlockCursor::progress() const noexcept {
        const uint64_t owned = blocks_owned();
        if (owned == 0) return 1.0;
        return static_cast<double>(blocks_consumed_) / static_cast<double>(owned);
    }

    void AkkBlockCursor::close() noexcept {
        file_.close();
        has_pending_ = false;
        block_loaded_ = false;
    }

    void AkkBlockCursor::load_block(uint64_t index) {
        if (stop_.stop_requested()) { throw ReadInterrupted("AkkBlockCursor: interrupted before block " + std::to_string(index)); }

        auto view = block_.view();
        const size_t n = file_.read_at(index * BLOCK_SIZE, view.data(), BLOCK_SIZE);
        if (n != BLOCK_SIZE) { throw std::runtime_error("AkkBlockCursor: short read at block " + std::to_string(index)); }

        payload_len_ = verify_block(view);
        payload_pos_ = 0;
        block_loaded_ = true;
    }

    // ==================== AkkBlockInputFormat ====================

    std::unique_ptr<RecordCursor> AkkBlockInputFormat::open_cursor(
        const InputSplit& split,
        const FormatConfig& config,
        std::stop_token stop
    ) const {
        const auto& fs = as_file_split(split);
        const bool skip_tombstones = config_bool(config, SKIP_TOMBSTONES_KEY, true);

        if (stop.stop_requested()) { throw ReadInterrupted("AkkBlockInputFormat: interrupted before opening " + fs.describe()); }

        auto file = core::ReadFileHandle::open(fs.path());
        return AkkBlockCursor::create(std::move(file), fs, skip_tombstones, std::move(stop));
    }
} // namespace akkaraio::format::akk
