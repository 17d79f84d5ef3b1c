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

// internal/src/format-akk/AkkBlockWriter.cpp
#include "format-akk/AkkBlockWriter.hpp"
#include "core/buffer/OwnedBuffer.hpp"

#include <fstream>
#include <stdexcept>

#include <glog/logging.h>

namespace akkaraio::format::akk {
    namespace {
        std::span<const uint8_t> as_bytes(std::string_view s) noexcept {
            return {reinterpret_cast<const uint8_t*>(s.data()), s.size()};
        }
    } // anonymous namespace

    /**
     * AkkBlockWriter::Impl - Private implementation (Pimpl idiom).
     */
    class AkkBlockWriter::Impl {
    public:
        explicit Impl(const std::filesystem::path& file_path) : file_path_{file_path}, block_{core::OwnedBuffer::allocate(BLOCK_SIZE)} {
            if (file_path_.has_parent_path()) { std::filesystem::create_directories(file_path_.parent_path()); }

            file_.open(file_path_, std::ios::binary | std::ios::trunc);
            if (!file_) { throw std::runtime_error("AkkBlockWriter: failed to create " + file_path_.string()); }

            payload_offset_ = sizeof(uint32_t);
        }

        void append(std::span<const uint8_t> key, std::span<const uint8_t> value, uint8_t flags) {
            if (closed_) { throw std::runtime_error("AkkBlockWriter: append after close"); }

            const size_t record_size = sizeof(core::RecordHeader) + key.size() + value.size();
            if (record_size > MAX_PAYLOAD) { throw std::invalid_argument("AkkBlockWriter: record larger than a block"); }

            // Block full: seal and start a fresh one
            if (payload_offset_ + record_size > sizeof(uint32_t) + MAX_PAYLOAD) { seal_block(); }

            const auto header = core::RecordHeader::create(key.size(), value.size(), flags);
            auto view = block_.view();
            view.copy_from(payload_offset_, {reinterpret_cast<const uint8_t*>(&header), sizeof(header)});
            payload_offset_ += sizeof(header);

            if (!key.empty()) {
                view.copy_from(payload_offset_, key);
                payload_offset_ += key.size();
            }
            if (!value.empty()) {
                view.copy_from(payload_offset_, value);
                payload_offset_ += value.size();
            }

            ++block_records_;
            ++record_count_;
        }

        void close() {
            if (closed_) return;
            closed_ = true;

            if (block_records_ > 0) { seal_block(); }
            file_.flush();
            if (!file_) { throw std::runtime_error("AkkBlockWriter: flush failed"); }
            file_.close();
        }

        [[nodiscard]] bool closed() const noexcept { return closed_; }
        [[nodiscard]] size_t record_count() const noexcept { return record_count_; }
        [[nodiscard]] size_t block_count() const noexcept { return block_count_; }

    private:
        void seal_block() {
            auto view = block_.view();

            const auto payload_len = static_cast<uint32_t>(payload_offset_ - sizeof(uint32_t));
            view.write_u32_le(0, payload_len);

            // Zero-fill padding: [payloadPos .. BLOCK_SIZE-4)
            constexpr size_t padding_end = BLOCK_SIZE - sizeof(uint32_t);
            if (padding_end > payload_offset_) { view.fill(payload_offset_, padding_end - payload_offset_, std::byte{0}); }

            const uint32_t crc = view.crc32c(0, padding_end);
            view.write_u32_le(padding_end, crc);

            file_.write(reinterpret_cast<const char*>(view.data()), static_cast<std::streamsize>(view.size()));
            if (!file_) { throw std::runtime_error("AkkBlockWriter: block write failed"); }

            ++block_count_;
            payload_offset_ = sizeof(uint32_t);
            block_records_ = 0;
        }

        std::filesystem::path file_path_;
        std::ofstream file_;
        core::OwnedBuffer block_;
        size_t payload_offset_{0};
        size_t block_records_{0};
        size_t record_count_{0};
        size_t block_count_{0};
        bool closed_{false};
    };

    // ==================== AkkBlockWriter Public API ====================

    std::unique_ptr<AkkBlockWriter> AkkBlockWriter::create(const std::filesystem::path& file_path) {
        return std::unique_ptr<AkkBlockWriter>(new AkkBlockWriter(file_path));
    }

    AkkBlockWriter::AkkBlockWriter(const std::filesystem::path& file_path) : impl_{std::make_unique<Impl>(file_path)} {}

    AkkBlockWriter::~AkkBlockWriter() {
        if (!impl_ || impl_->closed()) return;
        try { impl_->close(); }
        catch (const std::exception& e) { LOG(ERROR) << "AkkBlockWriter: close on destruction failed: " << e.what(); }
    }

    void AkkBlockWriter::append(std::span<const uint8_t> key, std::span<const uint8_t> value, uint8_t flags) {
        impl_->append(key, value, flags);
    }

    void AkkBlockWriter::append(std::string_view key, std::string_view value) {
        impl_->append(as_bytes(key), as_bytes(value), core::RecordHeader::FLAG_NORMAL);
    }

    void AkkBlockWriter::append_tombstone(std::string_view key) {
        impl_->append(as_bytes(key), {}, core::RecordHeader::FLAG_TOMBSTONE);
    }

    void AkkBlockWriter::close() { impl_->close(); }

    size_t AkkBlockWriter::record_count() const noexcept { return impl_->record_count(); }

    size_t AkkBlockWriter::block_count() const noexcept { return impl_->block_count(); }
} // namespace akkaraio::format::akk
