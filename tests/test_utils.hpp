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

// tests/test_utils.hpp
#pragma once

#include "akkaraio/BoundedReader.hpp"
#include "akkaraio/BoundedSource.hpp"
#include "akkaraio/SourceContext.hpp"
#include "core/buffer/BufferView.hpp"
#include "format-akk/AkkBlockWriter.hpp"
#include "format-api/InputFormat.hpp"

#include <atomic>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

namespace akkaraio::test {
    namespace fs = std::filesystem;

    /**
     * Per-test scratch directory, removed on destruction.
     */
    class TempDir {
    public:
        TempDir() {
            auto templ = (fs::temp_directory_path() / "akkaraio-test-XXXXXX").string();
            if (::mkdtemp(templ.data()) == nullptr) { throw std::runtime_error("mkdtemp failed"); }
            path_ = templ;
        }

        ~TempDir() {
            std::error_code ec;
            fs::remove_all(path_, ec);
        }

        TempDir(const TempDir&) = delete;
        TempDir& operator=(const TempDir&) = delete;

        [[nodiscard]] const fs::path& path() const noexcept { return path_; }
        [[nodiscard]] fs::path operator/(const std::string& name) const { return path_ / name; }

    private:
        fs::path path_;
    };

    inline void write_file(const fs::path& path, const std::string& content) {
        fs::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        if (!out) { throw std::runtime_error("write_file failed: " + path.string()); }
    }

    using Records = std::vector<std::pair<std::string, std::string>>;

    inline void write_akk(const fs::path& path, const Records& records) {
        auto writer = format::akk::AkkBlockWriter::create(path);
        for (const auto& [k, v] : records) { writer->append(k, v); }
        writer->close();
    }

    /**
     * count records keyed "key-000042" with value_size-byte values.
     */
    inline Records make_records(size_t count, size_t value_size) {
        Records out;
        out.reserve(count);
        for (size_t i = 0; i < count; ++i) {
            char key[32];
            std::snprintf(key, sizeof(key), "key-%06zu", i);
            out.emplace_back(key, std::string(value_size, static_cast<char>('a' + i % 26)));
        }
        return out;
    }

    inline uint64_t offset_key(const KvPair& pair) {
        return core::BufferView::of(pair.key).read_u64_le(0);
    }

    /**
     * Drains a cursor into owned pairs.
     */
    inline std::vector<KvPair> drain(format::RecordCursor& cursor) {
        std::vector<KvPair> out;
        while (cursor.has_next()) {
            const auto r = cursor.next();
            out.push_back(KvPair::copy_of(r.key(), r.value()));
        }
        cursor.close();
        return out;
    }

    /**
     * Reads every record of source through one reader.
     */
    inline std::vector<KvPair> read_all(const BoundedSource& source, const SourceContext& ctx) {
        auto reader = source.create_reader(ctx);
        std::vector<KvPair> out;
        for (bool more = reader->start(); more; more = reader->advance()) { out.push_back(reader->get_current()); }
        reader->close();
        return out;
    }

    // ==================== Programmable format ====================

    /**
     * Split of the fake format: index and record count, optionally refusing
     * serialization.
     */
    class FakeSplit final : public format::InputSplit {
    public:
        static constexpr std::string_view TYPE_TAG = "test.fake-split";

        FakeSplit(uint32_t index, uint32_t records, bool serializable = true)
            : index_{index}, records_{records}, serializable_{serializable} {}

        [[nodiscard]] static std::shared_ptr<const FakeSplit> decode(core::BufferView payload) {
            if (payload.size() != 8) { throw std::runtime_error("FakeSplit: bad payload"); }
            return std::make_shared<const FakeSplit>(payload.read_u32_le(0), payload.read_u32_le(4));
        }

        [[nodiscard]] std::string_view type_tag() const noexcept override { return TYPE_TAG; }
        [[nodiscard]] uint64_t length() const noexcept override { return records_ * 100ULL; }
        [[nodiscard]] bool serializable() const noexcept override { return serializable_; }

        void write_to(std::vector<uint8_t>& out) const override {
            if (!serializable_) { throw std::logic_error("FakeSplit: not serializable"); }
            std::vector<uint8_t> buf(8);
            core::BufferView view{reinterpret_cast<std::byte*>(buf.data()), buf.size()};
            view.write_u32_le(0, index_);
            view.write_u32_le(4, records_);
            out.insert(out.end(), buf.begin(), buf.end());
        }

        [[nodiscard]] std::string describe() const override { return "fake#" + std::to_string(index_); }

        [[nodiscard]] uint32_t index() const noexcept { return index_; }
        [[nodiscard]] uint32_t records() const noexcept { return records_; }

    private:
        uint32_t index_;
        uint32_t records_;
        bool serializable_;
    };

    struct FakeBehavior {
        std::vector<uint32_t> records_per_split; ///< One entry per discovered split
        bool serializable = true;
        bool report_progress = true;
        bool fail_discovery = false;
        bool fail_listing = false;
        int fail_after_records = -1; ///< has_next() throws once this many records were produced
        uint64_t listed_bytes = 0;
    };

    /**
     * Shared counters observed by tests.
     */
    struct FakeStats {
        std::atomic<int> opened{0};
        std::atomic<int> closed{0};
        std::atomic<int> open_now{0};
        std::atomic<int> max_open{0};
        std::atomic<int> discoveries{0};
        std::atomic<uint64_t> last_min_hint{0};
        std::atomic<uint64_t> last_max_hint{0};
    };

    class FakeCursor final : public format::RecordCursor {
    public:
        FakeCursor(const FakeSplit& split, const FakeBehavior& behavior, std::shared_ptr<FakeStats> stats, std::stop_token stop)
            : split_{split.index()}, total_{split.records()}, behavior_{behavior}, stats_{std::move(stats)}, stop_{std::move(stop)} {
            ++stats_->opened;
            const int now = ++stats_->open_now;
            int prev = stats_->max_open.load();
            while (now > prev && !stats_->max_open.compare_exchange_weak(prev, now)) {}
        }

        ~FakeCursor() override { close(); }

        bool has_next() override {
            if (closed_) return false;
            if (stop_.stop_requested()) { throw format::ReadInterrupted("FakeCursor: interrupted"); }
            if (behavior_.fail_after_records >= 0 && produced_ >= static_cast<uint32_t>(behavior_.fail_after_records)) {
                throw std::runtime_error("FakeCursor: injected failure");
            }
            return produced_ < total_;
        }

        core::RecordView next() override {
            if (!has_next()) { throw std::runtime_error("FakeCursor: exhausted"); }
            key_ = "s" + std::to_string(split_) + "-r" + std::to_string(produced_);
            value_ = "v" + std::to_string(produced_);
            ++produced_;
            header_ = core::RecordHeader::create(key_.size(), value_.size());
            return core::RecordView{
                &header_,
                reinterpret_cast<const uint8_t*>(key_.data()),
                reinterpret_cast<const uint8_t*>(value_.data())
            };
        }

        std::optional<double> progress() const noexcept override {
            if (!behavior_.report_progress) return std::nullopt;
            if (total_ == 0) return 1.0;
            return static_cast<double>(produced_) / static_cast<double>(total_);
        }

        void close() noexcept override {
            if (closed_) return;
            closed_ = true;
            ++stats_->closed;
            --stats_->open_now;
        }

    private:
        uint32_t split_;
        uint32_t total_;
        uint32_t produced_{0};
        FakeBehavior behavior_;
        std::shared_ptr<FakeStats> stats_;
        std::stop_token stop_;
        bool closed_{false};

        core::RecordHeader header_{};
        std::string key_;
        std::string value_;
    };

    class FakeFormat final : public format::InputFormat {
    public:
        static constexpr std::string_view ID = "test.fake";

        FakeFormat(FakeBehavior behavior, std::shared_ptr<FakeStats> stats) : behavior_{std::move(behavior)}, stats_{std::move(stats)} {}

        [[nodiscard]] std::string_view id() const noexcept override { return ID; }

        [[nodiscard]] std::vector<format::FileStatus> list_status(std::string_view resource, const format::FormatConfig&) const override {
            if (behavior_.fail_listing) { throw std::runtime_error("FakeFormat: listing failed"); }
            return {format::FileStatus{.path = std::string(resource), .size_bytes = behavior_.listed_bytes}};
        }

        [[nodiscard]] std::vector<std::shared_ptr<const format::InputSplit>> get_splits(
            std::string_view,
            const format::FormatConfig&,
            const format::SplitSizeHint& hint
        ) const override {
            ++stats_->discoveries;
            stats_->last_min_hint = hint.min_bytes.value_or(0);
            stats_->last_max_hint = hint.max_bytes.value_or(0);
            if (behavior_.fail_discovery) { throw std::runtime_error("FakeFormat: discovery failed"); }

            std::vector<std::shared_ptr<const format::InputSplit>> out;
            for (uint32_t i = 0; i < behavior_.records_per_split.size(); ++i) {
                out.push_back(std::make_shared<const FakeSplit>(i, behavior_.records_per_split[i], behavior_.serializable));
            }
            return out;
        }

        [[nodiscard]] std::unique_ptr<format::RecordCursor> open_cursor(
            const format::InputSplit& split,
            const format::FormatConfig&,
            std::stop_token stop
        ) const override {
            if (split.type_tag() != FakeSplit::TYPE_TAG) { throw std::invalid_argument("FakeFormat: foreign split"); }
            return std::make_unique<FakeCursor>(static_cast<const FakeSplit&>(split), behavior_, stats_, std::move(stop));
        }

    private:
        FakeBehavior behavior_;
        std::shared_ptr<FakeStats> stats_;
    };

    /**
     * Context whose registries know the fake format and split on top of the built-ins.
     */
    inline SourceContext fake_context(FakeBehavior behavior, std::shared_ptr<FakeStats> stats, SourceOptions options = {}) {
        auto splits = SplitRegistry::with_builtins();
        splits->register_split(std::string(FakeSplit::TYPE_TAG), [](core::BufferView payload) {
            return std::shared_ptr<const format::InputSplit>(FakeSplit::decode(payload));
        });

        auto formats = FormatRegistry::with_builtins();
        formats->register_format(std::string(FakeFormat::ID), [behavior = std::move(behavior), stats = std::move(stats)] {
            return std::static_pointer_cast<const format::InputFormat>(std::make_shared<const FakeFormat>(behavior, stats));
        });

        return SourceContext{std::move(options), std::move(splits), std::move(formats)};
    }

    inline SourceOptions discovery_order_options() {
        SourceOptions opts;
        opts.split_order = SplitOrder::DiscoveryOrder;
        return opts;
    }
} // namespace akkaraio::test
