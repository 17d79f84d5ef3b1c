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

// tests/test_file_format.cpp
#include "format-file/FileSplit.hpp"
#include "format-file/PathResolver.hpp"
#include "format-text/TextLineInputFormat.hpp"
#include "test_utils.hpp"

#include <stdexcept>

#include <gtest/gtest.h>

using namespace akkaraio;
using namespace akkaraio::test;
using format::file::FileSplit;

static std::vector<const FileSplit*> as_file_splits(const std::vector<std::shared_ptr<const format::InputSplit>>& splits) {
    std::vector<const FileSplit*> out;
    for (const auto& s : splits) {
        EXPECT_EQ(s->type_tag(), FileSplit::TYPE_TAG);
        out.push_back(static_cast<const FileSplit*>(s.get()));
    }
    return out;
}

static format::SplitSizeHint exact(uint64_t bytes) {
    return format::SplitSizeHint{.min_bytes = bytes, .max_bytes = bytes};
}

// =============================================================================
// FileSplit
// =============================================================================

TEST(FileSplitTest, PayloadRoundTrip) {
    const FileSplit split{"/data/part-00001.akk", 65536, 32768, {"node-a"}};

    std::vector<uint8_t> payload;
    split.write_to(payload);
    EXPECT_EQ(payload.size(), 4u + split.path().size() + 16);

    const auto decoded = FileSplit::decode(core::BufferView::of(payload));
    EXPECT_EQ(*decoded, split);
    EXPECT_EQ(decoded->end(), 65536u + 32768);
    EXPECT_EQ(decoded->describe(), "/data/part-00001.akk:65536+32768");
    EXPECT_TRUE(decoded->locations().empty());
    EXPECT_EQ(split.locations(), std::vector<std::string>{"node-a"});
}

TEST(FileSplitTest, PayloadLayoutIsLittleEndianAndAppends) {
    const FileSplit split{"ab", 0x0102030405060708ULL, 5};

    std::vector<uint8_t> payload{0xEE, 0xFF};
    split.write_to(payload);

    const std::vector<uint8_t> expected{
        0xEE, 0xFF,
        2, 0, 0, 0,
        'a', 'b',
        0x08, 0x07, 0x06, 0x05, 0x04, 0x03, 0x02, 0x01,
        5, 0, 0, 0, 0, 0, 0, 0,
    };
    EXPECT_EQ(payload, expected);

    const std::vector<uint8_t> tail(payload.begin() + 2, payload.end());
    EXPECT_EQ(*FileSplit::decode(core::BufferView::of(tail)), split);
}

TEST(FileSplitTest, TruncatedPayloadThrows) {
    const FileSplit split{"/x", 1, 2};
    std::vector<uint8_t> payload;
    split.write_to(payload);
    payload.resize(payload.size() - 3);

    EXPECT_THROW((void)FileSplit::decode(core::BufferView::of(payload)), std::out_of_range);
}

TEST(FileSplitTest, TrailingBytesThrow) {
    const FileSplit split{"/x", 1, 2};
    std::vector<uint8_t> payload;
    split.write_to(payload);
    payload.push_back(0);

    EXPECT_THROW((void)FileSplit::decode(core::BufferView::of(payload)), std::runtime_error);
}

// =============================================================================
// PathResolver
// =============================================================================

TEST(PathResolverTest, SchemeHandling) {
    EXPECT_EQ(format::file::strip_scheme("file:///tmp/a.txt"), "/tmp/a.txt");
    EXPECT_EQ(format::file::strip_scheme("/tmp/a.txt"), "/tmp/a.txt");
    EXPECT_THROW((void)format::file::strip_scheme("hdfs://nn:8020/a.txt"), std::invalid_argument);
}

TEST(PathResolverTest, GlobAndHiddenDetection) {
    EXPECT_TRUE(format::file::is_glob("/a/*.txt"));
    EXPECT_TRUE(format::file::is_glob("/a/part-?"));
    EXPECT_TRUE(format::file::is_glob("/a/[ab]"));
    EXPECT_FALSE(format::file::is_glob("/a/b.txt"));

    EXPECT_TRUE(format::file::is_hidden(".crc"));
    EXPECT_TRUE(format::file::is_hidden("_SUCCESS"));
    EXPECT_FALSE(format::file::is_hidden("part-00000"));
    EXPECT_FALSE(format::file::is_hidden(""));
}

TEST(PathResolverTest, DirectorySkipsHiddenFilesAndSorts) {
    TempDir dir;
    write_file(dir / "b.txt", "bb");
    write_file(dir / "a.txt", "a");
    write_file(dir / "_SUCCESS", "");
    write_file(dir / ".a.txt.crc", "xxxx");

    const auto files = format::file::resolve(dir.path().string());
    ASSERT_EQ(files.size(), 2u);
    EXPECT_EQ(files[0].path, (dir / "a.txt").string());
    EXPECT_EQ(files[0].size_bytes, 1u);
    EXPECT_EQ(files[1].path, (dir / "b.txt").string());
    EXPECT_EQ(files[1].size_bytes, 2u);
}

TEST(PathResolverTest, GlobMatchesAndNoMatchIsEmpty) {
    TempDir dir;
    write_file(dir / "part-0.txt", "x");
    write_file(dir / "part-1.txt", "yy");
    write_file(dir / "_part-2.txt", "zzz");
    write_file(dir / "other.log", "w");

    const auto files = format::file::resolve((dir.path() / "*part-*.txt").string());
    ASSERT_EQ(files.size(), 2u);
    EXPECT_EQ(files[0].path, (dir / "part-0.txt").string());
    EXPECT_EQ(files[1].path, (dir / "part-1.txt").string());

    EXPECT_TRUE(format::file::resolve((dir.path() / "*.parquet").string()).empty());
}

TEST(PathResolverTest, FileSchemeResolvesLiteralFile) {
    TempDir dir;
    write_file(dir / "one.txt", "12345");

    const auto files = format::file::resolve("file://" + (dir / "one.txt").string());
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(files[0].size_bytes, 5u);
}

TEST(PathResolverTest, MissingLiteralPathThrows) {
    TempDir dir;
    EXPECT_THROW((void)format::file::resolve((dir / "nope.txt").string()), std::runtime_error);
    EXPECT_THROW((void)format::file::resolve(""), std::invalid_argument);
}

// =============================================================================
// FileInputFormat split sizing
// =============================================================================

TEST(FileInputFormatTest, ComputeSplitSizeHonoursHint) {
    const format::text::TextLineInputFormat fmt;

    EXPECT_EQ(fmt.compute_split_size({}), format::file::FileInputFormat::DEFAULT_SPLIT_SIZE);
    EXPECT_EQ(fmt.compute_split_size(exact(1000)), 1000u);
    EXPECT_EQ(fmt.compute_split_size(format::SplitSizeHint{.min_bytes = 64ULL << 20, .max_bytes = std::nullopt}), 64ULL << 20);
    EXPECT_EQ(fmt.compute_split_size(format::SplitSizeHint{.min_bytes = std::nullopt, .max_bytes = 4096}), 4096u);
    EXPECT_EQ(fmt.compute_split_size(exact(0)), 1u);
}

TEST(FileInputFormatTest, SplitsCoverFileWithSlopOnTail) {
    TempDir dir;
    write_file(dir / "a.txt", std::string(105, 'x'));

    const format::text::TextLineInputFormat fmt;
    const auto splits = as_file_splits(fmt.get_splits((dir / "a.txt").string(), {}, exact(10)));

    ASSERT_EQ(splits.size(), 11u);
    uint64_t expected_start = 0;
    for (const auto* s : splits) {
        EXPECT_EQ(s->start(), expected_start);
        expected_start = s->end();
    }
    EXPECT_EQ(expected_start, 105u);
    EXPECT_EQ(splits.back()->length(), 5u);
}

TEST(FileInputFormatTest, TailWithinSlopIsMerged) {
    TempDir dir;
    write_file(dir / "a.txt", std::string(21, 'x'));

    const format::text::TextLineInputFormat fmt;
    const auto splits = as_file_splits(fmt.get_splits((dir / "a.txt").string(), {}, exact(20)));

    ASSERT_EQ(splits.size(), 1u);
    EXPECT_EQ(splits[0]->length(), 21u);
}

TEST(FileInputFormatTest, EmptyFileYieldsOneEmptySplit) {
    TempDir dir;
    write_file(dir / "empty.txt", "");
    write_file(dir / "full.txt", "hello\n");

    const format::text::TextLineInputFormat fmt;
    const auto splits = as_file_splits(fmt.get_splits(dir.path().string(), {}, exact(1024)));

    ASSERT_EQ(splits.size(), 2u);
    EXPECT_EQ(splits[0]->path(), (dir / "empty.txt").string());
    EXPECT_EQ(splits[0]->length(), 0u);
    EXPECT_EQ(splits[1]->length(), 6u);
}

TEST(FileInputFormatTest, NoMatchingFilesYieldsNoSplits) {
    TempDir dir;
    const format::text::TextLineInputFormat fmt;
    EXPECT_TRUE(fmt.get_splits((dir.path() / "*.txt").string(), {}, {}).empty());
}

TEST(FileInputFormatTest, ForeignSplitIsRejected) {
    const format::text::TextLineInputFormat fmt;
    const FakeSplit foreign{0, 1};
    EXPECT_THROW((void)fmt.open_cursor(foreign, {}, {}), std::invalid_argument);
}
