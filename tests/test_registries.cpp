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

// tests/test_registries.cpp
#include "akkaraio/Coder.hpp"
#include "akkaraio/Errors.hpp"
#include "akkaraio/FormatRegistry.hpp"
#include "akkaraio/OpaqueSplitHandle.hpp"
#include "akkaraio/SplitRegistry.hpp"
#include "akkaraio/TypeTags.hpp"
#include "format-file/FileSplit.hpp"
#include "test_utils.hpp"

#include <algorithm>
#include <stdexcept>
#include <thread>

#include <gtest/gtest.h>

using namespace akkaraio;
using namespace akkaraio::test;
using format::file::FileSplit;

static std::vector<uint8_t> payload_of(const format::InputSplit& split) {
    std::vector<uint8_t> out;
    split.write_to(out);
    return out;
}

// =============================================================================
// SplitRegistry
// =============================================================================

TEST(SplitRegistryTest, BuiltinsDecodeFileSplits) {
    const auto registry = SplitRegistry::with_builtins();
    EXPECT_TRUE(registry->contains(FileSplit::TYPE_TAG));
    EXPECT_EQ(registry->tags(), std::vector<std::string>{std::string(FileSplit::TYPE_TAG)});

    const FileSplit original{"/in/a.akk", 32768, 65536};
    const auto decoded = registry->decode(FileSplit::TYPE_TAG, payload_of(original));
    ASSERT_NE(decoded, nullptr);
    EXPECT_EQ(static_cast<const FileSplit&>(*decoded), original);
}

TEST(SplitRegistryTest, RegistrationRejectsDuplicatesAndEmpties) {
    SplitRegistry registry;
    const SplitRegistry::Decoder decoder = [](core::BufferView payload) {
        return std::shared_ptr<const format::InputSplit>(FakeSplit::decode(payload));
    };

    registry.register_split("t", decoder);
    EXPECT_THROW(registry.register_split("t", decoder), std::invalid_argument);
    EXPECT_THROW(registry.register_split("", decoder), std::invalid_argument);
    EXPECT_THROW(registry.register_split("u", nullptr), std::invalid_argument);
}

TEST(SplitRegistryTest, DecodeFailuresAreSerializationErrors) {
    SplitRegistry registry;
    registry.register_split(std::string(FakeSplit::TYPE_TAG), [](core::BufferView payload) {
        return std::shared_ptr<const format::InputSplit>(FakeSplit::decode(payload));
    });
    registry.register_split("null", [](core::BufferView) { return std::shared_ptr<const format::InputSplit>(); });
    registry.register_split("liar", [](core::BufferView) {
        return std::shared_ptr<const format::InputSplit>(std::make_shared<const FakeSplit>(0, 0));
    });

    const std::vector<uint8_t> garbage{1, 2, 3};
    EXPECT_THROW((void)registry.decode("unknown", garbage), SerializationError);
    EXPECT_THROW((void)registry.decode(FakeSplit::TYPE_TAG, garbage), SerializationError);
    EXPECT_THROW((void)registry.decode("null", garbage), SerializationError);
    EXPECT_THROW((void)registry.decode("liar", garbage), SerializationError);

    try {
        (void)registry.decode(FakeSplit::TYPE_TAG, garbage);
        FAIL() << "expected SerializationError";
    }
    catch (const SerializationError& e) {
        EXPECT_THROW(std::rethrow_if_nested(e), std::runtime_error);
    }
}

// =============================================================================
// FormatRegistry
// =============================================================================

TEST(FormatRegistryTest, BuiltinsCreateBothFormats) {
    const auto registry = FormatRegistry::with_builtins();
    EXPECT_EQ(registry->ids(), (std::vector<std::string>{"akk.block", "text.line"}));
    EXPECT_EQ(registry->create("akk.block")->id(), "akk.block");
    EXPECT_EQ(registry->create("text.line")->id(), "text.line");
}

TEST(FormatRegistryTest, UnknownOrBrokenFactoriesArePlanningErrors) {
    FormatRegistry registry;
    registry.register_format("throws", []() -> std::shared_ptr<const format::InputFormat> { throw std::runtime_error("boom"); });
    registry.register_format("null", [] { return std::shared_ptr<const format::InputFormat>(); });

    EXPECT_THROW((void)registry.create("parquet"), PlanningError);
    EXPECT_THROW((void)registry.create("throws"), PlanningError);
    EXPECT_THROW((void)registry.create("null"), PlanningError);

    EXPECT_THROW(registry.register_format("null", [] { return std::shared_ptr<const format::InputFormat>(); }), std::invalid_argument);
    EXPECT_THROW(registry.register_format("", [] { return std::shared_ptr<const format::InputFormat>(); }), std::invalid_argument);
    EXPECT_THROW(registry.register_format("x", nullptr), std::invalid_argument);
}

TEST(SourceContextTest, NullRegistriesAreRejected) {
    EXPECT_THROW((SourceContext{SourceOptions{}, nullptr, FormatRegistry::with_builtins()}), std::invalid_argument);
    EXPECT_THROW((SourceContext{SourceOptions{}, SplitRegistry::with_builtins(), nullptr}), std::invalid_argument);

    SourceOptions opts;
    opts.min_bundle_size_bytes = 7;
    const SourceContext ctx;
    const auto derived = ctx.with_options(opts);
    EXPECT_EQ(derived.options().min_bundle_size_bytes, 7u);
    EXPECT_EQ(&derived.splits(), &ctx.splits());
    EXPECT_EQ(&derived.formats(), &ctx.formats());
}

// =============================================================================
// OpaqueSplitHandle
// =============================================================================

TEST(OpaqueSplitHandleTest, WrapSerializesEagerly) {
    const auto split = std::make_shared<const FileSplit>("/in/a.txt", 10, 20);
    const auto handle = OpaqueSplitHandle::wrap(split);

    EXPECT_EQ(handle.type_tag(), FileSplit::TYPE_TAG);
    EXPECT_EQ(handle.length(), 20u);
    EXPECT_TRUE(std::ranges::equal(handle.payload(), payload_of(*split)));
    EXPECT_TRUE(handle.is_decoded());
    EXPECT_EQ(handle.split(*SplitRegistry::with_builtins()), split);
}

TEST(OpaqueSplitHandleTest, WrapRejectsNullAndUnserializable) {
    EXPECT_THROW((void)OpaqueSplitHandle::wrap(nullptr), std::invalid_argument);
    EXPECT_THROW((void)OpaqueSplitHandle::wrap(std::make_shared<const FakeSplit>(0, 1, false)), std::invalid_argument);
}

TEST(OpaqueSplitHandleTest, SerializedHandleDecodesOnceOnDemand) {
    const FileSplit original{"/in/b.txt", 0, 99};
    const auto handle = OpaqueSplitHandle::from_serialized(std::string(FileSplit::TYPE_TAG), payload_of(original), 99);
    EXPECT_FALSE(handle.is_decoded());

    const auto registry = SplitRegistry::with_builtins();
    std::vector<std::shared_ptr<const format::InputSplit>> results(4);
    {
        std::vector<std::jthread> threads;
        for (size_t i = 0; i < results.size(); ++i) {
            threads.emplace_back([&, i] { results[i] = handle.split(*registry); });
        }
    }

    EXPECT_TRUE(handle.is_decoded());
    for (const auto& r : results) { EXPECT_EQ(r, results[0]); }
    EXPECT_EQ(static_cast<const FileSplit&>(*results[0]), original);
}

TEST(OpaqueSplitHandleTest, CopiesShareDecodedSplitAndCompareByPayload) {
    const auto a = OpaqueSplitHandle::wrap(std::make_shared<const FileSplit>("/in/c.txt", 0, 5));
    const auto b = OpaqueSplitHandle::from_serialized(std::string(a.type_tag()), std::vector<uint8_t>(a.payload().begin(), a.payload().end()), 5);
    const auto c = OpaqueSplitHandle::wrap(std::make_shared<const FileSplit>("/in/c.txt", 5, 5));

    EXPECT_EQ(a, b);
    EXPECT_FALSE(a == c);

    const OpaqueSplitHandle copy = b;
    (void)copy.split(*SplitRegistry::with_builtins());
    EXPECT_TRUE(b.is_decoded());
}

TEST(OpaqueSplitHandleTest, UnknownTagFailsOnDecode) {
    const auto handle = OpaqueSplitHandle::from_serialized("mystery", {1, 2}, 2);
    EXPECT_THROW((void)handle.split(*SplitRegistry::with_builtins()), SerializationError);
    EXPECT_FALSE(handle.is_decoded());
}

// =============================================================================
// Coders
// =============================================================================

TEST(CoderTest, DefaultCodersFollowTypeTags) {
    EXPECT_EQ(coder_for_type(type_tags::BYTES)->id(), RecordCoder::ID);
    EXPECT_EQ(coder_for_type(type_tags::TEXT)->id(), RecordCoder::ID);
    EXPECT_EQ(coder_for_type(type_tags::U64)->id(), RecordCoder::ID);
    EXPECT_EQ(coder_for_type(type_tags::VOID)->id(), VoidCoder::ID);
    EXPECT_THROW((void)coder_for_type("avro"), UnsupportedTypeError);
    EXPECT_THROW((void)coder_for_id("kryo"), UnsupportedTypeError);
}

TEST(CoderTest, KvCoderRoundTripsConsecutivePairs) {
    const KvCoder coder{coder_for_id("record"), coder_for_id("record")};
    EXPECT_EQ(coder.describe(), "kv(record,record)");

    const auto p1 = KvPair::copy_of(std::vector<uint8_t>{1, 2}, std::vector<uint8_t>{3});
    const auto p2 = KvPair::copy_of(std::vector<uint8_t>{}, std::vector<uint8_t>{4, 5, 6});

    std::vector<uint8_t> buf;
    coder.encode(p1, buf);
    coder.encode(p2, buf);

    size_t offset = 0;
    EXPECT_EQ(coder.decode(buf, offset), p1);
    EXPECT_EQ(coder.decode(buf, offset), p2);
    EXPECT_EQ(offset, buf.size());
}

TEST(CoderTest, VoidValueDropsPayload) {
    const KvCoder coder{coder_for_id("record"), coder_for_id("void")};
    const auto encoded = coder.encode(KvPair::copy_of(std::vector<uint8_t>{9}, std::vector<uint8_t>{1, 2, 3}));
    EXPECT_EQ(encoded.size(), 5u);

    size_t offset = 0;
    const auto decoded = coder.decode(encoded, offset);
    EXPECT_EQ(decoded.key, std::vector<uint8_t>{9});
    EXPECT_TRUE(decoded.value.empty());
}

TEST(CoderTest, TruncatedInputIsSerializationError) {
    const RecordCoder coder;
    std::vector<uint8_t> buf;
    coder.encode(std::vector<uint8_t>{1, 2, 3, 4}, buf);
    buf.pop_back();

    size_t offset = 0;
    EXPECT_THROW((void)coder.decode(buf, offset), SerializationError);
    EXPECT_EQ(offset, 0u);
}

TEST(CoderTest, NullComponentIsRejected) {
    EXPECT_THROW((KvCoder{nullptr, coder_for_id("void")}), std::invalid_argument);
}
