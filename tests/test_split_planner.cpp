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

// tests/test_split_planner.cpp
#include "akkaraio/Errors.hpp"
#include "akkaraio/SplitPlanner.hpp"
#include "test_utils.hpp"

#include <algorithm>
#include <numeric>
#include <stdexcept>

#include <gtest/gtest.h>

using namespace akkaraio;
using namespace akkaraio::test;

static std::vector<uint32_t> indices_of(const std::vector<OpaqueSplitHandle>& handles, const SourceContext& ctx) {
    std::vector<uint32_t> out;
    for (const auto& h : handles) { out.push_back(static_cast<const FakeSplit&>(*h.split(ctx.splits())).index()); }
    return out;
}

static FakeBehavior splits_of_one_record(uint32_t count) {
    FakeBehavior behavior;
    behavior.records_per_split.assign(count, 1);
    return behavior;
}

static std::vector<uint32_t> iota_of(uint32_t n) {
    std::vector<uint32_t> out(n);
    std::iota(out.begin(), out.end(), 0u);
    return out;
}

// =============================================================================
// Unit size floor
// =============================================================================

TEST(SplitPlannerTest, EffectiveUnitSizeIsFloored) {
    const SplitPlanner planner{SourceContext{}};
    EXPECT_EQ(planner.effective_unit_size(1), SourceOptions::DEFAULT_MIN_BUNDLE_SIZE);
    EXPECT_EQ(planner.effective_unit_size(0), SourceOptions::DEFAULT_MIN_BUNDLE_SIZE);
    EXPECT_EQ(planner.effective_unit_size(1ULL << 30), 1ULL << 30);
}

TEST(SplitPlannerTest, FloorIsPassedAsMinAndMaxHint) {
    auto stats = std::make_shared<FakeStats>();
    const auto ctx = fake_context(splits_of_one_record(1), stats);

    (void)SplitPlanner{ctx}.plan("r", FakeFormat::ID, {}, 1);
    EXPECT_EQ(stats->last_min_hint.load(), SourceOptions::DEFAULT_MIN_BUNDLE_SIZE);
    EXPECT_EQ(stats->last_max_hint.load(), SourceOptions::DEFAULT_MIN_BUNDLE_SIZE);

    SourceOptions small;
    small.min_bundle_size_bytes = 0;
    (void)SplitPlanner{ctx.with_options(small)}.plan("r", FakeFormat::ID, {}, 4096);
    EXPECT_EQ(stats->last_min_hint.load(), 4096u);
    EXPECT_EQ(stats->last_max_hint.load(), 4096u);
}

TEST(SplitPlannerTest, FloorLimitsRealFileFanOut) {
    TempDir dir;
    write_file(dir / "a.txt", std::string(10000, 'x'));

    SourceOptions opts = discovery_order_options();
    opts.min_bundle_size_bytes = 1000;
    const SplitPlanner planner{SourceContext{opts}};

    EXPECT_EQ(planner.plan((dir / "a.txt").string(), "text.line", {}, 1).size(), 10u);
    EXPECT_EQ(planner.plan((dir / "a.txt").string(), "text.line", {}, 5000).size(), 2u);
}

// =============================================================================
// Ordering
// =============================================================================

TEST(SplitPlannerTest, DiscoveryOrderIsPreserved) {
    auto stats = std::make_shared<FakeStats>();
    const auto ctx = fake_context(splits_of_one_record(12), stats, discovery_order_options());

    const auto handles = SplitPlanner{ctx}.plan("r", FakeFormat::ID, {}, 1);
    EXPECT_EQ(indices_of(handles, ctx), iota_of(12));
}

TEST(SplitPlannerTest, SeededShuffleIsReproduciblePermutation) {
    SourceOptions opts;
    opts.split_order = SplitOrder::Shuffled;
    opts.shuffle_seed = 42;

    auto stats = std::make_shared<FakeStats>();
    const auto ctx = fake_context(splits_of_one_record(20), stats, opts);
    const SplitPlanner planner{ctx};

    const auto first = indices_of(planner.plan("r", FakeFormat::ID, {}, 1), ctx);
    const auto second = indices_of(planner.plan("r", FakeFormat::ID, {}, 1), ctx);

    EXPECT_EQ(first, second);
    EXPECT_NE(first, iota_of(20));

    auto sorted = first;
    std::ranges::sort(sorted);
    EXPECT_EQ(sorted, iota_of(20));
}

TEST(SplitPlannerTest, UnseededShuffleVariesAcrossCalls) {
    auto stats = std::make_shared<FakeStats>();
    const auto ctx = fake_context(splits_of_one_record(20), stats);
    const SplitPlanner planner{ctx};

    // 20! orderings: ten identical draws are practically impossible
    int identical = 0;
    const auto reference = indices_of(planner.plan("r", FakeFormat::ID, {}, 1), ctx);
    for (int i = 0; i < 10; ++i) {
        if (indices_of(planner.plan("r", FakeFormat::ID, {}, 1), ctx) == reference) ++identical;
    }
    EXPECT_LT(identical, 10);
}

// =============================================================================
// Failures
// =============================================================================

TEST(SplitPlannerTest, DiscoveryFailureIsPlanningErrorWithCause) {
    auto stats = std::make_shared<FakeStats>();
    FakeBehavior behavior;
    behavior.fail_discovery = true;
    const auto ctx = fake_context(behavior, stats);

    try {
        (void)SplitPlanner{ctx}.plan("r", FakeFormat::ID, {}, 1);
        FAIL() << "expected PlanningError";
    }
    catch (const PlanningError& e) {
        EXPECT_THROW(std::rethrow_if_nested(e), std::runtime_error);
    }
}

TEST(SplitPlannerTest, UnknownFormatIsPlanningError) {
    const SplitPlanner planner{SourceContext{}};
    EXPECT_THROW((void)planner.plan("/tmp", "orc", {}, 1), PlanningError);
}

TEST(SplitPlannerTest, MissingPathIsPlanningError) {
    TempDir dir;
    const SplitPlanner planner{SourceContext{}};
    EXPECT_THROW((void)planner.plan((dir / "absent.txt").string(), "text.line", {}, 1), PlanningError);
}

TEST(SplitPlannerTest, UnserializableSplitFailsImmediately) {
    auto stats = std::make_shared<FakeStats>();
    FakeBehavior behavior = splits_of_one_record(2);
    behavior.serializable = false;
    const auto ctx = fake_context(behavior, stats);

    EXPECT_THROW((void)SplitPlanner{ctx}.plan("r", FakeFormat::ID, {}, 1), std::invalid_argument);
}
