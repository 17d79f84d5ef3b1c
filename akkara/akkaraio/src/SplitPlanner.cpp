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

// akkara/akkaraio/src/SplitPlanner.cpp
#include "akkaraio/SplitPlanner.hpp"
#include "akkaraio/Errors.hpp"

#include <algorithm>
#include <exception>
#include <random>

#include <glog/logging.h>

namespace akkaraio {
    uint64_t SplitPlanner::effective_unit_size(uint64_t desired_unit_size_bytes) const noexcept {
        return std::max(desired_unit_size_bytes, ctx_.options().min_bundle_size_bytes);
    }

    std::vector<OpaqueSplitHandle> SplitPlanner::plan(
        std::string_view resource,
        std::string_view format_id,
        const format::FormatConfig& config,
        uint64_t desired_unit_size_bytes
    ) const {
        const uint64_t unit = effective_unit_size(desired_unit_size_bytes);
        const auto input_format = ctx_.formats().create(format_id);

        std::vector<std::shared_ptr<const format::InputSplit>> splits;
        try { splits = input_format->get_splits(resource, config, format::SplitSizeHint{.min_bytes = unit, .max_bytes = unit}); }
        catch (const std::exception&) {
            std::throw_with_nested(PlanningError("SplitPlanner: split discovery failed for " + std::string(resource)));
        }

        LOG(INFO) << "SplitPlanner: " << splits.size() << " splits for " << resource
                  << " (format=" << format_id << ", unit=" << unit << " bytes, desired=" << desired_unit_size_bytes << ")";

        const auto& opts = ctx_.options();
        if (opts.split_order == SplitOrder::Shuffled && splits.size() > 1) {
            std::mt19937_64 rng{opts.shuffle_seed ? *opts.shuffle_seed : std::random_device{}()};
            std::ranges::shuffle(splits, rng);
        }

        std::vector<OpaqueSplitHandle> handles;
        handles.reserve(splits.size());
        for (auto& split : splits) { handles.push_back(OpaqueSplitHandle::wrap(std::move(split))); }
        return handles;
    }
} // namespace akkaraio
