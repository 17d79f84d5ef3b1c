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

// akkara/akkaraio/include/akkaraio/SplitPlanner.hpp
#pragma once

#include "Export.hpp"
#include "OpaqueSplitHandle.hpp"
#include "SourceContext.hpp"
#include "format-api/FormatConfig.hpp"
#include <cstdint>
#include <string_view>
#include <vector>

namespace akkaraio {
    /**
     * SplitPlanner - Turns a resource into an ordered list of split handles.
     *
     * Algorithm:
     * 1. unit = max(desired, options.min_bundle_size_bytes)
     * 2. ask the format for splits with unit as both soft min and soft max
     * 3. reorder per options.split_order (shuffled unless DiscoveryOrder)
     * 4. wrap each split into an OpaqueSplitHandle
     *
     * With SplitOrder::Shuffled and a fixed shuffle_seed the permutation is
     * reproducible; without a seed every call draws a fresh one.
     *
     * Thread-safety: Fully thread-safe.
     */
    class AKKARAIO_API SplitPlanner {
    public:
        explicit SplitPlanner(SourceContext ctx) : ctx_{std::move(ctx)} {}

        /**
         * @throws PlanningError if the format cannot be instantiated or split discovery fails
         * @throws std::invalid_argument if the format returns a non-serializable split
         */
        [[nodiscard]] std::vector<OpaqueSplitHandle> plan(
            std::string_view resource,
            std::string_view format_id,
            const format::FormatConfig& config,
            uint64_t desired_unit_size_bytes
        ) const;

        [[nodiscard]] uint64_t effective_unit_size(uint64_t desired_unit_size_bytes) const noexcept;

    private:
        SourceContext ctx_;
    };
} // namespace akkaraio
