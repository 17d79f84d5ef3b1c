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

// akkara/akkaraio/include/akkaraio/OpaqueSplitHandle.hpp
#pragma once

#include "Export.hpp"
#include "format-api/InputSplit.hpp"
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace akkaraio {
    class SplitRegistry;

    /**
     * OpaqueSplitHandle - Serializable wrapper around one unit of work.
     *
     * Carries the split's type tag, its serialized payload and its length.
     * The concrete split is rebuilt on first access through a SplitRegistry
     * and cached; handles built by wrap() start with the split already known.
     *
     * Copies share the payload and the cached split.
     *
     * Thread-safety: Fully thread-safe (the lazy decode is synchronized).
     */
    class AKKARAIO_API OpaqueSplitHandle {
    public:
        /**
         * Wraps a freshly discovered split, serializing it immediately.
         *
         * @throws std::invalid_argument if split is null or not serializable
         */
        [[nodiscard]] static OpaqueSplitHandle wrap(std::shared_ptr<const format::InputSplit> split);

        /**
         * Handle for a split received in serialized form. Nothing is decoded yet.
         */
        [[nodiscard]] static OpaqueSplitHandle from_serialized(std::string type_tag, std::vector<uint8_t> payload, uint64_t length);

        [[nodiscard]] const std::string& type_tag() const noexcept;
        [[nodiscard]] std::span<const uint8_t> payload() const noexcept;
        [[nodiscard]] uint64_t length() const noexcept;

        /**
         * Returns the concrete split, decoding it on first call.
         *
         * @throws SerializationError if the registry cannot decode the payload
         */
        [[nodiscard]] std::shared_ptr<const format::InputSplit> split(const SplitRegistry& registry) const;

        [[nodiscard]] bool is_decoded() const noexcept;

        /**
         * Same tag and payload.
         */
        [[nodiscard]] bool operator==(const OpaqueSplitHandle& other) const noexcept;

    private:
        struct State;

        explicit OpaqueSplitHandle(std::shared_ptr<State> state) noexcept : state_{std::move(state)} {}

        std::shared_ptr<State> state_;
    };
} // namespace akkaraio
