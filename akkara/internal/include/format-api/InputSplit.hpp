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

// internal/include/format-api/InputSplit.hpp
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace akkaraio::format {
    /**
     * InputSplit - Abstract descriptor of one independently readable unit of
     * work produced by an InputFormat.
     *
     * Outside the format that produced it, a split is opaque except for its
     * length and its serialized form. Serialization is tag + payload: the
     * type tag selects a decoder in the SplitRegistry, and write_to() emits a
     * self-describing payload that decoder accepts.
     *
     * Thread-safety: Immutable after construction, fully thread-safe.
     */
    class InputSplit {
    public:
        virtual ~InputSplit() = default;

        /**
         * Stable identifier of the concrete split type (e.g. "akk.file-split").
         */
        [[nodiscard]] virtual std::string_view type_tag() const noexcept = 0;

        /**
         * Size of the split in bytes (used for size estimates, never for
         * correctness).
         */
        [[nodiscard]] virtual uint64_t length() const noexcept = 0;

        /**
         * Hosts holding the data; a scheduling hint, may be empty.
         */
        [[nodiscard]] virtual std::vector<std::string> locations() const { return {}; }

        /**
         * Whether write_to() produces a payload the registered decoder accepts.
         * Splits that return false cannot be wrapped in an OpaqueSplitHandle.
         */
        [[nodiscard]] virtual bool serializable() const noexcept { return true; }

        /**
         * Appends the serialized payload to out.
         *
         * @throws std::logic_error if the split is not serializable
         */
        virtual void write_to(std::vector<uint8_t>& out) const = 0;

        /**
         * Human-readable description for logs and error messages.
         */
        [[nodiscard]] virtual std::string describe() const = 0;
    };
} // namespace akkaraio::format
