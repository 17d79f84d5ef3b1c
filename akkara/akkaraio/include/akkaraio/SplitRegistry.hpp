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

// akkara/akkaraio/include/akkaraio/SplitRegistry.hpp
#pragma once

#include "Export.hpp"
#include "core/buffer/BufferView.hpp"
#include "format-api/InputSplit.hpp"
#include <functional>
#include <map>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace akkaraio {
    /**
     * SplitRegistry - Maps a split type tag to the function that rebuilds
     * the split from its payload.
     *
     * The set of decodable split kinds is exactly what was registered; there
     * is no fallback lookup.
     *
     * Typical usage:
     * ```cpp
     * auto registry = SplitRegistry::with_builtins();
     * registry->register_split("my.split", [](core::BufferView payload) {
     *     return MySplit::decode(payload);
     * });
     * ```
     *
     * Thread-safety: register_split() is NOT thread-safe and must complete
     * before the registry is shared. decode() is thread-safe.
     */
    class AKKARAIO_API SplitRegistry {
    public:
        using Decoder = std::function<std::shared_ptr<const format::InputSplit>(core::BufferView)>;

        SplitRegistry() = default;

        /**
         * Registry holding FileSplit ("akk.file-split").
         */
        [[nodiscard]] static std::shared_ptr<SplitRegistry> with_builtins();

        /**
         * @throws std::invalid_argument if tag is empty, already registered, or decoder is empty
         */
        void register_split(std::string tag, Decoder decoder);

        [[nodiscard]] bool contains(std::string_view tag) const noexcept;

        [[nodiscard]] std::vector<std::string> tags() const;

        /**
         * Rebuilds a split.
         *
         * @throws SerializationError if tag is unknown, the payload is rejected,
         *         or the decoded split reports a different tag
         */
        [[nodiscard]] std::shared_ptr<const format::InputSplit> decode(std::string_view tag, std::span<const uint8_t> payload) const;

    private:
        std::map<std::string, Decoder, std::less<>> decoders_;
    };
} // namespace akkaraio
