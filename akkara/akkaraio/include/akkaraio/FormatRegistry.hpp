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

// akkara/akkaraio/include/akkaraio/FormatRegistry.hpp
#pragma once

#include "Export.hpp"
#include "format-api/InputFormat.hpp"
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace akkaraio {
    /**
     * FormatRegistry - Maps a format descriptor to a factory for its
     * InputFormat.
     *
     * Thread-safety: register_format() is NOT thread-safe and must complete
     * before the registry is shared. create() is thread-safe as long as the
     * factories are.
     */
    class AKKARAIO_API FormatRegistry {
    public:
        using Factory = std::function<std::shared_ptr<const format::InputFormat>()>;

        FormatRegistry() = default;

        /**
         * Registry holding "akk.block" and "text.line".
         */
        [[nodiscard]] static std::shared_ptr<FormatRegistry> with_builtins();

        /**
         * @throws std::invalid_argument if id is empty, already registered, or factory is empty
         */
        void register_format(std::string id, Factory factory);

        [[nodiscard]] bool contains(std::string_view id) const noexcept;

        [[nodiscard]] std::vector<std::string> ids() const;

        /**
         * Instantiates the format registered under id.
         *
         * @throws PlanningError if id is unknown or the factory fails
         */
        [[nodiscard]] std::shared_ptr<const format::InputFormat> create(std::string_view id) const;

    private:
        std::map<std::string, Factory, std::less<>> factories_;
    };
} // namespace akkaraio
