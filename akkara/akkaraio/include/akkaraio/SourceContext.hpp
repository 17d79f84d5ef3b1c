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

// akkara/akkaraio/include/akkaraio/SourceContext.hpp
#pragma once

#include "Export.hpp"
#include "FormatRegistry.hpp"
#include "SourceOptions.hpp"
#include "SplitRegistry.hpp"
#include <memory>

namespace akkaraio {
    /**
     * SourceContext - Options plus the registries every planning, estimation
     * and reading entry point needs.
     *
     * Copies share the registries. The registries must be fully populated
     * before the context is first used.
     *
     * Thread-safety: Immutable, fully thread-safe.
     */
    class AKKARAIO_API SourceContext {
    public:
        /**
         * Context over the built-in splits and formats.
         */
        explicit SourceContext(SourceOptions options = {});

        /**
         * @throws std::invalid_argument if a registry is null
         */
        SourceContext(
            SourceOptions options,
            std::shared_ptr<const SplitRegistry> splits,
            std::shared_ptr<const FormatRegistry> formats
        );

        [[nodiscard]] const SourceOptions& options() const noexcept { return options_; }
        [[nodiscard]] const SplitRegistry& splits() const noexcept { return *splits_; }
        [[nodiscard]] const FormatRegistry& formats() const noexcept { return *formats_; }

        /**
         * Same registries, different options.
         */
        [[nodiscard]] SourceContext with_options(SourceOptions options) const;

    private:
        SourceOptions options_;
        std::shared_ptr<const SplitRegistry> splits_;
        std::shared_ptr<const FormatRegistry> formats_;
    };
} // namespace akkaraio
