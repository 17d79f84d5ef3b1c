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

// akkara/akkaraio/src/SourceContext.cpp
#include "akkaraio/SourceContext.hpp"

#include <stdexcept>

namespace akkaraio {
    SourceContext::SourceContext(SourceOptions options)
        : SourceContext(std::move(options), SplitRegistry::with_builtins(), FormatRegistry::with_builtins()) {}

    SourceContext::SourceContext(
        SourceOptions options,
        std::shared_ptr<const SplitRegistry> splits,
        std::shared_ptr<const FormatRegistry> formats
    ) : options_{std::move(options)}, splits_{std::move(splits)}, formats_{std::move(formats)} {
        if (!splits_) { throw std::invalid_argument("SourceContext: split registry must not be null"); }
        if (!formats_) { throw std::invalid_argument("SourceContext: format registry must not be null"); }
    }

    SourceContext SourceContext::with_options(SourceOptions options) const {
        return SourceContext{std::move(options), splits_, formats_};
    }
} // namespace akkaraio
