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

// akkara/akkaraio/src/FormatRegistry.cpp
#include "akkaraio/FormatRegistry.hpp"
#include "akkaraio/Errors.hpp"
#include "format-akk/AkkBlockInputFormat.hpp"
#include "format-text/TextLineInputFormat.hpp"

#include <exception>
#include <stdexcept>

namespace akkaraio {
    std::shared_ptr<FormatRegistry> FormatRegistry::with_builtins() {
        auto registry = std::make_shared<FormatRegistry>();
        registry->register_format(std::string(format::akk::AkkBlockInputFormat::ID), [] {
            return std::static_pointer_cast<const format::InputFormat>(std::make_shared<const format::akk::AkkBlockInputFormat>());
        });
        registry->register_format(std::string(format::text::TextLineInputFormat::ID), [] {
            return std::static_pointer_cast<const format::InputFormat>(std::make_shared<const format::text::TextLineInputFormat>());
        });
        return registry;
    }

    void FormatRegistry::register_format(std::string id, Factory factory) {
        if (id.empty()) { throw std::invalid_argument("FormatRegistry: empty format id"); }
        if (!factory) { throw std::invalid_argument("FormatRegistry: empty factory for " + id); }
        if (factories_.contains(id)) { throw std::invalid_argument("FormatRegistry: format already registered: " + id); }
        factories_.emplace(std::move(id), std::move(factory));
    }

    bool FormatRegistry::contains(std::string_view id) const noexcept { return factories_.find(id) != factories_.end(); }

    std::vector<std::string> FormatRegistry::ids() const {
        std::vector<std::string> out;
        out.reserve(factories_.size());
        for (const auto& [id, _] : factories_) { out.push_back(id); }
        return out;
    }

    std::shared_ptr<const format::InputFormat> FormatRegistry::create(std::string_view id) const {
        const auto it = factories_.find(id);
        if (it == factories_.end()) { throw PlanningError("FormatRegistry: unknown format '" + std::string(id) + "'"); }

        std::shared_ptr<const format::InputFormat> format;
        try { format = it->second(); }
        catch (const std::exception&) { std::throw_with_nested(PlanningError("FormatRegistry: cannot instantiate format '" + std::string(id) + "'")); }

        if (!format) { throw PlanningError("FormatRegistry: factory for '" + std::string(id) + "' returned null"); }
        return format;
    }
} // namespace akkaraio
