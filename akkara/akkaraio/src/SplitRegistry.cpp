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

// akkara/akkaraio/src/SplitRegistry.cpp
#include "akkaraio/SplitRegistry.hpp"
#include "akkaraio/Errors.hpp"
#include "format-file/FileSplit.hpp"

#include <exception>
#include <stdexcept>

namespace akkaraio {
    std::shared_ptr<SplitRegistry> SplitRegistry::with_builtins() {
        auto registry = std::make_shared<SplitRegistry>();
        registry->register_split(std::string(format::file::FileSplit::TYPE_TAG), [](core::BufferView payload) {
            return std::shared_ptr<const format::InputSplit>(format::file::FileSplit::decode(payload));
        });
        return registry;
    }

    void SplitRegistry::register_split(std::string tag, Decoder decoder) {
        if (tag.empty()) { throw std::invalid_argument("SplitRegistry: empty type tag"); }
        if (!decoder) { throw std::invalid_argument("SplitRegistry: empty decoder for " + tag); }
        if (decoders_.contains(tag)) { throw std::invalid_argument("SplitRegistry: type tag already registered: " + tag); }
        decoders_.emplace(std::move(tag), std::move(decoder));
    }

    bool SplitRegistry::contains(std::string_view tag) const noexcept { return decoders_.find(tag) != decoders_.end(); }

    std::vector<std::string> SplitRegistry::tags() const {
        std::vector<std::string> out;
        out.reserve(decoders_.size());
        for (const auto& [tag, _] : decoders_) { out.push_back(tag); }
        return out;
    }

    std::shared_ptr<const format::InputSplit> SplitRegistry::decode(std::string_view tag, std::span<const uint8_t> payload) const {
        const auto it = decoders_.find(tag);
        if (it == decoders_.end()) { throw SerializationError("SplitRegistry: unknown split type tag '" + std::string(tag) + "'"); }

        std::shared_ptr<const format::InputSplit> split;
        try { split = it->second(core::BufferView::of(payload)); }
        catch (const std::exception&) {
            std::throw_with_nested(SerializationError("SplitRegistry: cannot decode split of type '" + std::string(tag) + "'"));
        }

        if (!split) { throw SerializationError("SplitRegistry: decoder for '" + std::string(tag) + "' returned null"); }
        if (split->type_tag() != tag) {
            throw SerializationError("SplitRegistry: decoder for '" + std::string(tag) + "' produced '" + std::string(split->type_tag()) + "'");
        }
        return split;
    }
} // namespace akkaraio
