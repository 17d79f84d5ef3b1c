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

// akkara/akkaraio/src/OpaqueSplitHandle.cpp
#include "akkaraio/OpaqueSplitHandle.hpp"
#include "akkaraio/SplitRegistry.hpp"

#include <algorithm>
#include <mutex>
#include <stdexcept>

namespace akkaraio {
    struct OpaqueSplitHandle::State {
        std::string type_tag;
        std::vector<uint8_t> payload;
        uint64_t length{0};

        mutable std::mutex mutex;
        mutable std::shared_ptr<const format::InputSplit> split; // guarded by mutex
    };

    OpaqueSplitHandle OpaqueSplitHandle::wrap(std::shared_ptr<const format::InputSplit> split) {
        if (!split) { throw std::invalid_argument("OpaqueSplitHandle: split must not be null"); }
        if (!split->serializable()) {
            throw std::invalid_argument("OpaqueSplitHandle: split is not serializable: " + split->describe());
        }

        auto state = std::make_shared<State>();
        state->type_tag = std::string(split->type_tag());
        split->write_to(state->payload);
        state->length = split->length();
        state->split = std::move(split);
        return OpaqueSplitHandle{std::move(state)};
    }

    OpaqueSplitHandle OpaqueSplitHandle::from_serialized(std::string type_tag, std::vector<uint8_t> payload, uint64_t length) {
        auto state = std::make_shared<State>();
        state->type_tag = std::move(type_tag);
        state->payload = std::move(payload);
        state->length = length;
        return OpaqueSplitHandle{std::move(state)};
    }

    const std::string& OpaqueSplitHandle::type_tag() const noexcept { return state_->type_tag; }

    std::span<const uint8_t> OpaqueSplitHandle::payload() const noexcept { return state_->payload; }

    uint64_t OpaqueSplitHandle::length() const noexcept { return state_->length; }

    std::shared_ptr<const format::InputSplit> OpaqueSplitHandle::split(const SplitRegistry& registry) const {
        std::lock_guard lock{state_->mutex};
        if (!state_->split) { state_->split = registry.decode(state_->type_tag, state_->payload); }
        return state_->split;
    }

    bool OpaqueSplitHandle::is_decoded() const noexcept {
        std::lock_guard lock{state_->mutex};
        return state_->split != nullptr;
    }

    bool OpaqueSplitHandle::operator==(const OpaqueSplitHandle& other) const noexcept {
        if (state_ == other.state_) return true;
        return state_->type_tag == other.state_->type_tag && std::ranges::equal(state_->payload, other.state_->payload);
    }
} // namespace akkaraio
