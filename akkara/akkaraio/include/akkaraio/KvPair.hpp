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

// akkara/akkaraio/include/akkaraio/KvPair.hpp
#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace akkaraio {
    /**
     * KvPair - Owned copy of one record produced by a BoundedReader.
     *
     * Independent of any cursor buffer; safe to keep after the reader advances.
     */
    struct KvPair {
        std::vector<uint8_t> key;
        std::vector<uint8_t> value;

        [[nodiscard]] static KvPair copy_of(std::span<const uint8_t> k, std::span<const uint8_t> v) {
            return KvPair{std::vector(k.begin(), k.end()), std::vector(v.begin(), v.end())};
        }

        [[nodiscard]] std::string_view key_string() const noexcept {
            return {reinterpret_cast<const char*>(key.data()), key.size()};
        }

        [[nodiscard]] std::string_view value_string() const noexcept {
            return {reinterpret_cast<const char*>(value.data()), value.size()};
        }

        bool operator==(const KvPair&) const = default;
    };
} // namespace akkaraio
