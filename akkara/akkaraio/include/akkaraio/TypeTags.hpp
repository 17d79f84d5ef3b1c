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

// akkara/akkaraio/include/akkaraio/TypeTags.hpp
#pragma once

#include <string_view>

/**
 * Key/value type tags understood by the default coders.
 */
namespace akkaraio::type_tags {
    inline constexpr std::string_view BYTES = "bytes"; ///< Opaque byte string
    inline constexpr std::string_view TEXT = "text"; ///< UTF-8 text
    inline constexpr std::string_view U64 = "u64"; ///< 8-byte LE unsigned integer (line offsets)
    inline constexpr std::string_view VOID = "void"; ///< No value
} // namespace akkaraio::type_tags
