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

// akkara/akkaraio/include/akkaraio/SourceCodec.hpp
#pragma once

#include "BoundedSource.hpp"
#include "Export.hpp"
#include "SourceContext.hpp"
#include <cstdint>
#include <span>
#include <vector>

namespace akkaraio {
    /**
     * SourceCodec - Ships a BoundedSource across a process boundary.
     *
     * Frame: [len:u32 LE][json (len bytes)][crc32c(json):u32 LE]
     *
     * JSON body:
     * ```json
     * {
     *   "v": 1,
     *   "resource": "/data/part-00000.akk",
     *   "format": "akk.block",
     *   "key_type": "bytes",
     *   "value_type": "bytes",
     *   "config": {"akk.skip.tombstones": "false"},
     *   "coder": {"key": "record", "value": "void"},
     *   "split": {"tag": "akk.file-split", "length": 65536, "payload_hex": "..."}
     * }
     * ```
     * "coder" and "split" are present only when set.
     *
     * The split payload is kept opaque on deserialize; it is decoded on first
     * access through the SplitRegistry.
     */
    class AKKARAIO_API SourceCodec {
    public:
        static constexpr int FORMAT_VERSION = 1;

        [[nodiscard]] static std::vector<uint8_t> serialize(const BoundedSource& source);

        /**
         * @throws SerializationError on a truncated or corrupt frame, malformed
         *         JSON, an unknown coder id, an unknown split tag, or an
         *         unsupported version
         */
        [[nodiscard]] static BoundedSource deserialize(std::span<const uint8_t> bytes, const SourceContext& ctx);
    };
} // namespace akkaraio
