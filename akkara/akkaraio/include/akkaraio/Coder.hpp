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

// akkara/akkaraio/include/akkaraio/Coder.hpp
#pragma once

#include "Export.hpp"
#include "KvPair.hpp"
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace akkaraio {
    /**
     * Coder - Output encoding for one side (key or value) of a record.
     *
     * Thread-safety: Implementations are stateless and fully thread-safe.
     */
    class AKKARAIO_API Coder {
    public:
        virtual ~Coder() = default;

        /**
         * Stable identifier, used when a coder override is serialized.
         */
        [[nodiscard]] virtual std::string_view id() const noexcept = 0;

        virtual void encode(std::span<const uint8_t> bytes, std::vector<uint8_t>& out) const = 0;

        /**
         * Decodes one element starting at offset and advances offset past it.
         *
         * @throws SerializationError if input is truncated
         */
        [[nodiscard]] virtual std::vector<uint8_t> decode(std::span<const uint8_t> in, size_t& offset) const = 0;
    };

    /**
     * RecordCoder - Generic serializable-record encoding.
     *
     * Layout: [len:u32 LE][bytes]
     */
    class AKKARAIO_API RecordCoder final : public Coder {
    public:
        static constexpr std::string_view ID = "record";

        [[nodiscard]] std::string_view id() const noexcept override { return ID; }
        void encode(std::span<const uint8_t> bytes, std::vector<uint8_t>& out) const override;
        [[nodiscard]] std::vector<uint8_t> decode(std::span<const uint8_t> in, size_t& offset) const override;
    };

    /**
     * VoidCoder - No-value encoding. Writes nothing; decodes to empty.
     */
    class AKKARAIO_API VoidCoder final : public Coder {
    public:
        static constexpr std::string_view ID = "void";

        [[nodiscard]] std::string_view id() const noexcept override { return ID; }
        void encode(std::span<const uint8_t>, std::vector<uint8_t>&) const override {}
        [[nodiscard]] std::vector<uint8_t> decode(std::span<const uint8_t>, size_t&) const override { return {}; }
    };

    /**
     * KvCoder - Key coder + value coder, encoding a KvPair as key then value.
     */
    class AKKARAIO_API KvCoder {
    public:
        KvCoder(std::shared_ptr<const Coder> key_coder, std::shared_ptr<const Coder> value_coder);

        [[nodiscard]] const Coder& key_coder() const noexcept { return *key_; }
        [[nodiscard]] const Coder& value_coder() const noexcept { return *value_; }

        void encode(const KvPair& pair, std::vector<uint8_t>& out) const;

        [[nodiscard]] std::vector<uint8_t> encode(const KvPair& pair) const;

        /**
         * @throws SerializationError if input is truncated
         */
        [[nodiscard]] KvPair decode(std::span<const uint8_t> in, size_t& offset) const;

        /**
         * "kv(<key id>,<value id>)"
         */
        [[nodiscard]] std::string describe() const;

        bool operator==(const KvCoder& other) const noexcept {
            return key_->id() == other.key_->id() && value_->id() == other.value_->id();
        }

    private:
        std::shared_ptr<const Coder> key_;
        std::shared_ptr<const Coder> value_;
    };

    /**
     * Shared built-in coder for a coder id ("record", "void").
     *
     * @throws UnsupportedTypeError for an unknown id
     */
    [[nodiscard]] AKKARAIO_API std::shared_ptr<const Coder> coder_for_id(std::string_view id);

    /**
     * Default coder for a key/value type tag (see TypeTags.hpp).
     *
     * @throws UnsupportedTypeError for any other tag
     */
    [[nodiscard]] AKKARAIO_API std::shared_ptr<const Coder> coder_for_type(std::string_view type_tag);
} // namespace akkaraio
