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

// akkara/akkaraio/src/Coder.cpp
#include "akkaraio/Coder.hpp"
#include "akkaraio/Errors.hpp"
#include "akkaraio/TypeTags.hpp"
#include "core/buffer/BufferView.hpp"

#include <stdexcept>

namespace akkaraio {
    // ==================== RecordCoder ====================

    void RecordCoder::encode(std::span<const uint8_t> bytes, std::vector<uint8_t>& out) const {
        const size_t at = out.size();
        out.resize(at + sizeof(uint32_t) + bytes.size());

        core::BufferView view{reinterpret_cast<std::byte*>(out.data()), out.size()};
        view.write_u32_le(at, static_cast<uint32_t>(bytes.size()));
        view.copy_from(at + sizeof(uint32_t), bytes);
    }

    std::vector<uint8_t> RecordCoder::decode(std::span<const uint8_t> in, size_t& offset) const {
        const auto view = core::BufferView::of(in);
        try {
            const uint32_t len = view.read_u32_le(offset);
            const auto body = view.slice(offset + sizeof(uint32_t), len).bytes();
            offset += sizeof(uint32_t) + len;
            return {body.begin(), body.end()};
        }
        catch (const std::out_of_range& e) { throw SerializationError(std::string("RecordCoder: truncated input: ") + e.what()); }
    }

    // ==================== KvCoder ====================

    KvCoder::KvCoder(std::shared_ptr<const Coder> key_coder, std::shared_ptr<const Coder> value_coder)
        : key_{std::move(key_coder)}, value_{std::move(value_coder)} {
        if (!key_ || !value_) { throw std::invalid_argument("KvCoder: component coders must not be null"); }
    }

    void KvCoder::encode(const KvPair& pair, std::vector<uint8_t>& out) const {
        key_->encode(pair.key, out);
        value_->encode(pair.value, out);
    }

    std::vector<uint8_t> KvCoder::encode(const KvPair& pair) const {
        std::vector<uint8_t> out;
        encode(pair, out);
        return out;
    }

    KvPair KvCoder::decode(std::span<const uint8_t> in, size_t& offset) const {
        KvPair pair;
        pair.key = key_->decode(in, offset);
        pair.value = value_->decode(in, offset);
        return pair;
    }

    std::string KvCoder::describe() const {
        return "kv(" + std::string(key_->id()) + "," + std::string(value_->id()) + ")";
    }

    // ==================== Lookup ====================

    std::shared_ptr<const Coder> coder_for_id(std::string_view id) {
        static const auto record = std::make_shared<const RecordCoder>();
        static const auto none = std::make_shared<const VoidCoder>();

        if (id == RecordCoder::ID) return record;
        if (id == VoidCoder::ID) return none;
        throw UnsupportedTypeError("unknown coder id '" + std::string(id) + "'");
    }

    std::shared_ptr<const Coder> coder_for_type(std::string_view type_tag) {
        if (type_tag == type_tags::BYTES || type_tag == type_tags::TEXT || type_tag == type_tags::U64) { return coder_for_id(RecordCoder::ID); }
        if (type_tag == type_tags::VOID) { return coder_for_id(VoidCoder::ID); }
        throw UnsupportedTypeError("no default coder for type '" + std::string(type_tag) + "'");
    }
} // namespace akkaraio
