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

// akkara/akkaraio/src/SourceCodec.cpp
#include "akkaraio/SourceCodec.hpp"
#include "akkaraio/Errors.hpp"
#include "core/buffer/BufferView.hpp"

#include <exception>

#include <nlohmann/json.hpp>

namespace akkaraio {
    using json = nlohmann::json;

    namespace {
        constexpr char HEX_DIGITS[] = "0123456789abcdef";

        std::string to_hex(std::span<const uint8_t> bytes) {
            std::string out;
            out.reserve(bytes.size() * 2);
            for (const uint8_t b : bytes) {
                out.push_back(HEX_DIGITS[b >> 4]);
                out.push_back(HEX_DIGITS[b & 0x0F]);
            }
            return out;
        }

        uint8_t hex_nibble(char c) {
            if (c >= '0' && c <= '9') return static_cast<uint8_t>(c - '0');
            if (c >= 'a' && c <= 'f') return static_cast<uint8_t>(c - 'a' + 10);
            if (c >= 'A' && c <= 'F') return static_cast<uint8_t>(c - 'A' + 10);
            throw SerializationError(std::string("SourceCodec: invalid hex digit '") + c + "'");
        }

        std::vector<uint8_t> from_hex(const std::string& hex) {
            if (hex.size() % 2 != 0) { throw SerializationError("SourceCodec: odd-length hex payload"); }

            std::vector<uint8_t> out;
            out.reserve(hex.size() / 2);
            for (size_t i = 0; i < hex.size(); i += 2) { out.push_back(static_cast<uint8_t>(hex_nibble(hex[i]) << 4 | hex_nibble(hex[i + 1]))); }
            return out;
        }

        /**
         * Encode record: [len:u32][json][crc32c:u32]
         */
        std::vector<uint8_t> encode_frame(const std::string& json_str) {
            const auto len = static_cast<uint32_t>(json_str.size());
            std::vector<uint8_t> buffer(sizeof(uint32_t) + len + sizeof(uint32_t));

            core::BufferView view{reinterpret_cast<std::byte*>(buffer.data()), buffer.size()};
            view.write_u32_le(0, len);
            view.copy_from(sizeof(uint32_t), {reinterpret_cast<const uint8_t*>(json_str.data()), len});
            view.write_u32_le(sizeof(uint32_t) + len, view.crc32c(sizeof(uint32_t), len));
            return buffer;
        }

        std::string decode_frame(std::span<const uint8_t> bytes) {
            const auto view = core::BufferView::of(bytes);
            if (view.size() < 2 * sizeof(uint32_t)) { throw SerializationError("SourceCodec: frame too short"); }

            const uint32_t len = view.read_u32_le(0);
            if (static_cast<uint64_t>(len) + 2 * sizeof(uint32_t) != view.size()) {
                throw SerializationError("SourceCodec: frame length mismatch (len=" + std::to_string(len) + ", size=" + std::to_string(view.size()) + ")");
            }

            const uint32_t stored_crc = view.read_u32_le(sizeof(uint32_t) + len);
            if (stored_crc != view.crc32c(sizeof(uint32_t), len)) { throw SerializationError("SourceCodec: CRC mismatch"); }

            return std::string(view.as_string_view(sizeof(uint32_t), len));
        }
    } // anonymous namespace

    std::vector<uint8_t> SourceCodec::serialize(const BoundedSource& source) {
        json j = {
            {"v", FORMAT_VERSION},
            {"resource", source.resource()},
            {"format", source.format_id()},
            {"key_type", source.key_type()},
            {"value_type", source.value_type()},
            {"config", json::object()}
        };

        for (const auto& [key, value] : source.config()) { j["config"][key] = value; }

        if (const auto& coder = source.output_coder_override()) {
            j["coder"] = {
                {"key", std::string(coder->key_coder().id())},
                {"value", std::string(coder->value_coder().id())}
            };
        }

        if (const auto& split = source.split_handle()) {
            j["split"] = {
                {"tag", split->type_tag()},
                {"length", split->length()},
                {"payload_hex", to_hex(split->payload())}
            };
        }

        return encode_frame(j.dump());
    }

    BoundedSource SourceCodec::deserialize(std::span<const uint8_t> bytes, const SourceContext& ctx) {
        const auto body = decode_frame(bytes);

        json j;
        try { j = json::parse(body); }
        catch (const json::parse_error&) { std::throw_with_nested(SerializationError("SourceCodec: malformed JSON body")); }

        try {
            if (const int v = j.at("v").get<int>(); v != FORMAT_VERSION) {
                throw SerializationError("SourceCodec: unsupported version " + std::to_string(v));
            }

            format::FormatConfig config;
            for (const auto& [key, value] : j.at("config").items()) { config.emplace(key, value.get<std::string>()); }

            std::shared_ptr<const KvCoder> coder;
            if (j.contains("coder")) {
                const auto& c = j.at("coder");
                try {
                    coder = std::make_shared<const KvCoder>(
                        coder_for_id(c.at("key").get<std::string>()),
                        coder_for_id(c.at("value").get<std::string>())
                    );
                }
                catch (const UnsupportedTypeError&) { std::throw_with_nested(SerializationError("SourceCodec: unknown coder id")); }
            }

            std::optional<OpaqueSplitHandle> split;
            if (j.contains("split")) {
                const auto& s = j.at("split");
                auto tag = s.at("tag").get<std::string>();
                if (!ctx.splits().contains(tag)) { throw SerializationError("SourceCodec: unknown split type tag '" + tag + "'"); }

                split = OpaqueSplitHandle::from_serialized(
                    std::move(tag),
                    from_hex(s.at("payload_hex").get<std::string>()),
                    s.at("length").get<uint64_t>()
                );
            }

            return BoundedSource{
                j.at("resource").get<std::string>(),
                j.at("format").get<std::string>(),
                j.at("key_type").get<std::string>(),
                j.at("value_type").get<std::string>(),
                std::move(split),
                std::move(coder),
                std::move(config)
            };
        }
        catch (const json::exception&) { std::throw_with_nested(SerializationError("SourceCodec: missing or mistyped field")); }
    }
} // namespace akkaraio
