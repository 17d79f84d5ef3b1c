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

// akkara/akkaraio/include/akkaraio/BoundedSource.hpp
#pragma once

#include "Coder.hpp"
#include "Export.hpp"
#include "OpaqueSplitHandle.hpp"
#include "SourceContext.hpp"
#include "format-api/FormatConfig.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace akkaraio {
    class BoundedReader;

    /**
     * BoundedSource - Immutable description of what to read.
     *
     * A source names a resource (file, directory or glob), the format that
     * decodes it, the key and value type tags, optional format config
     * overrides and an optional output coder override. A source that carries
     * a split handle stands for exactly that one unit of work.
     *
     * Typical usage:
     * ```cpp
     * SourceContext ctx;
     * auto source = BoundedSource::from("/data/logs/part-*.txt", "text.line", "u64", "text");
     *
     * for (const auto& bundle : source.split_into_bundles(64 << 20, ctx)) {
     *     auto reader = bundle.create_reader(ctx);
     *     for (bool more = reader->start(); more; more = reader->advance()) {
     *         consume(reader->get_current());
     *     }
     *     reader->close();
     * }
     * ```
     *
     * A reader holds its own copy of the source, so readers may outlive the
     * bundle list they were created from.
     *
     * Thread-safety: Immutable, fully thread-safe.
     */
    class AKKARAIO_API BoundedSource {
    public:
        [[nodiscard]] static BoundedSource from(
            std::string resource,
            std::string format_id,
            std::string key_type,
            std::string value_type
        );

        /**
         * Source with an output coder override and format config overrides.
         * A null coder means "derive from the type tags".
         */
        [[nodiscard]] static BoundedSource from(
            std::string resource,
            std::string format_id,
            std::string key_type,
            std::string value_type,
            std::shared_ptr<const KvCoder> output_coder,
            format::FormatConfig config
        );

        // ==================== Accessors ====================

        [[nodiscard]] const std::string& resource() const noexcept { return resource_; }
        [[nodiscard]] const std::string& format_id() const noexcept { return format_id_; }
        [[nodiscard]] const std::string& key_type() const noexcept { return key_type_; }
        [[nodiscard]] const std::string& value_type() const noexcept { return value_type_; }
        [[nodiscard]] const format::FormatConfig& config() const noexcept { return config_; }
        [[nodiscard]] const std::optional<OpaqueSplitHandle>& split_handle() const noexcept { return split_; }
        [[nodiscard]] const std::shared_ptr<const KvCoder>& output_coder_override() const noexcept { return output_coder_; }

        // ==================== Derivation ====================

        /**
         * Copy of this source pinned to one split.
         */
        [[nodiscard]] BoundedSource with_split(OpaqueSplitHandle handle) const;

        [[nodiscard]] BoundedSource with_config(std::string key, std::string value) const;

        // ==================== Operations ====================

        /**
         * @throws ConfigurationError if resource, format, key type or value type is empty
         */
        void validate() const;

        /**
         * Fans this source out into one source per split.
         *
         * A source already pinned to a split returns a one-element list
         * holding itself. Otherwise the SplitPlanner partitions the resource.
         *
         * @throws PlanningError if split discovery fails
         */
        [[nodiscard]] std::vector<BoundedSource> split_into_bundles(uint64_t desired_bundle_size_bytes, const SourceContext& ctx) const;

        /**
         * Total size of the files the resource names, or 0 if unknown.
         *
         * Returns 0 without touching storage when
         * SourceOptions::suppress_remote_estimation is set. Listing failures
         * are logged and reported as 0; never throws. A result of 0 means
         * "unknown", not "empty".
         */
        [[nodiscard]] uint64_t estimated_size_bytes(const SourceContext& ctx) const noexcept;

        /**
         * The override if present, otherwise KvCoder(coder(key_type), coder(value_type)).
         *
         * @throws UnsupportedTypeError if a type tag has no default coder
         */
        [[nodiscard]] std::shared_ptr<const KvCoder> default_output_coder() const;

        /**
         * No ordering guarantee within or across splits.
         */
        [[nodiscard]] bool produces_sorted_keys() const noexcept { return false; }

        /**
         * @throws ConfigurationError if validate() fails
         */
        [[nodiscard]] std::unique_ptr<BoundedReader> create_reader(const SourceContext& ctx) const;

        [[nodiscard]] std::string describe() const;

        /**
         * Field-wise equality (split handles by tag and payload, coders by id).
         */
        [[nodiscard]] bool operator==(const BoundedSource& other) const;

    private:
        BoundedSource(
            std::string resource,
            std::string format_id,
            std::string key_type,
            std::string value_type,
            std::optional<OpaqueSplitHandle> split,
            std::shared_ptr<const KvCoder> output_coder,
            format::FormatConfig config
        );

        friend class SourceCodec;

        std::string resource_;
        std::string format_id_;
        std::string key_type_;
        std::string value_type_;
        std::optional<OpaqueSplitHandle> split_;
        std::shared_ptr<const KvCoder> output_coder_;
        format::FormatConfig config_;
    };
} // namespace akkaraio
