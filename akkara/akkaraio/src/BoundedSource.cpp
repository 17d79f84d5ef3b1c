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

// akkara/akkaraio/src/BoundedSource.cpp
#include "akkaraio/BoundedSource.hpp"
#include "akkaraio/BoundedReader.hpp"
#include "akkaraio/Errors.hpp"
#include "akkaraio/SplitPlanner.hpp"

#include <exception>

#include <glog/logging.h>

namespace akkaraio {
    namespace {
        /**
         * Flattens a nested exception chain into "outer: inner: ...".
         */
        std::string describe_chain(const std::exception& e) {
            std::string out = e.what();
            try { std::rethrow_if_nested(e); }
            catch (const std::exception& inner) { out += ": " + describe_chain(inner); }
            return out;
        }

        uint64_t list_total_bytes(const BoundedSource& source, const SourceContext& ctx) {
            try {
                const auto input_format = ctx.formats().create(source.format_id());
                uint64_t total = 0;
                for (const auto& st : input_format->list_status(source.resource(), source.config())) { total += st.size_bytes; }
                return total;
            }
            catch (const std::exception&) {
                std::throw_with_nested(EstimationError("cannot list " + source.resource()));
            }
        }
    } // anonymous namespace

    BoundedSource::BoundedSource(
        std::string resource,
        std::string format_id,
        std::string key_type,
        std::string value_type,
        std::optional<OpaqueSplitHandle> split,
        std::shared_ptr<const KvCoder> output_coder,
        format::FormatConfig config
    ) : resource_{std::move(resource)}
        , format_id_{std::move(format_id)}
        , key_type_{std::move(key_type)}
        , value_type_{std::move(value_type)}
        , split_{std::move(split)}
        , output_coder_{std::move(output_coder)}
        , config_{std::move(config)} {}

    BoundedSource BoundedSource::from(std::string resource, std::string format_id, std::string key_type, std::string value_type) {
        return BoundedSource{
            std::move(resource), std::move(format_id), std::move(key_type), std::move(value_type),
            std::nullopt, nullptr, {}
        };
    }

    BoundedSource BoundedSource::from(
        std::string resource,
        std::string format_id,
        std::string key_type,
        std::string value_type,
        std::shared_ptr<const KvCoder> output_coder,
        format::FormatConfig config
    ) {
        return BoundedSource{
            std::move(resource), std::move(format_id), std::move(key_type), std::move(value_type),
            std::nullopt, std::move(output_coder), std::move(config)
        };
    }

    BoundedSource BoundedSource::with_split(OpaqueSplitHandle handle) const {
        BoundedSource copy{*this};
        copy.split_ = std::move(handle);
        return copy;
    }

    BoundedSource BoundedSource::with_config(std::string key, std::string value) const {
        BoundedSource copy{*this};
        copy.config_.insert_or_assign(std::move(key), std::move(value));
        return copy;
    }

    void BoundedSource::validate() const {
        if (resource_.empty()) { throw ConfigurationError("BoundedSource: resource must be set"); }
        if (format_id_.empty()) { throw ConfigurationError("BoundedSource: format must be set"); }
        if (key_type_.empty()) { throw ConfigurationError("BoundedSource: key type must be set"); }
        if (value_type_.empty()) { throw ConfigurationError("BoundedSource: value type must be set"); }
    }

    std::vector<BoundedSource> BoundedSource::split_into_bundles(uint64_t desired_bundle_size_bytes, const SourceContext& ctx) const {
        if (split_) { return {*this}; }

        const SplitPlanner planner{ctx};
        auto handles = planner.plan(resource_, format_id_, config_, desired_bundle_size_bytes);

        std::vector<BoundedSource> bundles;
        bundles.reserve(handles.size());
        for (auto& handle : handles) { bundles.push_back(with_split(std::move(handle))); }
        return bundles;
    }

    uint64_t BoundedSource::estimated_size_bytes(const SourceContext& ctx) const noexcept {
        if (ctx.options().suppress_remote_estimation) { return 0; }

        try { return list_total_bytes(*this, ctx); }
        catch (const EstimationError& e) {
            LOG(ERROR) << "BoundedSource: size estimation failed, reporting 0: " << describe_chain(e);
            return 0;
        }
        catch (const std::exception& e) {
            LOG(ERROR) << "BoundedSource: size estimation failed, reporting 0: " << e.what();
            return 0;
        }
    }

    std::shared_ptr<const KvCoder> BoundedSource::default_output_coder() const {
        if (output_coder_) { return output_coder_; }
        return std::make_shared<const KvCoder>(coder_for_type(key_type_), coder_for_type(value_type_));
    }

    std::unique_ptr<BoundedReader> BoundedSource::create_reader(const SourceContext& ctx) const {
        validate();
        return std::unique_ptr<BoundedReader>(new BoundedReader(*this, ctx));
    }

    std::string BoundedSource::describe() const {
        std::string out = format_id_ + ":" + resource_ + " <" + key_type_ + "," + value_type_ + ">";
        if (split_) { out += " split=" + split_->type_tag() + "(" + std::to_string(split_->length()) + " bytes)"; }
        return out;
    }

    bool BoundedSource::operator==(const BoundedSource& other) const {
        if (resource_ != other.resource_ || format_id_ != other.format_id_) return false;
        if (key_type_ != other.key_type_ || value_type_ != other.value_type_) return false;
        if (config_ != other.config_ || split_ != other.split_) return false;

        if (static_cast<bool>(output_coder_) != static_cast<bool>(other.output_coder_)) return false;
        return !output_coder_ || *output_coder_ == *other.output_coder_;
    }
} // namespace akkaraio
