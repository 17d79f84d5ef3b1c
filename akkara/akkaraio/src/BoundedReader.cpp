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

// akkara/akkaraio/src/BoundedReader.cpp
#include "akkaraio/BoundedReader.hpp"
#include "akkaraio/Errors.hpp"

#include <algorithm>
#include <cmath>
#include <exception>

#include <glog/logging.h>

namespace akkaraio {
    BoundedReader::BoundedReader(BoundedSource source, SourceContext ctx) : source_{std::move(source)}, ctx_{std::move(ctx)} {}

    BoundedReader::~BoundedReader() { close(); }

    bool BoundedReader::start() {
        if (state_ != State::NotStarted) { throw IllegalStateError("BoundedReader::start: reader already started or closed"); }

        format_ = ctx_.formats().create(source_.format_id());

        if (const auto& handle = source_.split_handle()) { splits_ = {handle->split(ctx_.splits())}; }
        else {
            try { splits_ = format_->get_splits(source_.resource(), source_.config(), format::SplitSizeHint{}); }
            catch (const std::exception&) {
                std::throw_with_nested(PlanningError("BoundedReader::start: split discovery failed for " + source_.resource()));
            }
        }

        VLOG(1) << "BoundedReader: " << splits_.size() << " splits to read from " << source_.describe();

        state_ = State::Active;
        return advance_impl();
    }

    bool BoundedReader::advance() {
        switch (state_) {
            case State::NotStarted: throw IllegalStateError("BoundedReader::advance: start() not called");
            case State::Closed: throw IllegalStateError("BoundedReader::advance: reader is closed");
            case State::Exhausted: return false;
            case State::Active: break;
        }
        return advance_impl();
    }

    bool BoundedReader::advance_impl() {
        try {
            if (cursor_ && cursor_->has_next()) {
                const auto record = cursor_->next();
                current_ = KvPair::copy_of(record.key(), record.value());
                return true;
            }

            while (next_index_ < splits_.size()) {
                const auto& split = splits_[next_index_];

                close_cursor();
                current_index_ = next_index_++;
                VLOG(1) << "BoundedReader: opening split " << *current_index_ + 1 << "/" << splits_.size() << " " << split->describe();

                cursor_ = format_->open_cursor(*split, source_.config(), stop_.get_token());
                if (cursor_->has_next()) {
                    const auto record = cursor_->next();
                    current_ = KvPair::copy_of(record.key(), record.value());
                    return true;
                }
                close_cursor();
            }

            // No next split, or every remaining split was empty
            close_cursor();
            current_.reset();
            done_ = true;
            state_ = State::Exhausted;
            return false;
        }
        catch (const format::ReadInterrupted&) {
            close_cursor();
            current_.reset();
            std::throw_with_nested(ReadError("BoundedReader: read interrupted in " + source_.describe()));
        }
        catch (const std::exception&) {
            close_cursor();
            current_.reset();
            std::throw_with_nested(ReadError("BoundedReader: read failed in " + source_.describe()));
        }
    }

    const KvPair& BoundedReader::get_current() const {
        if (!current_) { throw NoCurrentElementError("BoundedReader::get_current: no current record"); }
        return *current_;
    }

    double BoundedReader::get_fraction_consumed() const noexcept {
        if (done_) return 1.0;
        if (state_ == State::NotStarted) return 0.0;
        if (splits_.empty()) return 1.0;
        if (!current_index_) return 0.0;

        const auto count = static_cast<double>(splits_.size());
        const double before = static_cast<double>(*current_index_) / count;
        if (!cursor_) return before;

        double progress = cursor_->progress().value_or(0.0);
        if (progress < 0.0 || progress > 1.0) {
            LOG_FIRST_N(WARNING, 1) << "BoundedReader: cursor reported progress " << progress << " outside [0, 1], clamping";
            progress = std::clamp(progress, 0.0, 1.0);
        }
        // 1.0 is reported only once advance() has returned false
        return std::min(before + progress / count, std::nextafter(1.0, 0.0));
    }

    std::optional<BoundedSource> BoundedReader::split_at_fraction(double fraction) const noexcept {
        VLOG(1) << "BoundedReader: declining split at fraction " << fraction;
        return std::nullopt;
    }

    void BoundedReader::close() noexcept {
        close_cursor();
        current_.reset();
        state_ = State::Closed;
    }

    void BoundedReader::close_cursor() noexcept {
        if (cursor_) {
            cursor_->close();
            cursor_.reset();
        }
    }
} // namespace akkaraio
