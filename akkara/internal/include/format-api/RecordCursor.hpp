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

// internal/include/format-api/RecordCursor.hpp
#pragma once

#include "core/record/RecordView.hpp"
#include <optional>
#include <stdexcept>
#include <string>

namespace akkaraio::format {
    /**
     * ReadInterrupted - Raised by a cursor when the stop_token it was opened
     * with is signalled while it is about to block on I/O.
     *
     * The stop request itself is left untouched, so the interruption stays
     * observable by the caller after the exception unwinds.
     */
    class ReadInterrupted : public std::runtime_error {
    public:
        explicit ReadInterrupted(const std::string& msg) : std::runtime_error(msg) {}
    };

    /**
     * RecordCursor - Forward-only cursor over the key/value records of one split.
     *
     * Typical usage:
     * ```cpp
     * auto cursor = format->open_cursor(split, config, stop);
     *
     * while (cursor->has_next()) {
     *     auto record = cursor->next();
     *     // copy record before calling has_next() again
     * }
     * cursor->close();
     * ```
     *
     * Buffer reuse: the RecordView returned by next() points into storage the
     * cursor overwrites when it reads ahead. It is valid until the following
     * has_next(), next() or close(); callers that keep a record must copy it.
     *
     * Every method except progress() may block on I/O.
     *
     * Thread-safety: NOT thread-safe.
     */
    class RecordCursor {
    public:
        virtual ~RecordCursor() = default;

        /**
         * Checks whether another record is available, reading ahead if needed.
         *
         * @throws ReadInterrupted if the stop token is signalled
         * @throws std::runtime_error on I/O error or malformed data
         */
        [[nodiscard]] virtual bool has_next() = 0;

        /**
         * Returns the next record.
         *
         * @throws std::runtime_error if no record is available
         */
        [[nodiscard]] virtual core::RecordView next() = 0;

        /**
         * Fraction of this split consumed so far, in [0, 1], or nullopt if
         * the cursor cannot tell.
         */
        [[nodiscard]] virtual std::optional<double> progress() const noexcept = 0;

        /**
         * Releases the underlying file. Idempotent.
         */
        virtual void close() noexcept = 0;
    };
} // namespace akkaraio::format
