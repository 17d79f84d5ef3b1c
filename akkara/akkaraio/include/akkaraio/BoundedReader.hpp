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

// akkara/akkaraio/include/akkaraio/BoundedReader.hpp
#pragma once

#include "BoundedSource.hpp"
#include "Export.hpp"
#include "KvPair.hpp"
#include "SourceContext.hpp"
#include "format-api/InputFormat.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <stop_token>
#include <vector>

namespace akkaraio {
    /**
     * BoundedReader - Sequential cursor over every record of one BoundedSource.
     *
     * State machine:
     * ```
     * NotStarted --start()--> Active --advance()==false--> Exhausted
     *                           |                            |
     *                           +----------close()-----------+--> Closed
     * ```
     * close() is legal from every state and idempotent. advance() on an
     * Exhausted reader keeps returning false.
     *
     * Splits are visited one at a time; the cursor of the previous split is
     * closed before the next one is opened. Records are copied out of the
     * cursor before they are exposed, so a KvPair returned by get_current()
     * stays valid across advance().
     *
     * Interruption: request_stop() (callable from any thread) makes the next
     * blocking cursor step fail; advance() then raises ReadError. The stop
     * request stays set afterwards.
     *
     * Thread-safety: NOT thread-safe, except request_stop() and
     * stop_requested(). Drive one reader from one thread.
     */
    class AKKARAIO_API BoundedReader {
    public:
        enum class State : uint8_t {
            NotStarted,
            Active,
            Exhausted,
            Closed
        };

        ~BoundedReader();

        BoundedReader(const BoundedReader&) = delete;
        BoundedReader& operator=(const BoundedReader&) = delete;

        /**
         * Resolves the splits to visit and positions on the first record.
         *
         * @return true if a record is available
         * @throws IllegalStateError if called twice or after close()
         * @throws PlanningError if the format cannot be instantiated or discovery fails
         * @throws SerializationError if the pinned split cannot be decoded
         * @throws ReadError if a cursor fails
         */
        [[nodiscard]] bool start();

        /**
         * Moves to the next record, crossing into later splits as needed.
         *
         * @return true if a record is available
         * @throws IllegalStateError before start() or after close()
         * @throws ReadError if a cursor fails or the read was interrupted
         */
        [[nodiscard]] bool advance();

        /**
         * @throws NoCurrentElementError if there is no current record
         */
        [[nodiscard]] const KvPair& get_current() const;

        /**
         * Fraction of the source consumed, in [0, 1].
         *
         * 0 before start(); 1 once exhausted or when there is nothing to
         * read; otherwise index/count interpolated by the open cursor's own
         * progress (0 when the cursor cannot tell).
         */
        [[nodiscard]] double get_fraction_consumed() const noexcept;

        /**
         * 1 until exhausted, then 0. Dynamic rebalancing is not supported.
         */
        [[nodiscard]] uint64_t get_split_points_remaining() const noexcept { return done_ ? 0 : 1; }

        /**
         * Always declines (no dynamic work rebalancing).
         */
        [[nodiscard]] std::optional<BoundedSource> split_at_fraction(double fraction) const noexcept;

        /**
         * Releases the open cursor and drops the current record. Idempotent.
         */
        void close() noexcept;

        [[nodiscard]] const BoundedSource& get_current_source() const noexcept { return source_; }

        [[nodiscard]] State state() const noexcept { return state_; }

        void request_stop() noexcept { stop_.request_stop(); }
        [[nodiscard]] bool stop_requested() const noexcept { return stop_.stop_requested(); }

    private:
        friend class BoundedSource;

        BoundedReader(BoundedSource source, SourceContext ctx);

        bool advance_impl();
        void close_cursor() noexcept;

        BoundedSource source_;
        SourceContext ctx_;
        std::stop_source stop_;

        std::shared_ptr<const format::InputFormat> format_;
        std::vector<std::shared_ptr<const format::InputSplit>> splits_;
        size_t next_index_{0};
        std::optional<size_t> current_index_;
        std::unique_ptr<format::RecordCursor> cursor_;

        std::optional<KvPair> current_;
        State state_{State::NotStarted};
        bool done_{false};
    };
} // namespace akkaraio
