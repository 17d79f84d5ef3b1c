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

// akkara/akkaraio/include/akkaraio/Errors.hpp
#pragma once

#include "Export.hpp"
#include <stdexcept>
#include <string>

/**
 * Error taxonomy of the source layer.
 *
 * Every error derives from SourceException (itself a std::runtime_error).
 * Failures raised by the format layer are attached with
 * std::throw_with_nested; use std::rethrow_if_nested to reach the cause.
 */
namespace akkaraio {
    class AKKARAIO_API SourceException : public std::runtime_error {
    public:
        explicit SourceException(const std::string& msg) : std::runtime_error(msg) {}
    };

    /**
     * A required source field is missing, or options are malformed.
     */
    class AKKARAIO_API ConfigurationError : public SourceException {
    public:
        using SourceException::SourceException;
    };

    /**
     * Format instantiation or split discovery failed. Never retried.
     */
    class AKKARAIO_API PlanningError : public SourceException {
    public:
        using SourceException::SourceException;
    };

    /**
     * Size listing failed. Recovered inside estimated_size_bytes(), which
     * reports 0 instead.
     */
    class AKKARAIO_API EstimationError : public SourceException {
    public:
        using SourceException::SourceException;
    };

    /**
     * A per-split cursor failed or was interrupted mid-read.
     */
    class AKKARAIO_API ReadError : public SourceException {
    public:
        using SourceException::SourceException;
    };

    /**
     * No encoding is known for a key or value type tag.
     */
    class AKKARAIO_API UnsupportedTypeError : public SourceException {
    public:
        using SourceException::SourceException;
    };

    /**
     * get_current() called without a current record.
     */
    class AKKARAIO_API NoCurrentElementError : public SourceException {
    public:
        using SourceException::SourceException;
    };

    /**
     * Reader call made in a state that does not allow it.
     */
    class AKKARAIO_API IllegalStateError : public SourceException {
    public:
        using SourceException::SourceException;
    };

    /**
     * A serialized source or split payload could not be decoded.
     */
    class AKKARAIO_API SerializationError : public SourceException {
    public:
        using SourceException::SourceException;
    };
} // namespace akkaraio
