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

// akkara/akkaraio/include/akkaraio/Export.hpp
#pragma once

/**
 * Symbol visibility macros for shared library builds.
 *
 * - AKKARAIO_API: Public API classes and functions
 * - AKKARAIO_LOCAL: Internal symbols (hidden visibility)
 *
 * Static builds (the default) leave both empty.
 */

#if defined(_WIN32) || defined(_WIN64)
    #if defined(AKKARAIO_BUILD_SHARED)
        #define AKKARAIO_API __declspec(dllexport)
    #elif defined(AKKARAIO_USE_SHARED)
        #define AKKARAIO_API __declspec(dllimport)
    #else
        #define AKKARAIO_API
    #endif
    #define AKKARAIO_LOCAL
#elif defined(__GNUC__) || defined(__clang__)
    #ifdef AKKARAIO_BUILD_SHARED
        #define AKKARAIO_API __attribute__((visibility("default")))
        #define AKKARAIO_LOCAL __attribute__((visibility("hidden")))
    #else
        #define AKKARAIO_API
        #define AKKARAIO_LOCAL
    #endif
#else
    #define AKKARAIO_API
    #define AKKARAIO_LOCAL
#endif
