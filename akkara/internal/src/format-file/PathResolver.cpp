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

// internal/src/format-file/PathResolver.cpp
#include "format-file/PathResolver.hpp"

#include <algorithm>
#include <filesystem>
#include <stdexcept>
#include <system_error>

#include <glob.h>

namespace fs = std::filesystem;

namespace akkaraio::format::file {
    namespace {
        constexpr std::string_view FILE_SCHEME = "file://";

        void add_regular(const fs::path& p, std::vector<FileStatus>& out) {
            std::error_code ec;
            const auto size = fs::file_size(p, ec);
            if (ec) { throw std::runtime_error("PathResolver: cannot stat " + p.string() + ": " + ec.message()); }
            out.push_back(FileStatus{.path = p.string(), .size_bytes = static_cast<uint64_t>(size)});
        }

        void expand_directory(const fs::path& dir, std::vector<FileStatus>& out) {
            std::error_code ec;
            fs::directory_iterator it{dir, ec};
            if (ec) { throw std::runtime_error("PathResolver: cannot list " + dir.string() + ": " + ec.message()); }

            for (const auto& entry : it) {
                if (is_hidden(entry.path().filename().string())) continue;
                if (entry.is_regular_file(ec)) { add_regular(entry.path(), out); }
            }
        }

        void expand_match(const fs::path& p, std::vector<FileStatus>& out) {
            std::error_code ec;
            const auto st = fs::status(p, ec);
            if (ec) { throw std::runtime_error("PathResolver: cannot stat " + p.string() + ": " + ec.message()); }

            if (fs::is_directory(st)) { expand_directory(p, out); }
            else if (fs::is_regular_file(st)) { add_regular(p, out); }
        }

        /**
         * RAII owner of a glob_t.
         */
        class GlobResult {
        public:
            GlobResult() noexcept = default;
            ~GlobResult() noexcept { ::globfree(&g_); }

            GlobResult(const GlobResult&) = delete;
            GlobResult& operator=(const GlobResult&) = delete;

            [[nodiscard]] glob_t* get() noexcept { return &g_; }

        private:
            glob_t g_{};
        };
    } // anonymous namespace

    std::string strip_scheme(std::string_view resource) {
        if (resource.starts_with(FILE_SCHEME)) { return std::string(resource.substr(FILE_SCHEME.size())); }

        if (const auto pos = resource.find("://"); pos != std::string_view::npos) {
            throw std::invalid_argument("PathResolver: unsupported scheme in " + std::string(resource));
        }
        return std::string(resource);
    }

    bool is_glob(std::string_view path) noexcept { return path.find_first_of("*?[") != std::string_view::npos; }

    bool is_hidden(std::string_view file_name) noexcept {
        return !file_name.empty() && (file_name.front() == '.' || file_name.front() == '_');
    }

    std::vector<FileStatus> resolve(std::string_view resource) {
        const auto path = strip_scheme(resource);
        if (path.empty()) { throw std::invalid_argument("PathResolver: empty resource"); }

        std::vector<FileStatus> out;

        if (is_glob(path)) {
            GlobResult g;
            const int rc = ::glob(path.c_str(), 0, nullptr, g.get());
            if (rc == GLOB_NOMATCH) { return out; }
            if (rc != 0) { throw std::runtime_error("PathResolver: glob failed for " + path + " (rc=" + std::to_string(rc) + ")"); }

            for (size_t i = 0; i < g.get()->gl_pathc; ++i) {
                const fs::path match{g.get()->gl_pathv[i]};
                if (is_hidden(match.filename().string())) continue;
                expand_match(match, out);
            }
        }
        else {
            const fs::path p{path};
            std::error_code ec;
            if (!fs::exists(p, ec)) { throw std::runtime_error("PathResolver: input path does not exist: " + path); }
            expand_match(p, out);
        }

        std::ranges::sort(out, {}, &FileStatus::path);
        const auto dup = std::ranges::unique(out, {}, &FileStatus::path);
        out.erase(dup.begin(), dup.end());
        return out;
    }
} // namespace akkaraio::format::file
