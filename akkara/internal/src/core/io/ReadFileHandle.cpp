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

// internal/src/core/io/ReadFileHandle.cpp
#include "core/io/ReadFileHandle.hpp"

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace akkaraio::core {
    ReadFileHandle::ReadFileHandle(ReadFileHandle&& o) noexcept : fd_{o.fd_}, file_size_{o.file_size_} {
        o.fd_ = -1;
        o.file_size_ = 0;
    }

    ReadFileHandle& ReadFileHandle::operator=(ReadFileHandle&& o) noexcept {
        if (this != &o) {
            close();
            fd_ = o.fd_;
            file_size_ = o.file_size_;
            o.fd_ = -1;
            o.file_size_ = 0;
        }
        return *this;
    }

    ReadFileHandle ReadFileHandle::open(const std::filesystem::path& path) {
        ReadFileHandle fh;
        fh.fd_ = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
        if (fh.fd_ < 0) {
            throw std::runtime_error("ReadFileHandle: failed to open " + path.string() + ": " + std::strerror(errno));
        }

        struct stat st{};
        if (::fstat(fh.fd_, &st) != 0) {
            throw std::runtime_error("ReadFileHandle: failed to stat " + path.string() + ": " + std::strerror(errno));
        }
        fh.file_size_ = static_cast<uint64_t>(st.st_size);

#if defined(POSIX_FADV_SEQUENTIAL)
        (void)::posix_fadvise(fh.fd_, 0, 0, POSIX_FADV_SEQUENTIAL);
#endif
        return fh;
    }

    size_t ReadFileHandle::read_at(uint64_t offset, void* buf, size_t size) const {
        if (fd_ < 0) { throw std::runtime_error("ReadFileHandle: read on closed handle"); }
        if (size == 0) return 0;

        auto* ptr = static_cast<uint8_t*>(buf);
        size_t total = 0;
        while (total < size) {
            const ssize_t n = ::pread(fd_, ptr + total, size - total, static_cast<off_t>(offset + total));
            if (n == 0) break; // EOF
            if (n < 0) {
                if (errno == EINTR) continue;
                throw std::runtime_error(std::string("ReadFileHandle: pread failed: ") + std::strerror(errno));
            }
            total += static_cast<size_t>(n);
        }
        return total;
    }

    void ReadFileHandle::close() noexcept {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }
} // namespace akkaraio::core
