/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * The Lucenia project is free software: you can redistribute it
 * and/or modify it under the terms of the GNU Affero General
 * Public License as published by the Free Software Foundation,
 * either version 3 of the License, or (at your option) any later
 * version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public
 * License along with this program. If not, see:
 * https://www.gnu.org/licenses/agpl-3.0.html
 */

#include "platform_fs.h"
#include <cerrno>
#include <unistd.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <filesystem>
#include <cstdio>

namespace duodb {
    namespace persist {

        FSResult PlatformFS::fsync_file(const std::string& path) {
            int fd = ::open(path.c_str(), O_RDWR);
            if (fd < 0) {
                return {false, errno};
            }
            int rc = ::fsync(fd);
            int saved_errno = errno;
            ::close(fd);
            return {rc == 0, rc == 0 ? 0 : saved_errno};
        }

        FSResult PlatformFS::fsync_directory(const std::string& dir_path) {
            // Open directory for reading
            int fd = ::open(dir_path.c_str(), O_RDONLY);
            if (fd < 0) {
                return {false, errno};
            }

            // Fsync the directory to ensure the rename is persisted
            int rc = ::fsync(fd);
            int saved_errno = errno;
            ::close(fd);

            return {rc == 0, rc == 0 ? 0 : saved_errno};
        }

        FSResult PlatformFS::atomic_replace(const std::string& src, const std::string& dst) {
            int rc = ::rename(src.c_str(), dst.c_str());
            if (rc != 0) {
                return {false, errno};
            }

            std::filesystem::path dst_path(dst);
            std::string parent_dir = dst_path.parent_path().string();
            if (parent_dir.empty()) {
                parent_dir = ".";
            }

            return fsync_directory(parent_dir);
        }

        std::pair<FSResult, size_t> PlatformFS::file_size(const std::string& path) {
            struct stat st{};
            int rc = ::stat(path.c_str(), &st);
            return { { rc == 0, rc == 0 ? 0 : errno }, rc == 0 ? (size_t)st.st_size : 0 };
        }

        FSResult PlatformFS::ensure_directory(const std::string& path) {
            std::error_code ec;
            std::filesystem::create_directories(path, ec);
            if (!ec) {
                return {true, 0};
            }
            if (std::filesystem::is_directory(path)) {
                // Directory already exists
                return {true, 0};
            }
            return {false, ec.value() ? ec.value() : EIO};
        }

        FSResult PlatformFS::ensure_file(const std::string& path) {
            // O_CREAT without O_TRUNC leaves existing content alone
            int fd = ::open(path.c_str(), O_WRONLY | O_CREAT, 0644);
            if (fd < 0) {
                return {false, errno};
            }
            ::close(fd);
            return {true, 0};
        }

        FSResult PlatformFS::remove_file(const std::string& path) {
            if (::unlink(path.c_str()) == 0) {
                return {true, 0};
            }
            int e = errno;
            if (e == ENOENT) {
                return {true, ENOENT};
            }
            return {false, e};
        }

    } // namespace persist
} // namespace duodb
