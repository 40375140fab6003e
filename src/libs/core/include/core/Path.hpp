/*
 * Copyright (C) 2025 The vconv authors
 *
 * This file is part of vconv.
 *
 * vconv is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * vconv is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with vconv.  If not, see <http://www.gnu.org/licenses/>.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <span>
#include <system_error>

namespace vconv::core::pathUtils
{
    // Make sure the given path is a directory
    // Create it and its parents if needed
    bool ensureDirectory(const std::filesystem::path& dir);

    // Regular files only, callback called with an error code on exploration errors
    // returns false if aborted by user (callback returned false)
    bool exploreFilesRecursive(const std::filesystem::path& directory, std::function<bool(std::error_code, const std::filesystem::path&)> cb);

    // Case insensitive check, extensions must be lower case and start with a dot
    bool hasFileAnyExtension(const std::filesystem::path& file, std::span<const std::filesystem::path> extensions);

    std::optional<std::uintmax_t> getFileSize(const std::filesystem::path& file);

    // True if both paths designate the same file, the files do not need to exist
    bool isSameFile(const std::filesystem::path& lhs, const std::filesystem::path& rhs);
} // namespace vconv::core::pathUtils
