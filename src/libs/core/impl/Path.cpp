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

#include "core/Path.hpp"

#include <algorithm>

#include "core/ILogger.hpp"
#include "core/String.hpp"

namespace vconv::core::pathUtils
{
    bool ensureDirectory(const std::filesystem::path& dir)
    {
        std::error_code ec;
        if (std::filesystem::exists(dir, ec))
            return std::filesystem::is_directory(dir, ec);

        std::filesystem::create_directories(dir, ec);
        if (ec)
        {
            VCONV_LOG(MAIN, ERROR, "Cannot create directory '" << dir.string() << "': " << ec.message());
            return false;
        }

        return true;
    }

    bool exploreFilesRecursive(const std::filesystem::path& directory, std::function<bool(std::error_code, const std::filesystem::path&)> cb)
    {
        std::error_code ec;
        std::filesystem::recursive_directory_iterator itPath{ directory, std::filesystem::directory_options::skip_permission_denied, ec };
        if (ec)
            return cb(ec, directory);

        const std::filesystem::recursive_directory_iterator itEnd;
        while (itPath != itEnd)
        {
            bool continueExploring{ true };

            const std::filesystem::path& path{ itPath->path() };
            if (itPath->is_regular_file(ec))
                continueExploring = cb(ec, path);
            else if (ec)
                continueExploring = cb(ec, path);

            if (!continueExploring)
                return false;

            itPath.increment(ec);
            if (ec)
            {
                if (!cb(ec, directory))
                    return false;
                break;
            }
        }

        return true;
    }

    bool hasFileAnyExtension(const std::filesystem::path& file, std::span<const std::filesystem::path> supportedExtensions)
    {
        const std::filesystem::path extension{ stringUtils::stringToLower(file.extension().c_str()) };

        return (std::find(std::cbegin(supportedExtensions), std::cend(supportedExtensions), extension) != std::cend(supportedExtensions));
    }

    std::optional<std::uintmax_t> getFileSize(const std::filesystem::path& file)
    {
        std::error_code ec;
        const std::uintmax_t size{ std::filesystem::file_size(file, ec) };
        if (ec)
            return std::nullopt;

        return size;
    }

    bool isSameFile(const std::filesystem::path& lhs, const std::filesystem::path& rhs)
    {
        std::error_code ec;
        if (std::filesystem::equivalent(lhs, rhs, ec))
            return true;

        const std::filesystem::path canonicalLhs{ std::filesystem::weakly_canonical(lhs, ec) };
        if (ec)
            return lhs.lexically_normal() == rhs.lexically_normal();

        const std::filesystem::path canonicalRhs{ std::filesystem::weakly_canonical(rhs, ec) };
        if (ec)
            return lhs.lexically_normal() == rhs.lexically_normal();

        return canonicalLhs == canonicalRhs;
    }
} // namespace vconv::core::pathUtils
