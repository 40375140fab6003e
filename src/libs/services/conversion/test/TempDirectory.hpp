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

#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>

#include <unistd.h>

#include <gtest/gtest.h>

namespace vconv::conversion::tests
{
    // Removed along with its content at destruction
    class TempDirectory
    {
    public:
        TempDirectory()
            : _path{ std::filesystem::temp_directory_path() / ("vconv-test-" + std::to_string(::getpid()) + "-" + ::testing::UnitTest::GetInstance()->current_test_info()->name()) }
        {
            std::filesystem::remove_all(_path);
            std::filesystem::create_directories(_path);
        }

        ~TempDirectory()
        {
            std::error_code ec;
            std::filesystem::remove_all(_path, ec);
        }

        TempDirectory(const TempDirectory&) = delete;
        TempDirectory& operator=(const TempDirectory&) = delete;

        const std::filesystem::path& getPath() const { return _path; }

        std::filesystem::path createFile(const std::filesystem::path& relativePath, std::string_view content = "content") const
        {
            const std::filesystem::path path{ _path / relativePath };
            std::filesystem::create_directories(path.parent_path());

            std::ofstream ofs{ path };
            ofs << content;
            return path;
        }

    private:
        const std::filesystem::path _path;
    };
} // namespace vconv::conversion::tests
