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

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

#include "core/IChildProcess.hpp"

namespace vconv::core
{
    class IChildProcessManager;
}

namespace vconv::av
{
    struct ToolOutput
    {
        bool completed{}; // false if the tool had to be killed
        std::optional<int> exitCode;
        std::string output; // captured stdout lines, joined with '\n'

        bool succeeded() const { return completed && exitCode == 0; }
    };

    // Runs a short-lived tool and captures its standard output
    // The tool is killed if it does not complete within timeout
    // throw core::ChildProcessException if the tool cannot be spawned
    ToolOutput runTool(core::IChildProcessManager& childProcessManager, const std::filesystem::path& path, const core::IChildProcess::Args& args, std::chrono::milliseconds timeout);
} // namespace vconv::av
