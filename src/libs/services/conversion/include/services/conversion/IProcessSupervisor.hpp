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
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "av/Progress.hpp"
#include "core/IChildProcess.hpp"

namespace vconv::core
{
    class IChildProcessManager;
}

namespace vconv::conversion
{
    using ProgressCallback = std::function<void(const av::ProgressSnapshot&)>;
    using ShouldAbortCallback = std::function<bool()>;

    enum class RunStatus
    {
        Success,
        Failed,    // non zero exit code, or killed by a signal
        Hung,      // no output for too long, killed
        Cancelled, // abort requested, killed
    };

    struct RunResult
    {
        RunStatus status{ RunStatus::Failed };
        std::optional<int> exitCode;
        bool invalidArgument{}; // engine rejected a parameter
        std::vector<std::string> lastLines;
        std::chrono::duration<double> elapsed{};

        bool succeeded() const { return status == RunStatus::Success; }
    };

    struct SupervisorSettings
    {
        std::filesystem::path ffmpegPath{ "ffmpeg" };
        std::chrono::milliseconds readTimeout{ std::chrono::seconds{ 1 } };
        std::chrono::milliseconds hangTimeout{ std::chrono::seconds{ 30 } };
        std::chrono::milliseconds exitTimeout{ std::chrono::seconds{ 10 } };
        std::chrono::milliseconds terminateTimeout{ std::chrono::seconds{ 5 } };
    };

    // Runs one encoding engine invocation to completion
    // Never returns while the child is still alive
    class IProcessSupervisor
    {
    public:
        virtual ~IProcessSupervisor() = default;

        // totalDuration is used to compute the progress percentage
        // shouldAbort is polled once per read interval
        // throw core::ChildProcessException if the engine cannot be spawned
        virtual RunResult run(const core::IChildProcess::Args& args, std::optional<std::chrono::duration<double>> totalDuration, ProgressCallback onProgress, ShouldAbortCallback shouldAbort) = 0;
    };

    std::unique_ptr<IProcessSupervisor> createProcessSupervisor(core::IChildProcessManager& childProcessManager, const SupervisorSettings& settings);
} // namespace vconv::conversion
