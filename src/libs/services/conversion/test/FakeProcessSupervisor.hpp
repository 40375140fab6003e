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

#include <deque>
#include <filesystem>
#include <fstream>
#include <functional>

#include "core/IChildProcess.hpp"
#include "services/conversion/IProcessSupervisor.hpp"

namespace vconv::conversion::tests
{
    // Records the invocations and writes the output file (last argument) unless disabled
    class FakeProcessSupervisor : public IProcessSupervisor
    {
    public:
        struct Invocation
        {
            core::IChildProcess::Args args;
            bool outputExisted{};
        };

        RunResult run(const core::IChildProcess::Args& args, std::optional<std::chrono::duration<double>> totalDuration, ProgressCallback onProgress, ShouldAbortCallback shouldAbort) override
        {
            const std::filesystem::path output{ args.back() };
            invocations.push_back({ .args = args, .outputExisted = std::filesystem::exists(output) });

            if (writeOutput)
            {
                std::ofstream ofs{ output };
                ofs << "partial";
            }

            if (onRun)
                onRun(invocations.size() - 1);

            if (onProgress)
            {
                av::ProgressSnapshot snapshot;
                snapshot.frame = 42;
                if (totalDuration)
                    snapshot.percentage = 100;
                onProgress(snapshot);
            }

            if (shouldAbort && shouldAbort())
                return RunResult{ .status = RunStatus::Cancelled };

            if (results.empty())
                return RunResult{ .status = RunStatus::Success, .exitCode = 0 };

            RunResult result{ results.front() };
            results.pop_front();
            return result;
        }

        std::vector<Invocation> invocations;
        std::deque<RunResult> results;   // default to success once empty
        std::function<void(std::size_t)> onRun; // may throw
        bool writeOutput{ true };
    };
} // namespace vconv::conversion::tests
