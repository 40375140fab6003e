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

#include "ToolRunner.hpp"

#include "core/IChildProcessManager.hpp"
#include "core/ILogger.hpp"

namespace vconv::av
{
    namespace
    {
        constexpr std::chrono::seconds killWaitTimeout{ 5 };

        std::chrono::milliseconds getRemainingTime(std::chrono::steady_clock::time_point deadline)
        {
            const auto now{ std::chrono::steady_clock::now() };
            if (now >= deadline)
                return std::chrono::milliseconds{ 0 };

            return std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        }
    } // namespace

    ToolOutput runTool(core::IChildProcessManager& childProcessManager, const std::filesystem::path& path, const core::IChildProcess::Args& args, std::chrono::milliseconds timeout)
    {
        const auto deadline{ std::chrono::steady_clock::now() + timeout };

        std::unique_ptr<core::IChildProcess> process{ childProcessManager.spawnChildProcess(path, args, core::CapturedStream::StdOut) };

        ToolOutput res;
        std::string line;

        core::IChildProcess::ReadResult readResult;
        while ((readResult = process->readLine(line, getRemainingTime(deadline))) == core::IChildProcess::ReadResult::Line)
        {
            if (!res.output.empty())
                res.output += '\n';
            res.output += line;
        }

        if (readResult == core::IChildProcess::ReadResult::EndOfFile && process->waitFor(getRemainingTime(deadline)))
        {
            res.completed = true;
            res.exitCode = process->getExitCode();
            return res;
        }

        VCONV_LOG(PROBE, WARNING, "'" << path.string() << "' did not complete within " << timeout.count() << " ms, killing it");
        process->terminate();
        if (!process->waitFor(killWaitTimeout))
        {
            process->kill();
            process->wait();
        }

        return res;
    }
} // namespace vconv::av
