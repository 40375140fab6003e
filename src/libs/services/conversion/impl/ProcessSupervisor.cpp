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

#include "ProcessSupervisor.hpp"

#include <deque>

#include "core/IChildProcessManager.hpp"
#include "core/ILogger.hpp"
#include "core/String.hpp"

namespace vconv::conversion
{
    namespace
    {
        constexpr std::size_t maxKeptLines{ 10 };

        bool isInvalidArgumentLine(std::string_view line)
        {
            return core::stringUtils::stringCaseInsensitiveContains(line, "Invalid argument")
                || line.find("error code: -22") != std::string_view::npos;
        }
    } // namespace

    std::unique_ptr<IProcessSupervisor> createProcessSupervisor(core::IChildProcessManager& childProcessManager, const SupervisorSettings& settings)
    {
        return std::make_unique<ProcessSupervisor>(childProcessManager, settings);
    }

    ProcessSupervisor::ProcessSupervisor(core::IChildProcessManager& childProcessManager, const SupervisorSettings& settings)
        : _childProcessManager{ childProcessManager }
        , _settings{ settings }
    {
    }

    RunResult ProcessSupervisor::run(const core::IChildProcess::Args& args, std::optional<std::chrono::duration<double>> totalDuration, ProgressCallback onProgress, ShouldAbortCallback shouldAbort)
    {
        VCONV_LOG(ENCODING, DEBUG, "Running '" << _settings.ffmpegPath.string() << " " << core::stringUtils::joinStrings(args, " ") << "'");

        const auto start{ std::chrono::steady_clock::now() };
        std::unique_ptr<core::IChildProcess> process{ _childProcessManager.spawnChildProcess(_settings.ffmpegPath, args, core::CapturedStream::StdErr) };

        RunResult result;
        std::deque<std::string> lastLines;
        av::ProgressSnapshot snapshot;
        auto lastOutput{ std::chrono::steady_clock::now() };

        enum class Outcome
        {
            EndOfOutput,
            Hung,
            Cancelled,
        };
        Outcome outcome{ Outcome::EndOfOutput };

        std::string line;
        while (true)
        {
            if (shouldAbort && shouldAbort())
            {
                outcome = Outcome::Cancelled;
                break;
            }

            const core::IChildProcess::ReadResult readResult{ process->readLine(line, _settings.readTimeout) };
            if (readResult == core::IChildProcess::ReadResult::EndOfFile)
                break;

            if (readResult == core::IChildProcess::ReadResult::Timeout)
            {
                if (std::chrono::steady_clock::now() - lastOutput > _settings.hangTimeout)
                {
                    outcome = Outcome::Hung;
                    break;
                }
                continue;
            }

            lastOutput = std::chrono::steady_clock::now();
            VCONV_LOG(ENCODING, DEBUG, "ffmpeg: " << line);

            lastLines.push_back(line);
            if (lastLines.size() > maxKeptLines)
                lastLines.pop_front();

            if (av::parseProgressLine(line, snapshot, totalDuration) && onProgress)
                onProgress(snapshot);
        }

        switch (outcome)
        {
        case Outcome::EndOfOutput:
            if (!process->waitFor(_settings.exitTimeout))
            {
                VCONV_LOG(ENCODING, WARNING, "Encoder closed its output but did not exit, terminating it");
                terminateProcess(*process);
            }
            break;

        case Outcome::Hung:
            VCONV_LOG(ENCODING, ERROR, "Encoder hung: no output for " << std::chrono::duration_cast<std::chrono::seconds>(_settings.hangTimeout).count() << " seconds, terminating it");
            terminateProcess(*process);
            break;

        case Outcome::Cancelled:
            VCONV_LOG(ENCODING, INFO, "Encoding cancelled, terminating encoder");
            terminateProcess(*process);
            break;
        }

        result.exitCode = process->getExitCode();
        result.lastLines.assign(std::cbegin(lastLines), std::cend(lastLines));
        result.elapsed = std::chrono::steady_clock::now() - start;

        if (outcome == Outcome::Hung)
            result.status = RunStatus::Hung;
        else if (outcome == Outcome::Cancelled)
            result.status = RunStatus::Cancelled;
        else if (result.exitCode == 0)
            result.status = RunStatus::Success;
        else
            result.status = RunStatus::Failed;

        if (result.status == RunStatus::Failed)
        {
            if (result.exitCode)
                VCONV_LOG(ENCODING, ERROR, "Encoder failed with exit code " << *result.exitCode);
            else
                VCONV_LOG(ENCODING, ERROR, "Encoder was killed by a signal");

            for (const std::string& lastLine : result.lastLines)
            {
                VCONV_LOG(ENCODING, ERROR, "  " << lastLine);
                if (isInvalidArgumentLine(lastLine))
                    result.invalidArgument = true;
            }

            VCONV_LOG_IF(ENCODING, ERROR, result.invalidArgument, "Encoder rejected its parameters (invalid argument)");
        }

        return result;
    }

    void ProcessSupervisor::terminateProcess(core::IChildProcess& process)
    {
        process.terminate();
        if (process.waitFor(_settings.terminateTimeout))
            return;

        VCONV_LOG(ENCODING, WARNING, "Encoder did not exit after SIGTERM, killing it");
        process.kill();
        process.wait();
    }
} // namespace vconv::conversion
