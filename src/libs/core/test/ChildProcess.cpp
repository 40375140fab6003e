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

#include <gtest/gtest.h>

#include "core/IChildProcessManager.hpp"

namespace vconv::core::tests
{
    using namespace std::chrono_literals;

    namespace
    {
        std::unique_ptr<IChildProcess> spawnShell(std::string_view script, CapturedStream capturedStream = CapturedStream::StdOut)
        {
            static const std::unique_ptr<IChildProcessManager> manager{ createChildProcessManager() };
            return manager->spawnChildProcess("/bin/sh", IChildProcess::Args{ "-c", std::string{ script } }, capturedStream);
        }

        std::vector<std::string> readAllLines(IChildProcess& process)
        {
            std::vector<std::string> lines;
            std::string line;

            IChildProcess::ReadResult res;
            while ((res = process.readLine(line, 5s)) == IChildProcess::ReadResult::Line)
                lines.push_back(line);

            EXPECT_EQ(res, IChildProcess::ReadResult::EndOfFile);
            return lines;
        }
    } // namespace

    TEST(ChildProcess, readLines)
    {
        auto process{ spawnShell("printf 'first\\nsecond\\n\\nthird'") };

        const std::vector<std::string> expected{ "first", "second", "third" };
        EXPECT_EQ(readAllLines(*process), expected);

        process->wait();
        EXPECT_EQ(process->getExitCode(), 0);
    }

    TEST(ChildProcess, carriageReturnSeparatesLines)
    {
        auto process{ spawnShell("printf 'frame=1\\rframe=2\\r\\nend\\n'") };

        const std::vector<std::string> expected{ "frame=1", "frame=2", "end" };
        EXPECT_EQ(readAllLines(*process), expected);
    }

    TEST(ChildProcess, captureStdErr)
    {
        auto process{ spawnShell("echo out; echo err 1>&2", CapturedStream::StdErr) };

        const std::vector<std::string> expected{ "err" };
        EXPECT_EQ(readAllLines(*process), expected);
    }

    TEST(ChildProcess, exitCode)
    {
        auto process{ spawnShell("exit 3") };

        EXPECT_TRUE(readAllLines(*process).empty());
        EXPECT_TRUE(process->waitFor(5s));
        EXPECT_TRUE(process->finished());
        EXPECT_EQ(process->getExitCode(), 3);
    }

    TEST(ChildProcess, readTimeout)
    {
        auto process{ spawnShell("sleep 5") };

        std::string line;
        const auto start{ std::chrono::steady_clock::now() };
        EXPECT_EQ(process->readLine(line, 100ms), IChildProcess::ReadResult::Timeout);
        EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);

        EXPECT_FALSE(process->finished());
        EXPECT_FALSE(process->waitFor(50ms));
    }

    TEST(ChildProcess, terminate)
    {
        auto process{ spawnShell("exec sleep 30") };

        process->terminate();
        EXPECT_TRUE(process->waitFor(5s));

        // killed by a signal: no exit code
        EXPECT_EQ(process->getExitCode(), std::nullopt);
    }

    TEST(ChildProcess, kill)
    {
        auto process{ spawnShell("trap '' TERM; while true; do sleep 1; done") };

        process->terminate();
        EXPECT_FALSE(process->waitFor(200ms));

        process->kill();
        process->wait();
        EXPECT_TRUE(process->finished());
    }

    TEST(ChildProcess, unknownExecutable)
    {
        static const std::unique_ptr<IChildProcessManager> manager{ createChildProcessManager() };
        auto process{ manager->spawnChildProcess("/nonexistent/vconv-test-binary", {}, CapturedStream::StdOut) };

        process->wait();
        EXPECT_EQ(process->getExitCode(), 127);
    }

    TEST(ChildProcess, destroyRunning)
    {
        // must not block nor leave a zombie behind
        auto process{ spawnShell("exec sleep 30") };
        process.reset();
    }
} // namespace vconv::core::tests
