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
#include <optional>
#include <string>
#include <vector>

#include "core/Exception.hpp"

namespace vconv::core
{
    class ChildProcessException : public VconvException
    {
    public:
        using VconvException::VconvException;
    };

    // Which output of the child is piped back to us, the other one goes to /dev/null
    enum class CapturedStream
    {
        StdOut,
        StdErr,
    };

    class IChildProcess
    {
    public:
        using Args = std::vector<std::string>;

        virtual ~IChildProcess() = default;

        enum class ReadResult
        {
            Line,
            Timeout,
            EndOfFile,
        };

        // Lines are delimited by either '\n' or '\r', empty lines are skipped
        // Once EndOfFile is returned, all subsequent calls return EndOfFile
        virtual ReadResult readLine(std::string& line, std::chrono::milliseconds timeout) = 0;

        // true if the child has exited (reaps it if so)
        virtual bool finished() = 0;

        // return true if the child exited before the timeout
        virtual bool waitFor(std::chrono::milliseconds timeout) = 0;
        virtual void wait() = 0;

        virtual void terminate() = 0; // SIGTERM
        virtual void kill() = 0;      // SIGKILL

        // Only set if the child exited normally
        virtual std::optional<int> getExitCode() const = 0;
    };
} // namespace vconv::core
