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

#include <sys/types.h>

#include <array>
#include <filesystem>
#include <optional>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>

#include "core/IChildProcess.hpp"

namespace vconv::core
{
    class ChildProcess : public IChildProcess
    {
    public:
        ChildProcess(const std::filesystem::path& path, const Args& args, CapturedStream capturedStream);
        ~ChildProcess() override;

        ChildProcess(const ChildProcess&) = delete;
        ChildProcess& operator=(const ChildProcess&) = delete;

    private:
        ReadResult readLine(std::string& line, std::chrono::milliseconds timeout) override;
        bool finished() override;
        bool waitFor(std::chrono::milliseconds timeout) override;
        void wait() override;
        void terminate() override;
        void kill() override;
        std::optional<int> getExitCode() const override;

        void sendSignal(int signal);
        bool reap(bool block); // return true if waited
        bool extractPendingLine(std::string& line);
        void asyncReadSome();

        using FileDescriptor = boost::asio::posix::stream_descriptor;

        boost::asio::io_context _ioContext;
        FileDescriptor _childOutput;
        ::pid_t _childPID{};
        bool _waited{};
        std::optional<int> _exitCode;

        std::array<char, 4096> _readBuffer;
        std::string _pending;
        bool _readInProgress{};
        bool _endOfFile{};
    };
} // namespace vconv::core
