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

#include "ChildProcess.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <mutex>
#include <system_error>
#include <thread>
#include <vector>

#include <boost/asio/buffer.hpp>
#include <boost/asio/error.hpp>

#include "core/ILogger.hpp"

namespace vconv::core
{
    namespace
    {
        class ChildProcessSystemException : public ChildProcessException
        {
        public:
            ChildProcessSystemException(std::error_code err, const std::string& errMsg)
                : ChildProcessException{ errMsg + ": " + err.message() }
            {
            }

            ChildProcessSystemException(boost::system::error_code ec, const std::string& errMsg)
                : ChildProcessException{ errMsg + ": " + ec.message() }
            {
            }
        };

        std::error_code lastError()
        {
            return std::error_code{ errno, std::generic_category() };
        }

        void setCloseOnExec(int fd)
        {
            const int flags{ ::fcntl(fd, F_GETFD) };
            if (flags == -1 || ::fcntl(fd, F_SETFD, flags | FD_CLOEXEC) == -1)
                throw ChildProcessSystemException{ lastError(), "fcntl failed to set FD_CLOEXEC!" };
        }

        constexpr std::chrono::milliseconds waitPollPeriod{ 50 };
    } // namespace

    ChildProcess::ChildProcess(const std::filesystem::path& path, const Args& args, CapturedStream capturedStream)
        : _childOutput{ _ioContext }
    {
        // make sure only one thread is executing this part of code
        static std::mutex mutex;
        const std::scoped_lock lock{ mutex };

        // argv is built before forking, the child only calls async-signal-safe functions
        const std::string program{ path.string() };
        std::vector<const char*> execArgs;
        execArgs.reserve(args.size() + 2);
        execArgs.push_back(program.c_str());
        std::transform(std::cbegin(args), std::cend(args), std::back_inserter(execArgs), [](const std::string& arg) { return arg.c_str(); });
        execArgs.push_back(nullptr);

        int pipefd[2];

        // Use 'pipe' instead of 'pipe2', more portable
        if (::pipe(pipefd) == -1)
            throw ChildProcessSystemException{ lastError(), "pipe failed!" };

        try
        {
            // Other children spawned concurrently must not inherit our pipe
            setCloseOnExec(pipefd[0]);
            setCloseOnExec(pipefd[1]);

            // Only set O_NONBLOCK on read end - usually programs don't expect their output to be non-blocking
            if (::fcntl(pipefd[0], F_SETFL, O_NONBLOCK) == -1)
                throw ChildProcessSystemException{ lastError(), "fcntl failed to set O_NONBLOCK!" };
        }
        catch (const ChildProcessSystemException&)
        {
            ::close(pipefd[0]);
            ::close(pipefd[1]);
            throw;
        }

        const int capturedFd{ capturedStream == CapturedStream::StdOut ? STDOUT_FILENO : STDERR_FILENO };
        const int discardedFd{ capturedStream == CapturedStream::StdOut ? STDERR_FILENO : STDOUT_FILENO };

        const ::pid_t res{ ::fork() };
        if (res == -1)
        {
            const std::error_code err{ lastError() };
            ::close(pipefd[0]);
            ::close(pipefd[1]);
            throw ChildProcessSystemException{ err, "fork failed!" };
        }

        if (res == 0) // CHILD
        {
            // Never close stdin/out/err, most programs expect these to exist;
            // rather connect them to /dev/null if unwanted
            const int nullFd{ ::open("/dev/null", O_RDWR) };
            if (nullFd != -1)
            {
                ::dup2(nullFd, STDIN_FILENO);
                ::dup2(nullFd, discardedFd);
                ::close(nullFd);
            }

            // dup2 clears FD_CLOEXEC on the new descriptor
            if (::dup2(pipefd[1], capturedFd) == -1)
                ::_exit(127);

            ::execvp(execArgs[0], const_cast<char* const*>(execArgs.data()));
            ::_exit(127);
        }

        // PARENT
        ::close(pipefd[1]);
        _childPID = res;

        boost::system::error_code assignError;
        _childOutput.assign(pipefd[0], assignError);
        if (assignError)
        {
            ::close(pipefd[0]);
            kill();
            reap(true);
            throw ChildProcessSystemException{ assignError, "assigning read end of pipe to asio stream failed!" };
        }

        VCONV_LOG(CHILDPROCESS, DEBUG, "Started '" << program << "', pid = " << _childPID);
    }

    ChildProcess::~ChildProcess()
    {
        VCONV_LOG(CHILDPROCESS, DEBUG, "Closing child process " << _childPID << "...");
        {
            boost::system::error_code closeError;
            _childOutput.close(closeError);
            if (closeError)
                VCONV_LOG(CHILDPROCESS, ERROR, "Close failed: " << closeError.message());
        }

        if (_waited)
            return;

        try
        {
            if (!reap(false))
            {
                kill();
                reap(true);
            }
        }
        catch (const ChildProcessException& e)
        {
            VCONV_LOG(CHILDPROCESS, ERROR, "Cannot reap child process " << _childPID << ": " << e.what());
        }
    }

    IChildProcess::ReadResult ChildProcess::readLine(std::string& line, std::chrono::milliseconds timeout)
    {
        const auto deadline{ std::chrono::steady_clock::now() + timeout };

        while (true)
        {
            if (extractPendingLine(line))
                return ReadResult::Line;

            if (_endOfFile)
            {
                if (!_pending.empty())
                {
                    line = std::move(_pending);
                    _pending.clear();
                    return ReadResult::Line;
                }

                return ReadResult::EndOfFile;
            }

            if (!_readInProgress)
                asyncReadSome();

            const auto now{ std::chrono::steady_clock::now() };
            if (now >= deadline)
                return ReadResult::Timeout;

            _ioContext.restart();
            _ioContext.run_one_for(deadline - now);
        }
    }

    void ChildProcess::asyncReadSome()
    {
        _readInProgress = true;
        _childOutput.async_read_some(boost::asio::buffer(_readBuffer), [this](const boost::system::error_code& error, std::size_t bytesTransferred) {
            _readInProgress = false;
            _pending.append(_readBuffer.data(), bytesTransferred);

            if (error)
            {
                if (error != boost::asio::error::eof)
                    VCONV_LOG(CHILDPROCESS, DEBUG, "Read failed: " << error.message());

                _endOfFile = true;
            }
        });
    }

    bool ChildProcess::extractPendingLine(std::string& line)
    {
        std::size_t pos;
        while ((pos = _pending.find_first_of("\r\n")) != std::string::npos)
        {
            std::string candidate{ _pending.substr(0, pos) };
            _pending.erase(0, pos + 1);

            if (!candidate.empty())
            {
                line = std::move(candidate);
                return true;
            }
        }

        return false;
    }

    bool ChildProcess::finished()
    {
        return _waited || reap(false);
    }

    bool ChildProcess::waitFor(std::chrono::milliseconds timeout)
    {
        const auto deadline{ std::chrono::steady_clock::now() + timeout };
        while (!finished())
        {
            const auto now{ std::chrono::steady_clock::now() };
            if (now >= deadline)
                return false;

            std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(waitPollPeriod, deadline - now));
        }

        return true;
    }

    void ChildProcess::wait()
    {
        if (!_waited)
            reap(true);
    }

    void ChildProcess::terminate()
    {
        VCONV_LOG(CHILDPROCESS, DEBUG, "Terminating child process " << _childPID << "...");
        sendSignal(SIGTERM);
    }

    void ChildProcess::kill()
    {
        VCONV_LOG(CHILDPROCESS, DEBUG, "Killing child process " << _childPID << "...");
        sendSignal(SIGKILL);
    }

    void ChildProcess::sendSignal(int signal)
    {
        // process may already have finished
        if (_waited)
            return;

        if (::kill(_childPID, signal) == -1)
        {
            const std::error_code err{ lastError() };
            VCONV_LOG(CHILDPROCESS, DEBUG, "Signal " << signal << " failed: " << err.message());
        }
    }

    bool ChildProcess::reap(bool block)
    {
        int wstatus{};
        ::pid_t pid;
        do
        {
            pid = ::waitpid(_childPID, &wstatus, block ? 0 : WNOHANG);
        } while (pid == -1 && errno == EINTR);

        if (pid == -1)
            throw ChildProcessSystemException{ lastError(), "waitpid failed!" };
        if (pid == 0)
            return false;

        if (WIFEXITED(wstatus))
        {
            _exitCode = WEXITSTATUS(wstatus);
            VCONV_LOG(CHILDPROCESS, DEBUG, "Child process " << _childPID << " exited, code = " << *_exitCode);
        }
        else if (WIFSIGNALED(wstatus))
        {
            VCONV_LOG(CHILDPROCESS, DEBUG, "Child process " << _childPID << " killed by signal " << WTERMSIG(wstatus));
        }

        _waited = true;
        return true;
    }

    std::optional<int> ChildProcess::getExitCode() const
    {
        return _exitCode;
    }
} // namespace vconv::core
