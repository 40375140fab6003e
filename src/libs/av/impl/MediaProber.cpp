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

#include "MediaProber.hpp"

#include "av/Exception.hpp"
#include "core/IChildProcessManager.hpp"
#include "core/ILogger.hpp"

#include "ToolRunner.hpp"

namespace vconv::av
{
    std::unique_ptr<IMediaProber> createMediaProber(core::IChildProcessManager& childProcessManager, const std::filesystem::path& ffprobePath, std::chrono::milliseconds timeout)
    {
        return std::make_unique<MediaProber>(childProcessManager, ffprobePath, timeout);
    }

    MediaProber::MediaProber(core::IChildProcessManager& childProcessManager, const std::filesystem::path& ffprobePath, std::chrono::milliseconds timeout)
        : _childProcessManager{ childProcessManager }
        , _ffprobePath{ ffprobePath }
        , _timeout{ timeout }
    {
    }

    std::optional<MediaInfo> MediaProber::probe(const std::filesystem::path& file)
    {
        const core::IChildProcess::Args args{ "-v", "quiet", "-print_format", "json", "-show_streams", "-show_format", file.string() };

        try
        {
            const ToolOutput toolOutput{ runTool(_childProcessManager, _ffprobePath, args, _timeout) };
            if (!toolOutput.succeeded())
            {
                VCONV_LOG(PROBE, DEBUG, "Cannot probe '" << file.string() << "': " << (toolOutput.completed ? "exit code " + (toolOutput.exitCode ? std::to_string(*toolOutput.exitCode) : std::string{ "none" }) : std::string{ "timeout" }));
                return std::nullopt;
            }

            return parseMediaInfo(toolOutput.output);
        }
        catch (const core::ChildProcessException& e)
        {
            VCONV_LOG(PROBE, ERROR, "Cannot run '" << _ffprobePath.string() << "': " << e.what());
        }
        catch (const Exception& e)
        {
            VCONV_LOG(PROBE, DEBUG, "Cannot probe '" << file.string() << "': " << e.what());
        }

        return std::nullopt;
    }
} // namespace vconv::av
