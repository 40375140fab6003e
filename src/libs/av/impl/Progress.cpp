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

#include "av/Progress.hpp"

#include <algorithm>
#include <regex>

#include "core/ILogger.hpp"
#include "core/String.hpp"

namespace vconv::av
{
    namespace
    {
        // ex: "frame= 1234 fps= 25 q=28.0 size=    1024kB time=00:00:49.36 bitrate= 170.1kbits/s speed=1.0x"
        std::optional<std::string> search(std::string_view line, const std::regex& regex)
        {
            std::cmatch match;
            if (!std::regex_search(line.data(), line.data() + line.size(), match, regex))
                return std::nullopt;

            return match[1].str();
        }

        void parseTime(std::string_view line, ProgressSnapshot& snapshot, std::optional<std::chrono::duration<double>> totalDuration)
        {
            static const std::regex timeRegex{ R"(time=(\d{2}):(\d{2}):(\d{2})\.(\d{2}))" };

            std::cmatch match;
            if (!std::regex_search(line.data(), line.data() + line.size(), match, timeRegex))
                return;

            const auto hours{ core::stringUtils::readAs<unsigned>(match[1].str()) };
            const auto minutes{ core::stringUtils::readAs<unsigned>(match[2].str()) };
            const auto seconds{ core::stringUtils::readAs<unsigned>(match[3].str()) };
            const auto centiseconds{ core::stringUtils::readAs<unsigned>(match[4].str()) };
            if (!hours || !minutes || !seconds || !centiseconds)
                return;

            snapshot.elapsed = std::chrono::hours{ *hours } + std::chrono::minutes{ *minutes } + std::chrono::seconds{ *seconds } + std::chrono::duration<double>{ *centiseconds / 100.0 };
            snapshot.time = core::stringUtils::formatDuration(snapshot.elapsed);

            if (totalDuration && totalDuration->count() > 0)
                snapshot.percentage = static_cast<float>(std::min(100.0, 100.0 * snapshot.elapsed.count() / totalDuration->count()));
        }
    } // namespace

    bool isProgressLine(std::string_view line)
    {
        return line.find("frame=") != std::string_view::npos && line.find("time=") != std::string_view::npos;
    }

    bool parseProgressLine(std::string_view line, ProgressSnapshot& snapshot, std::optional<std::chrono::duration<double>> totalDuration)
    {
        if (!isProgressLine(line))
            return false;

        try
        {
            static const std::regex frameRegex{ R"(frame=\s*(\d+))" };
            static const std::regex fpsRegex{ R"(fps=\s*([\d.]+))" };
            static const std::regex bitrateRegex{ R"(bitrate=\s*([\d.]+\w*bits/s))" };
            static const std::regex sizeRegex{ R"(size=\s*([\d.]+\w*B))" };
            static const std::regex speedRegex{ R"(speed=\s*([\d.]+)x)" };

            if (const auto frameStr{ search(line, frameRegex) })
            {
                if (const auto frame{ core::stringUtils::readAs<std::size_t>(*frameStr) })
                    snapshot.frame = std::max(snapshot.frame, *frame);
            }

            if (const auto fpsStr{ search(line, fpsRegex) })
            {
                if (const auto fps{ core::stringUtils::readAs<float>(*fpsStr) })
                    snapshot.fps = *fps;
            }

            if (auto bitrate{ search(line, bitrateRegex) })
                snapshot.bitrate = std::move(*bitrate);

            if (auto size{ search(line, sizeRegex) })
                snapshot.size = std::move(*size);

            parseTime(line, snapshot, totalDuration);

            if (const auto speedStr{ search(line, speedRegex) })
            {
                if (const auto speed{ core::stringUtils::readAs<float>(*speedStr) })
                    snapshot.speed = *speed;
            }
        }
        catch (const std::regex_error& e)
        {
            VCONV_LOG(ENCODING, DEBUG, "Cannot parse progress line '" << line << "': " << e.what());
        }

        return true;
    }
} // namespace vconv::av
