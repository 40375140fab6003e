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
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vconv::core
{
    class IChildProcessManager;
}

namespace vconv::av
{
    struct StreamInfo
    {
        std::string codecType; // "video", "audio", "subtitle", ...
        std::string codecName;
        std::optional<std::string> colorPrimaries;
        std::optional<std::string> colorTransfer;
        std::optional<std::string> colorSpace;
        std::optional<std::string> colorRange;
        std::optional<std::chrono::duration<double>> duration;
        std::vector<std::string> sideDataTypes;
    };

    struct MediaInfo
    {
        std::optional<std::chrono::duration<double>> duration; // container duration
        std::vector<StreamInfo> streams;
    };

    // throw av::Exception on malformed document
    MediaInfo parseMediaInfo(std::string_view ffprobeJsonOutput);

    // First video stream
    const StreamInfo* getVideoStream(const MediaInfo& info);
    std::optional<std::string> getVideoCodecName(const MediaInfo& info);

    // Container duration, or the video stream duration as a fallback
    std::optional<std::chrono::duration<double>> getDuration(const MediaInfo& info);

    bool hasHdrMetadata(const MediaInfo& info);

    class IMediaProber
    {
    public:
        virtual ~IMediaProber() = default;

        // nullopt on any failure (missing file, timeout, unparsable output...)
        virtual std::optional<MediaInfo> probe(const std::filesystem::path& file) = 0;
    };

    std::unique_ptr<IMediaProber> createMediaProber(core::IChildProcessManager& childProcessManager, const std::filesystem::path& ffprobePath, std::chrono::milliseconds timeout);
} // namespace vconv::av
