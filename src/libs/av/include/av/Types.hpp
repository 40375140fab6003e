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

#include <optional>
#include <string_view>

namespace vconv::av
{
    enum class VideoCodec
    {
        HEVC,
        H264,
        AV1,
        VP9,
    };

    // Ordered by preference, software is always the last resort
    enum class Backend
    {
        Nvidia,
        Amd,
        Intel,
        Software,
    };

    constexpr bool isHardware(Backend backend)
    {
        return backend != Backend::Software;
    }

    // codec keys are the ones used by ffprobe ("hevc", "h264", ...)
    std::string_view toString(VideoCodec codec);
    std::optional<VideoCodec> videoCodecFromString(std::string_view str);

    std::string_view toString(Backend backend);
    std::optional<Backend> backendFromString(std::string_view str);
} // namespace vconv::av
