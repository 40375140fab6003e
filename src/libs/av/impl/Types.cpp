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

#include "av/Types.hpp"

#include "core/String.hpp"

namespace vconv::av
{
    namespace
    {
        constexpr VideoCodec allCodecs[]{ VideoCodec::HEVC, VideoCodec::H264, VideoCodec::AV1, VideoCodec::VP9 };
        constexpr Backend allBackends[]{ Backend::Nvidia, Backend::Amd, Backend::Intel, Backend::Software };
    } // namespace

    std::string_view toString(VideoCodec codec)
    {
        switch (codec)
        {
        case VideoCodec::HEVC:
            return "hevc";
        case VideoCodec::H264:
            return "h264";
        case VideoCodec::AV1:
            return "av1";
        case VideoCodec::VP9:
            return "vp9";
        }

        return "unknown";
    }

    std::optional<VideoCodec> videoCodecFromString(std::string_view str)
    {
        for (const VideoCodec codec : allCodecs)
        {
            if (core::stringUtils::stringCaseInsensitiveEqual(str, toString(codec)))
                return codec;
        }

        // common aliases
        if (core::stringUtils::stringCaseInsensitiveEqual(str, "h265"))
            return VideoCodec::HEVC;
        if (core::stringUtils::stringCaseInsensitiveEqual(str, "avc"))
            return VideoCodec::H264;

        return std::nullopt;
    }

    std::string_view toString(Backend backend)
    {
        switch (backend)
        {
        case Backend::Nvidia:
            return "nvidia";
        case Backend::Amd:
            return "amd";
        case Backend::Intel:
            return "intel";
        case Backend::Software:
            return "software";
        }

        return "unknown";
    }

    std::optional<Backend> backendFromString(std::string_view str)
    {
        for (const Backend backend : allBackends)
        {
            if (core::stringUtils::stringCaseInsensitiveEqual(str, toString(backend)))
                return backend;
        }

        return std::nullopt;
    }
} // namespace vconv::av
