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

#include "av/Exception.hpp"
#include "av/MediaInfo.hpp"

namespace vconv::av::tests
{
    TEST(MediaInfo, parseHdr10)
    {
        constexpr std::string_view json{ R"({
    "streams": [
        {
            "index": 0,
            "codec_name": "av1",
            "codec_type": "video",
            "width": 3840,
            "height": 2160,
            "color_range": "tv",
            "color_space": "bt2020nc",
            "color_transfer": "smpte2084",
            "color_primaries": "bt2020",
            "side_data_list": [
                { "side_data_type": "Mastering display metadata" },
                { "side_data_type": "Content light level metadata", "max_content": 1000 }
            ]
        },
        {
            "index": 1,
            "codec_name": "opus",
            "codec_type": "audio",
            "duration": "3600.021000"
        }
    ],
    "format": {
        "filename": "movie.mkv",
        "duration": "3600.042000",
        "size": "4294967296"
    }
})" };

        const MediaInfo info{ parseMediaInfo(json) };

        ASSERT_TRUE(info.duration);
        EXPECT_NEAR(info.duration->count(), 3600.042, 0.001);
        ASSERT_EQ(info.streams.size(), 2);

        const StreamInfo* video{ getVideoStream(info) };
        ASSERT_NE(video, nullptr);
        EXPECT_EQ(video->codecName, "av1");
        EXPECT_EQ(video->colorPrimaries, "bt2020");
        EXPECT_EQ(video->colorTransfer, "smpte2084");
        EXPECT_EQ(video->colorSpace, "bt2020nc");
        EXPECT_EQ(video->colorRange, "tv");
        EXPECT_EQ(video->sideDataTypes.size(), 2);
        EXPECT_EQ(video->duration, std::nullopt);

        EXPECT_EQ(getVideoCodecName(info), "av1");
        EXPECT_TRUE(hasHdrMetadata(info));
    }

    TEST(MediaInfo, durationFallback)
    {
        const MediaInfo info{ parseMediaInfo(R"({ "streams": [ { "codec_type": "video", "codec_name": "vp9", "duration": "12.5" } ], "format": { "duration": "N/A" } })") };

        EXPECT_EQ(info.duration, std::nullopt);
        ASSERT_TRUE(getDuration(info));
        EXPECT_NEAR(getDuration(info)->count(), 12.5, 0.001);
    }

    TEST(MediaInfo, sdr)
    {
        const MediaInfo info{ parseMediaInfo(R"({ "streams": [ { "codec_type": "video", "codec_name": "h264", "color_transfer": "bt709", "color_primaries": "bt709" } ], "format": {} })") };

        EXPECT_FALSE(hasHdrMetadata(info));
        EXPECT_EQ(getDuration(info), std::nullopt);
    }

    TEST(MediaInfo, hdrSideDataOnly)
    {
        const MediaInfo info{ parseMediaInfo(R"({ "streams": [ { "codec_type": "video", "codec_name": "hevc", "side_data_list": [ { "side_data_type": "Mastering display metadata" } ] } ] })") };

        EXPECT_TRUE(hasHdrMetadata(info));
    }

    TEST(MediaInfo, hlg)
    {
        const MediaInfo info{ parseMediaInfo(R"({ "streams": [ { "codec_type": "video", "codec_name": "hevc", "color_transfer": "arib-std-b67" } ] })") };

        EXPECT_TRUE(hasHdrMetadata(info));
    }

    TEST(MediaInfo, noVideoStream)
    {
        const MediaInfo info{ parseMediaInfo(R"({ "streams": [ { "codec_type": "audio", "codec_name": "flac" } ] })") };

        EXPECT_EQ(getVideoStream(info), nullptr);
        EXPECT_EQ(getVideoCodecName(info), std::nullopt);
        EXPECT_FALSE(hasHdrMetadata(info));
    }

    TEST(MediaInfo, unknownValuesIgnored)
    {
        const MediaInfo info{ parseMediaInfo(R"({ "streams": [ { "codec_type": "video", "codec_name": "mpeg4", "color_primaries": "unknown" } ] })") };

        ASSERT_NE(getVideoStream(info), nullptr);
        EXPECT_EQ(getVideoStream(info)->colorPrimaries, std::nullopt);
    }

    TEST(MediaInfo, malformed)
    {
        EXPECT_THROW(parseMediaInfo("not json"), Exception);
        EXPECT_THROW(parseMediaInfo(R"({ "streams": [ )"), Exception);
    }
} // namespace vconv::av::tests
