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

#include "av/CapabilityRegistry.hpp"
#include "av/Exception.hpp"

namespace vconv::av::tests
{
    TEST(CapabilityRegistry, defaultRegistry)
    {
        const CapabilityRegistry& registry{ getDefaultCapabilityRegistry() };

        const std::vector<VideoCodec> expectedCodecs{ VideoCodec::HEVC, VideoCodec::H264, VideoCodec::AV1, VideoCodec::VP9 };
        EXPECT_EQ(registry.getOutputCodecs(), expectedCodecs);

        EXPECT_TRUE(registry.getCodec(VideoCodec::HEVC).supportsHdr);
        EXPECT_TRUE(registry.getCodec(VideoCodec::AV1).supportsHdr);
        EXPECT_FALSE(registry.getCodec(VideoCodec::H264).supportsHdr);
        EXPECT_FALSE(registry.getCodec(VideoCodec::VP9).supportsHdr);

        EXPECT_EQ(registry.getCodec(VideoCodec::HEVC).extension, ".mkv");
        EXPECT_EQ(registry.getCodec(VideoCodec::H264).extension, ".mp4");
        EXPECT_EQ(registry.getCodec(VideoCodec::VP9).extension, ".webm");
    }

    TEST(CapabilityRegistry, lookup)
    {
        const CapabilityRegistry& registry{ getDefaultCapabilityRegistry() };

        const BackendParameters* nvenc{ registry.lookup(VideoCodec::HEVC, Backend::Nvidia) };
        ASSERT_NE(nvenc, nullptr);
        ASSERT_TRUE(std::holds_alternative<NvencParameters>(*nvenc));
        EXPECT_EQ(std::get<NvencParameters>(*nvenc).encoder, "hevc_nvenc");
        EXPECT_EQ(std::get<NvencParameters>(*nvenc).constantQuality, 23);
        EXPECT_EQ(std::get<NvencParameters>(*nvenc).bRefMode, "middle");

        const BackendParameters* software{ registry.lookup(VideoCodec::HEVC, Backend::Software) };
        ASSERT_NE(software, nullptr);
        EXPECT_EQ(getEncoderName(*software), "libx265");
        EXPECT_EQ(getBackend(*software), Backend::Software);
        EXPECT_EQ(getQuality(*software), 23);

        // registry gap
        EXPECT_EQ(registry.lookup(VideoCodec::VP9, Backend::Nvidia), nullptr);
        EXPECT_EQ(registry.lookup(VideoCodec::VP9, Backend::Amd), nullptr);
        EXPECT_NE(registry.lookup(VideoCodec::VP9, Backend::Intel), nullptr);
    }

    TEST(CapabilityRegistry, backendsInPreferenceOrder)
    {
        const CapabilityRegistry& registry{ getDefaultCapabilityRegistry() };

        const std::vector<Backend> all{ Backend::Nvidia, Backend::Amd, Backend::Intel, Backend::Software };
        EXPECT_EQ(registry.getBackends(VideoCodec::HEVC), all);

        const std::vector<Backend> vp9{ Backend::Intel, Backend::Software };
        EXPECT_EQ(registry.getBackends(VideoCodec::VP9), vp9);
    }

    TEST(CapabilityRegistry, unregisteredCodec)
    {
        const CapabilityRegistry registry{ std::vector<CapabilityRegistry::Entry>{ CapabilityRegistry::Entry{
            .descriptor = { .codec = VideoCodec::H264, .name = "H.264", .extension = ".mp4", .supportsHdr = false },
            .backends = { SoftwareParameters{ .encoder = "libx264", .preset = "fast", .crf = 20, .hdrParamsOption = "", .hdrParams = "", .extraArgs = {} } },
        } } };

        EXPECT_THROW(registry.getCodec(VideoCodec::AV1), UnsupportedCodecException);
        EXPECT_THROW(registry.lookup(VideoCodec::AV1, Backend::Software), UnsupportedCodecException);
        EXPECT_THROW(registry.getBackends(VideoCodec::AV1), UnsupportedCodecException);
        EXPECT_NE(registry.lookup(VideoCodec::H264, Backend::Software), nullptr);
    }

    TEST(CapabilityRegistry, duplicateBackend)
    {
        std::vector<CapabilityRegistry::Entry> entries{ CapabilityRegistry::Entry{
            .descriptor = { .codec = VideoCodec::H264, .name = "H.264", .extension = ".mp4", .supportsHdr = false },
            .backends = {
                QsvParameters{ .encoder = "h264_qsv", .preset = "fast", .globalQuality = 20, .lookAhead = false },
                QsvParameters{ .encoder = "h264_qsv", .preset = "slow", .globalQuality = 20, .lookAhead = false },
            },
        } };

        EXPECT_THROW(CapabilityRegistry{ std::move(entries) }, Exception);
    }

    TEST(Types, stringConversions)
    {
        EXPECT_EQ(videoCodecFromString("HEVC"), VideoCodec::HEVC);
        EXPECT_EQ(videoCodecFromString("h265"), VideoCodec::HEVC);
        EXPECT_EQ(videoCodecFromString("vp9"), VideoCodec::VP9);
        EXPECT_EQ(videoCodecFromString("mpeg2video"), std::nullopt);
        EXPECT_EQ(toString(VideoCodec::AV1), "av1");

        EXPECT_EQ(backendFromString("Intel"), Backend::Intel);
        EXPECT_EQ(backendFromString("cpu"), std::nullopt);
        EXPECT_EQ(toString(Backend::Software), "software");
        EXPECT_FALSE(isHardware(Backend::Software));
        EXPECT_TRUE(isHardware(Backend::Amd));
    }
} // namespace vconv::av::tests
