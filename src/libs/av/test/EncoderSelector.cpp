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

#include <algorithm>

#include <gtest/gtest.h>

#include "av/CapabilityRegistry.hpp"
#include "av/EncoderSelector.hpp"
#include "av/Exception.hpp"

namespace vconv::av::tests
{
    namespace
    {
        // Excerpt of 'ffmpeg -hide_banner -encoders'
        constexpr std::string_view nvidiaListing{ R"(Encoders:
 V..... = Video
 ------
 V....D libx264              libx264 H.264 / AVC / MPEG-4 AVC / MPEG-4 part 10 (codec h264)
 V....D h264_nvenc           NVIDIA NVENC H.264 encoder (codec h264)
 V....D libx265              libx265 H.265 / HEVC (codec hevc)
 V....D hevc_nvenc           NVIDIA NVENC hevc encoder (codec hevc)
 V....D libvpx-vp9           libvpx VP9 (codec vp9)
 A....D aac                  AAC (Advanced Audio Coding))" };

        constexpr std::string_view intelListing{ R"(Encoders:
 V..... h264_qsv             H.264 / AVC / MPEG-4 AVC / MPEG-4 part 10 (Intel Quick Sync Video acceleration) (codec h264)
 V..... hevc_qsv             HEVC (Intel Quick Sync Video acceleration) (codec hevc)
 V..... vp9_qsv              VP9 video (Intel Quick Sync Video acceleration) (codec vp9)
 V..... av1_qsv              AV1 (Intel Quick Sync Video acceleration) (codec av1))" };
    } // namespace

    TEST(HardwareCapabilities, parseNvidiaListing)
    {
        const HardwareCapabilities capabilities{ parseEncoderListing(nvidiaListing, getDefaultCapabilityRegistry()) };

        EXPECT_EQ(capabilities.getDetectedBackend(), Backend::Nvidia);
        EXPECT_TRUE(capabilities.hasHardwareBackend());
        EXPECT_TRUE(capabilities.isAvailable(VideoCodec::HEVC, Backend::Nvidia));
        EXPECT_TRUE(capabilities.isAvailable(VideoCodec::H264, Backend::Nvidia));
        EXPECT_FALSE(capabilities.isAvailable(VideoCodec::AV1, Backend::Nvidia));
        EXPECT_FALSE(capabilities.isAvailable(VideoCodec::HEVC, Backend::Intel));
        EXPECT_TRUE(capabilities.isAvailable(VideoCodec::AV1, Backend::Software));
    }

    TEST(HardwareCapabilities, parseIntelListing)
    {
        const HardwareCapabilities capabilities{ parseEncoderListing(intelListing, getDefaultCapabilityRegistry()) };

        EXPECT_EQ(capabilities.getDetectedBackend(), Backend::Intel);
        EXPECT_EQ(capabilities.getAvailableHardwareBackends(VideoCodec::VP9), std::vector<Backend>{ Backend::Intel });
    }

    TEST(HardwareCapabilities, parseEmptyListing)
    {
        const HardwareCapabilities capabilities{ parseEncoderListing("", getDefaultCapabilityRegistry()) };

        EXPECT_EQ(capabilities.getDetectedBackend(), Backend::Software);
        EXPECT_FALSE(capabilities.hasHardwareBackend());
        EXPECT_TRUE(capabilities.getAvailableHardwareBackends(VideoCodec::HEVC).empty());
    }

    TEST(HardwareCapabilities, vendorWithoutHevc)
    {
        const HardwareCapabilities capabilities{ parseEncoderListing(" V..... h264_amf  AMD AMF H.264 Encoder (codec h264)", getDefaultCapabilityRegistry()) };

        EXPECT_EQ(capabilities.getDetectedBackend(), Backend::Amd);
        EXPECT_TRUE(capabilities.isAvailable(VideoCodec::H264, Backend::Amd));
        EXPECT_FALSE(capabilities.isAvailable(VideoCodec::HEVC, Backend::Amd));
    }

    TEST(EncoderSelector, hardwarePreferred)
    {
        const EncoderSelector selector{ getDefaultCapabilityRegistry(), parseEncoderListing(nvidiaListing, getDefaultCapabilityRegistry()) };

        const EncoderSelection selection{ selector.select(VideoCodec::HEVC) };
        EXPECT_EQ(selection.backend, Backend::Nvidia);
        EXPECT_EQ(getEncoderName(selection.parameters), "hevc_nvenc");

        const EncoderSelection softwareSelection{ selector.select(VideoCodec::HEVC, false) };
        EXPECT_EQ(softwareSelection.backend, Backend::Software);
        EXPECT_EQ(getEncoderName(softwareSelection.parameters), "libx265");
    }

    TEST(EncoderSelector, perCodecAvailability)
    {
        const EncoderSelector selector{ getDefaultCapabilityRegistry(), parseEncoderListing(nvidiaListing, getDefaultCapabilityRegistry()) };

        // av1_nvenc not listed even though nvidia is detected
        const EncoderSelection selection{ selector.select(VideoCodec::AV1) };
        EXPECT_EQ(selection.backend, Backend::Software);
        EXPECT_EQ(getEncoderName(selection.parameters), "libsvtav1");
    }

    TEST(EncoderSelector, registryGap)
    {
        // Claims vp9 support for nvidia although nothing is registered for it
        const HardwareCapabilities capabilities{ Backend::Nvidia, { { VideoCodec::VP9, { Backend::Nvidia } } } };
        const EncoderSelector selector{ getDefaultCapabilityRegistry(), capabilities };

        const EncoderSelection selection{ selector.select(VideoCodec::VP9) };
        EXPECT_EQ(selection.backend, Backend::Software);
        EXPECT_EQ(getEncoderName(selection.parameters), "libvpx-vp9");
    }

    TEST(EncoderSelector, selectedBackendIsAlwaysRegistered)
    {
        const CapabilityRegistry& registry{ getDefaultCapabilityRegistry() };
        constexpr Backend backends[]{ Backend::Nvidia, Backend::Amd, Backend::Intel, Backend::Software };

        for (const Backend detected : backends)
        {
            HardwareCapabilities::BackendsByCodec availableBackends;
            for (const VideoCodec codec : registry.getOutputCodecs())
                availableBackends[codec].insert(detected);

            const EncoderSelector selector{ registry, HardwareCapabilities{ detected, availableBackends } };
            for (const VideoCodec codec : registry.getOutputCodecs())
            {
                for (const bool preferHardware : { true, false })
                {
                    const EncoderSelection selection{ selector.select(codec, preferHardware) };
                    const std::vector<Backend> registered{ registry.getBackends(codec) };

                    EXPECT_NE(std::find(std::cbegin(registered), std::cend(registered), selection.backend), std::cend(registered)) << "codec = " << toString(codec) << ", detected = " << toString(detected);
                    EXPECT_EQ(getBackend(selection.parameters), selection.backend);
                    if (!preferHardware)
                        EXPECT_EQ(selection.backend, Backend::Software);
                }
            }
        }
    }

    TEST(EncoderSelector, deterministic)
    {
        const EncoderSelector selector{ getDefaultCapabilityRegistry(), parseEncoderListing(intelListing, getDefaultCapabilityRegistry()) };

        for (int i{}; i < 3; ++i)
        {
            const EncoderSelection selection{ selector.select(VideoCodec::VP9) };
            EXPECT_EQ(selection.backend, Backend::Intel);
            EXPECT_EQ(getEncoderName(selection.parameters), "vp9_qsv");
        }
    }

    TEST(EncoderSelector, unsupportedCodec)
    {
        const CapabilityRegistry registry{ std::vector<CapabilityRegistry::Entry>{ CapabilityRegistry::Entry{
            .descriptor = { .codec = VideoCodec::H264, .name = "H.264", .extension = ".mp4", .supportsHdr = false },
            .backends = { SoftwareParameters{ .encoder = "libx264", .preset = "fast", .crf = 20, .hdrParamsOption = "", .hdrParams = "", .extraArgs = {} } },
        } } };
        const EncoderSelector selector{ registry, HardwareCapabilities{} };

        EXPECT_THROW(selector.select(VideoCodec::HEVC), UnsupportedCodecException);
    }
} // namespace vconv::av::tests
