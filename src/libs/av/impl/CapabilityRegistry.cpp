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

#include "av/CapabilityRegistry.hpp"

#include <algorithm>

#include "av/Exception.hpp"

namespace vconv::av
{
    namespace
    {
        // Static HDR10 signaling for libx265, the color values are copied from the source by ffmpeg
        constexpr const char* x265HdrParams{ "hdr-opt=1:repeat-headers=1:colorprim=bt2020:transfer=smpte2084:colormatrix=bt2020nc" };

        std::vector<CapabilityRegistry::Entry> createDefaultEntries()
        {
            std::vector<CapabilityRegistry::Entry> entries;

            entries.push_back(CapabilityRegistry::Entry{
                .descriptor = { .codec = VideoCodec::HEVC, .name = "HEVC (H.265)", .extension = ".mkv", .supportsHdr = true },
                .backends = {
                    NvencParameters{ .encoder = "hevc_nvenc", .preset = "p4", .rateControl = "vbr", .constantQuality = 23, .bRefMode = "middle", .spatialAq = true, .temporalAq = true },
                    AmfParameters{ .encoder = "hevc_amf", .quality = "balanced", .rateControl = "cqp", .qp = 23 },
                    QsvParameters{ .encoder = "hevc_qsv", .preset = "medium", .globalQuality = 23, .lookAhead = true },
                    SoftwareParameters{ .encoder = "libx265", .preset = "medium", .crf = 23, .hdrParamsOption = "-x265-params", .hdrParams = x265HdrParams, .extraArgs = {} },
                },
            });

            entries.push_back(CapabilityRegistry::Entry{
                .descriptor = { .codec = VideoCodec::H264, .name = "H.264 (AVC)", .extension = ".mp4", .supportsHdr = false },
                .backends = {
                    NvencParameters{ .encoder = "h264_nvenc", .preset = "p4", .rateControl = "vbr", .constantQuality = 23, .bRefMode = "", .spatialAq = false, .temporalAq = false },
                    AmfParameters{ .encoder = "h264_amf", .quality = "balanced", .rateControl = "cqp", .qp = 23 },
                    QsvParameters{ .encoder = "h264_qsv", .preset = "medium", .globalQuality = 23, .lookAhead = false },
                    SoftwareParameters{ .encoder = "libx264", .preset = "medium", .crf = 23, .hdrParamsOption = "", .hdrParams = "", .extraArgs = {} },
                },
            });

            entries.push_back(CapabilityRegistry::Entry{
                .descriptor = { .codec = VideoCodec::AV1, .name = "AV1", .extension = ".mkv", .supportsHdr = true },
                .backends = {
                    NvencParameters{ .encoder = "av1_nvenc", .preset = "p4", .rateControl = "vbr", .constantQuality = 30, .bRefMode = "", .spatialAq = false, .temporalAq = false },
                    AmfParameters{ .encoder = "av1_amf", .quality = "balanced", .rateControl = "cqp", .qp = 30 },
                    QsvParameters{ .encoder = "av1_qsv", .preset = "medium", .globalQuality = 30, .lookAhead = false },
                    SoftwareParameters{ .encoder = "libsvtav1", .preset = "8", .crf = 30, .hdrParamsOption = "", .hdrParams = "", .extraArgs = {} },
                },
            });

            // No NVENC nor AMF VP9 encoders
            entries.push_back(CapabilityRegistry::Entry{
                .descriptor = { .codec = VideoCodec::VP9, .name = "VP9", .extension = ".webm", .supportsHdr = false },
                .backends = {
                    QsvParameters{ .encoder = "vp9_qsv", .preset = "medium", .globalQuality = 30, .lookAhead = false },
                    SoftwareParameters{ .encoder = "libvpx-vp9", .preset = "", .crf = 30, .hdrParamsOption = "", .hdrParams = "", .extraArgs = { "-deadline", "good", "-b:v", "0" } },
                },
            });

            return entries;
        }
    } // namespace

    const CapabilityRegistry& getDefaultCapabilityRegistry()
    {
        static const CapabilityRegistry registry{ createDefaultEntries() };
        return registry;
    }

    CapabilityRegistry::CapabilityRegistry(std::vector<Entry> entries)
    {
        for (Entry& entry : entries)
        {
            std::sort(std::begin(entry.backends), std::end(entry.backends), [](const BackendParameters& lhs, const BackendParameters& rhs) { return getBackend(lhs) < getBackend(rhs); });

            const auto itDuplicate{ std::adjacent_find(std::cbegin(entry.backends), std::cend(entry.backends), [](const BackendParameters& lhs, const BackendParameters& rhs) { return getBackend(lhs) == getBackend(rhs); }) };
            if (itDuplicate != std::cend(entry.backends))
                throw Exception{ "Codec '" + std::string{ toString(entry.descriptor.codec) } + "' has several parameter sets for backend '" + std::string{ toString(getBackend(*itDuplicate)) } + "'" };

            const VideoCodec codec{ entry.descriptor.codec };
            if (!_entries.emplace(codec, std::move(entry)).second)
                throw Exception{ "Codec '" + std::string{ toString(codec) } + "' registered twice" };
        }
    }

    const CapabilityRegistry::Entry& CapabilityRegistry::getEntry(VideoCodec codec) const
    {
        const auto it{ _entries.find(codec) };
        if (it == std::cend(_entries))
            throw UnsupportedCodecException{ "Codec '" + std::string{ toString(codec) } + "' is not supported" };

        return it->second;
    }

    const CodecDescriptor& CapabilityRegistry::getCodec(VideoCodec codec) const
    {
        return getEntry(codec).descriptor;
    }

    const BackendParameters* CapabilityRegistry::lookup(VideoCodec codec, Backend backend) const
    {
        const Entry& entry{ getEntry(codec) };

        const auto it{ std::find_if(std::cbegin(entry.backends), std::cend(entry.backends), [=](const BackendParameters& parameters) { return getBackend(parameters) == backend; }) };
        if (it == std::cend(entry.backends))
            return nullptr;

        return &(*it);
    }

    std::vector<Backend> CapabilityRegistry::getBackends(VideoCodec codec) const
    {
        const Entry& entry{ getEntry(codec) };

        std::vector<Backend> res;
        std::transform(std::cbegin(entry.backends), std::cend(entry.backends), std::back_inserter(res), [](const BackendParameters& parameters) { return getBackend(parameters); });
        return res;
    }

    std::vector<VideoCodec> CapabilityRegistry::getOutputCodecs() const
    {
        std::vector<VideoCodec> res;
        for (const auto& [codec, entry] : _entries)
            res.push_back(codec);

        return res;
    }
} // namespace vconv::av
