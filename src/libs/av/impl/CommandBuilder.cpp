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

#include "av/CommandBuilder.hpp"

#include <iterator>
#include <type_traits>

#include "av/CapabilityRegistry.hpp"
#include "av/MediaInfo.hpp"
#include "core/ILogger.hpp"
#include "core/String.hpp"

namespace vconv::av
{
    namespace
    {
        using Args = core::IChildProcess::Args;

        void addArg(Args& args, std::string_view option, std::string value)
        {
            args.emplace_back(option);
            args.push_back(std::move(value));
        }

        void addEncoderArgs(Args& args, const NvencParameters& params, std::optional<unsigned> quality)
        {
            addArg(args, "-preset", params.preset);
            addArg(args, "-rc", params.rateControl);
            addArg(args, "-cq", std::to_string(quality.value_or(params.constantQuality)));
            if (!params.bRefMode.empty())
                addArg(args, "-b_ref_mode", params.bRefMode);
            if (params.spatialAq)
                addArg(args, "-spatial_aq", "1");
            if (params.temporalAq)
                addArg(args, "-temporal_aq", "1");
        }

        void addEncoderArgs(Args& args, const AmfParameters& params, std::optional<unsigned> quality)
        {
            const std::string qp{ std::to_string(quality.value_or(params.qp)) };

            addArg(args, "-quality", params.quality);
            addArg(args, "-rc", params.rateControl);
            addArg(args, "-qp_i", qp);
            addArg(args, "-qp_p", qp);
            addArg(args, "-qp_b", qp);
        }

        void addEncoderArgs(Args& args, const QsvParameters& params, std::optional<unsigned> quality)
        {
            addArg(args, "-preset", params.preset);
            addArg(args, "-global_quality", std::to_string(quality.value_or(params.globalQuality)));
            if (params.lookAhead)
                addArg(args, "-look_ahead", "1");
        }

        void addEncoderArgs(Args& args, const SoftwareParameters& params, std::optional<unsigned> quality, bool preserveHdr)
        {
            if (!params.preset.empty())
                addArg(args, "-preset", params.preset);
            addArg(args, "-crf", std::to_string(quality.value_or(params.crf)));
            args.insert(std::end(args), std::cbegin(params.extraArgs), std::cend(params.extraArgs));

            if (preserveHdr && !params.hdrParamsOption.empty())
                addArg(args, params.hdrParamsOption, params.hdrParams);
        }

        void addColorArgs(Args& args, const ColorParameters& colorParameters)
        {
            addArg(args, "-color_primaries", colorParameters.primaries);
            addArg(args, "-color_trc", colorParameters.transfer);
            addArg(args, "-colorspace", colorParameters.space);
            addArg(args, "-color_range", colorParameters.range);
        }
    } // namespace

    HdrFormat classifyHdrFormat(std::string_view colorTransfer)
    {
        const std::string transfer{ core::stringUtils::stringToLower(colorTransfer) };

        if (transfer.find("arib-std-b67") != std::string::npos || transfer.find("hlg") != std::string::npos)
            return HdrFormat::Hlg;
        if (transfer.find("smpte2084") != std::string::npos || transfer.find("pq") != std::string::npos)
            return HdrFormat::Hdr10;

        return HdrFormat::Other;
    }

    const ColorParameters& getHdr10ColorParameters()
    {
        static const ColorParameters hdr10{ .primaries = "bt2020", .transfer = "smpte2084", .space = "bt2020nc", .range = "tv" };
        return hdr10;
    }

    const ColorParameters& getHlgColorParameters()
    {
        static const ColorParameters hlg{ .primaries = "bt2020", .transfer = "arib-std-b67", .space = "bt2020nc", .range = "tv" };
        return hlg;
    }

    ColorParameters resolveHardwareColorParameters(const MediaInfo* sourceInfo, Backend backend)
    {
        const StreamInfo* videoStream{ sourceInfo ? getVideoStream(*sourceInfo) : nullptr };
        if (!videoStream)
        {
            VCONV_LOG(ENCODING, INFO, "Cannot detect source color metadata, using default HDR10 parameters");
            return getHdr10ColorParameters();
        }

        const HdrFormat format{ classifyHdrFormat(videoStream->colorTransfer.value_or("")) };
        switch (format)
        {
        case HdrFormat::Hlg:
            if (backend == Backend::Nvidia)
            {
                VCONV_LOG(ENCODING, WARNING, "HLG content detected, NVENC has limited HLG support: using HDR10 parameters");
                return getHdr10ColorParameters();
            }
            return getHlgColorParameters();

        case HdrFormat::Hdr10:
            return getHdr10ColorParameters();

        case HdrFormat::Other:
            break;
        }

        const ColorParameters& defaults{ getHdr10ColorParameters() };
        return ColorParameters{
            .primaries = videoStream->colorPrimaries.value_or(defaults.primaries),
            .transfer = videoStream->colorTransfer.value_or(defaults.transfer),
            .space = videoStream->colorSpace.value_or(defaults.space),
            .range = videoStream->colorRange.value_or(defaults.range),
        };
    }

    CommandBuilder::CommandBuilder(const CapabilityRegistry& registry, IMediaProber& prober)
        : _registry{ registry }
        , _prober{ prober }
    {
    }

    core::IChildProcess::Args CommandBuilder::buildEncoderArguments(const ConversionRequest& request, const EncoderSelection& selection, const MediaInfo* sourceInfo) const
    {
        const bool preserveHdr{ request.preserveHdr && _registry.getCodec(request.codec).supportsHdr };
        const bool software{ selection.backend == Backend::Software };

        Args args;
        addArg(args, "-c:v", getEncoderName(selection.parameters));

        std::visit([&](const auto& params) {
            using ParamsType = std::decay_t<decltype(params)>;
            if constexpr (std::is_same_v<ParamsType, SoftwareParameters>)
                addEncoderArgs(args, params, request.quality, preserveHdr);
            else
                addEncoderArgs(args, params, request.quality);
        },
            selection.parameters);

        if (preserveHdr)
        {
            if (software)
            {
                // Software encoders pass the source color metadata through
                addColorArgs(args, ColorParameters{ .primaries = "copy", .transfer = "copy", .space = "copy", .range = "copy" });
            }
            else
            {
                std::optional<MediaInfo> probedInfo;
                if (!sourceInfo)
                {
                    probedInfo = _prober.probe(request.inputFile);
                    if (probedInfo)
                        sourceInfo = &(*probedInfo);
                }

                const ColorParameters colorParameters{ resolveHardwareColorParameters(sourceInfo, selection.backend) };
                VCONV_LOG(ENCODING, DEBUG, "Using " << toString(selection.backend) << " HDR parameters: " << colorParameters.primaries << "/" << colorParameters.transfer << "/" << colorParameters.space << "/" << colorParameters.range);

                addColorArgs(args, colorParameters);
            }

            addArg(args, "-map_metadata", "0");
            if (software)
                addArg(args, "-movflags", "+write_colr");
        }

        addArg(args, "-c:a", "copy");

        if (software)
        {
            addArg(args, "-c:s", "copy");
            addArg(args, "-map", "0");
        }
        else
        {
            // Hardware encoders do not cope well with complex inputs
            addArg(args, "-map", "0:v:0");
            addArg(args, "-map", "0:a?");
        }

        return args;
    }

    core::IChildProcess::Args CommandBuilder::build(const ConversionRequest& request, const EncoderSelection& selection, const MediaInfo* sourceInfo) const
    {
        Args args{ "-y", "-i", request.inputFile.string() };

        Args encoderArgs{ buildEncoderArguments(request, selection, sourceInfo) };
        args.insert(std::end(args), std::make_move_iterator(std::begin(encoderArgs)), std::make_move_iterator(std::end(encoderArgs)));

        args.push_back(request.outputFile.string());
        return args;
    }
} // namespace vconv::av
