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

#include <string>
#include <string_view>

#include "av/ConversionRequest.hpp"
#include "av/EncoderSelector.hpp"
#include "core/IChildProcess.hpp"

namespace vconv::av
{
    class CapabilityRegistry;
    class IMediaProber;
    struct MediaInfo;

    enum class HdrFormat
    {
        Hlg,
        Hdr10,
        Other,
    };

    struct ColorParameters
    {
        std::string primaries;
        std::string transfer;
        std::string space;
        std::string range;

        bool operator==(const ColorParameters&) const = default;
    };

    HdrFormat classifyHdrFormat(std::string_view colorTransfer);
    const ColorParameters& getHdr10ColorParameters();
    const ColorParameters& getHlgColorParameters();

    // Color parameters for hardware encoders, which cannot copy them from the source
    // A missing source or video stream gives HDR10 parameters
    ColorParameters resolveHardwareColorParameters(const MediaInfo* sourceInfo, Backend backend);

    class CommandBuilder
    {
    public:
        CommandBuilder(const CapabilityRegistry& registry, IMediaProber& prober);

        // Arguments to be placed between the input and the output files
        // The input file is probed if sourceInfo is not given and hardware HDR parameters are needed
        core::IChildProcess::Args buildEncoderArguments(const ConversionRequest& request, const EncoderSelection& selection, const MediaInfo* sourceInfo = nullptr) const;

        // "-y -i <input> <encoder arguments> <output>", the executable is not included
        core::IChildProcess::Args build(const ConversionRequest& request, const EncoderSelection& selection, const MediaInfo* sourceInfo = nullptr) const;

    private:
        const CapabilityRegistry& _registry;
        IMediaProber& _prober;
    };
} // namespace vconv::av
