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
#include <variant>
#include <vector>

#include "av/Types.hpp"

namespace vconv::av
{
    // Each backend has its own vocabulary, mixing them is an error for ffmpeg

    struct NvencParameters
    {
        std::string encoder;
        std::string preset;
        std::string rateControl;
        unsigned constantQuality{};
        std::string bRefMode; // empty if unused
        bool spatialAq{};
        bool temporalAq{};
    };

    struct AmfParameters
    {
        std::string encoder;
        std::string quality;
        std::string rateControl;
        unsigned qp{}; // applied to I, P and B frames
    };

    struct QsvParameters
    {
        std::string encoder;
        std::string preset;
        unsigned globalQuality{};
        bool lookAhead{};
    };

    struct SoftwareParameters
    {
        std::string encoder;
        std::string preset; // empty if the encoder has no preset
        unsigned crf{};
        // Encoder specific HDR signaling, only emitted when HDR is preserved
        std::string hdrParamsOption;
        std::string hdrParams;
        std::vector<std::string> extraArgs;
    };

    using BackendParameters = std::variant<NvencParameters, AmfParameters, QsvParameters, SoftwareParameters>;

    Backend getBackend(const BackendParameters& parameters);
    const std::string& getEncoderName(const BackendParameters& parameters);
    unsigned getQuality(const BackendParameters& parameters);
} // namespace vconv::av
