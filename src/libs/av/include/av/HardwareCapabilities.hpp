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
#include <map>
#include <set>
#include <string_view>
#include <vector>

#include "av/Types.hpp"

namespace vconv::core
{
    class IChildProcessManager;
}

namespace vconv::av
{
    class CapabilityRegistry;

    // Immutable once built, re-detection means building a new instance
    class HardwareCapabilities
    {
    public:
        using BackendsByCodec = std::map<VideoCodec, std::set<Backend>>;

        HardwareCapabilities() = default; // software only
        HardwareCapabilities(Backend detectedBackend, BackendsByCodec availableBackends);

        Backend getDetectedBackend() const { return _detectedBackend; }
        bool hasHardwareBackend() const { return isHardware(_detectedBackend); }

        // Software is always available
        bool isAvailable(VideoCodec codec, Backend backend) const;

        // Confirmed hardware backends, in preference order
        std::vector<Backend> getAvailableHardwareBackends(VideoCodec codec) const;

    private:
        Backend _detectedBackend{ Backend::Software };
        BackendsByCodec _availableBackends;
    };

    // Parses the output of 'ffmpeg -encoders'
    HardwareCapabilities parseEncoderListing(std::string_view listing, const CapabilityRegistry& registry);

    // Never throws: any failure leads to software only capabilities
    HardwareCapabilities detectHardwareCapabilities(core::IChildProcessManager& childProcessManager, const std::filesystem::path& ffmpegPath, const CapabilityRegistry& registry, std::chrono::milliseconds timeout);

    // true if 'ffmpeg -version' runs successfully
    bool validateEncoder(core::IChildProcessManager& childProcessManager, const std::filesystem::path& ffmpegPath, std::chrono::milliseconds timeout);
} // namespace vconv::av
