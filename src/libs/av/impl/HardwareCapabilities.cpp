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

#include "av/HardwareCapabilities.hpp"

#include "av/BackendParameters.hpp"
#include "av/CapabilityRegistry.hpp"
#include "core/IChildProcessManager.hpp"
#include "core/ILogger.hpp"

#include "ToolRunner.hpp"

namespace vconv::av
{
    namespace
    {
        constexpr Backend hardwareBackends[]{ Backend::Nvidia, Backend::Amd, Backend::Intel };

        bool isListed(const HardwareCapabilities::BackendsByCodec& availableBackends, VideoCodec codec, Backend backend)
        {
            const auto it{ availableBackends.find(codec) };
            return it != std::cend(availableBackends) && it->second.contains(backend);
        }

        Backend selectGlobalBackend(const HardwareCapabilities::BackendsByCodec& availableBackends)
        {
            // HEVC support is what identifies a usable vendor
            for (const Backend backend : hardwareBackends)
            {
                if (isListed(availableBackends, VideoCodec::HEVC, backend))
                    return backend;
            }

            for (const Backend backend : hardwareBackends)
            {
                for (const auto& [codec, backends] : availableBackends)
                {
                    if (backends.contains(backend))
                        return backend;
                }
            }

            return Backend::Software;
        }
    } // namespace

    HardwareCapabilities::HardwareCapabilities(Backend detectedBackend, BackendsByCodec availableBackends)
        : _detectedBackend{ detectedBackend }
        , _availableBackends{ std::move(availableBackends) }
    {
    }

    bool HardwareCapabilities::isAvailable(VideoCodec codec, Backend backend) const
    {
        if (backend == Backend::Software)
            return true;

        return isListed(_availableBackends, codec, backend);
    }

    std::vector<Backend> HardwareCapabilities::getAvailableHardwareBackends(VideoCodec codec) const
    {
        std::vector<Backend> res;
        for (const Backend backend : hardwareBackends)
        {
            if (isAvailable(codec, backend))
                res.push_back(backend);
        }

        return res;
    }

    HardwareCapabilities parseEncoderListing(std::string_view listing, const CapabilityRegistry& registry)
    {
        HardwareCapabilities::BackendsByCodec availableBackends;

        for (const VideoCodec codec : registry.getOutputCodecs())
        {
            for (const Backend backend : registry.getBackends(codec))
            {
                if (!isHardware(backend))
                    continue;

                const std::string& encoderName{ getEncoderName(*registry.lookup(codec, backend)) };
                if (listing.find(encoderName) != std::string_view::npos)
                {
                    VCONV_LOG(ENCODING, DEBUG, "Found hardware encoder '" << encoderName << "'");
                    availableBackends[codec].insert(backend);
                }
            }
        }

        const Backend detectedBackend{ selectGlobalBackend(availableBackends) };
        return HardwareCapabilities{ detectedBackend, std::move(availableBackends) };
    }

    HardwareCapabilities detectHardwareCapabilities(core::IChildProcessManager& childProcessManager, const std::filesystem::path& ffmpegPath, const CapabilityRegistry& registry, std::chrono::milliseconds timeout)
    {
        VCONV_LOG(ENCODING, DEBUG, "Detecting hardware encoders using '" << ffmpegPath.string() << "'...");

        try
        {
            const ToolOutput toolOutput{ runTool(childProcessManager, ffmpegPath, { "-hide_banner", "-encoders" }, timeout) };
            if (!toolOutput.succeeded())
            {
                if (!toolOutput.completed)
                    VCONV_LOG(ENCODING, WARNING, "Hardware detection timed out, using software encoding only");
                else
                    VCONV_LOG(ENCODING, WARNING, "Hardware detection failed (exit code " << (toolOutput.exitCode ? std::to_string(*toolOutput.exitCode) : "none") << "), using software encoding only");

                return HardwareCapabilities{};
            }

            HardwareCapabilities capabilities{ parseEncoderListing(toolOutput.output, registry) };
            VCONV_LOG(ENCODING, INFO, "Detected encoding backend: " << toString(capabilities.getDetectedBackend()));
            return capabilities;
        }
        catch (const core::ChildProcessException& e)
        {
            VCONV_LOG(ENCODING, WARNING, "Cannot run '" << ffmpegPath.string() << "': " << e.what() << ", using software encoding only");
        }

        return HardwareCapabilities{};
    }

    bool validateEncoder(core::IChildProcessManager& childProcessManager, const std::filesystem::path& ffmpegPath, std::chrono::milliseconds timeout)
    {
        try
        {
            const ToolOutput toolOutput{ runTool(childProcessManager, ffmpegPath, { "-version" }, timeout) };
            if (toolOutput.succeeded())
                return true;

            VCONV_LOG(ENCODING, ERROR, "'" << ffmpegPath.string() << " -version' failed");
        }
        catch (const core::ChildProcessException& e)
        {
            VCONV_LOG(ENCODING, ERROR, "Cannot run '" << ffmpegPath.string() << "': " << e.what());
        }

        return false;
    }
} // namespace vconv::av
