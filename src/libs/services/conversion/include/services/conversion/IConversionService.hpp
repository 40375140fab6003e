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

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "av/ConversionRequest.hpp"
#include "av/EncoderSelector.hpp"
#include "av/HardwareCapabilities.hpp"
#include "av/MediaInfo.hpp"
#include "services/conversion/BatchConverter.hpp"
#include "services/conversion/Converter.hpp"
#include "services/conversion/IProcessSupervisor.hpp"

namespace vconv::core
{
    class IChildProcessManager;
}

namespace vconv::conversion
{
    class IConversionService
    {
    public:
        virtual ~IConversionService() = default;

        virtual const av::HardwareCapabilities& getHardwareCapabilities() const = 0;
        // Runs the hardware detection again
        virtual void refreshHardwareCapabilities() = 0;
        virtual bool validateEncoder() = 0;

        // Dry run queries
        virtual av::EncoderSelection selectEncoder(av::VideoCodec codec) const = 0;
        virtual ConversionPlan planConversion(const av::ConversionRequest& request) const = 0;
        // Same decisions as convertFiles, the input files are probed but nothing is written
        virtual std::vector<PlannedFile> planConversions(std::span<const std::filesystem::path> files, const BatchParameters& parameters) = 0;
        // Destination that would be used for the given file, nothing is created
        virtual std::filesystem::path getOutputFile(const std::filesystem::path& inputFile, const BatchParameters& parameters) const = 0;
        virtual std::string estimateConversionTime(std::uintmax_t fileSize) const = 0;

        virtual std::optional<av::MediaInfo> probe(const std::filesystem::path& file) = 0;

        // Sorted list of video files, optionally restricted to a source codec
        virtual std::vector<std::filesystem::path> findVideoFiles(const std::filesystem::path& directory, std::optional<av::VideoCodec> sourceCodec = std::nullopt, bool recursive = true) = 0;

        virtual bool convertFile(const av::ConversionRequest& request, ProgressCallback onProgress = {}) = 0;
        virtual BatchResult convertFiles(std::span<const std::filesystem::path> files, const BatchParameters& parameters, const BatchCallbacks& callbacks = {}) = 0;

        // Cancels the running conversion, or the next one if none is running
        // Can be called from any thread
        virtual void abort() = 0;
    };

    // Settings are read from the registered core::IConfig service, if any
    std::unique_ptr<IConversionService> createConversionService(core::IChildProcessManager& childProcessManager);
} // namespace vconv::conversion
