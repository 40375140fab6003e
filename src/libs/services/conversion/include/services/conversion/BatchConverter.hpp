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

#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "av/Progress.hpp"
#include "av/Types.hpp"
#include "services/conversion/IProcessSupervisor.hpp"

namespace vconv::av
{
    class CapabilityRegistry;
    class IMediaProber;
    struct MediaInfo;
} // namespace vconv::av

namespace vconv::conversion
{
    class Converter;

    enum class ConversionStatus
    {
        Success,
        Failed,
        Skipped,
        Error, // unexpected exception
    };

    enum class SkipReason
    {
        AlreadyTargetCodec,
        DestinationExists,
    };

    const char* toString(ConversionStatus status);
    const char* toString(SkipReason reason);

    struct ConversionOutcome
    {
        ConversionStatus status{ ConversionStatus::Failed };
        std::filesystem::path inputFile;
        std::filesystem::path outputFile;
        std::optional<SkipReason> skipReason;
        std::string detail; // error message, if any
    };

    struct PlannedFile
    {
        std::filesystem::path inputFile;
        std::filesystem::path outputFile;
        std::optional<SkipReason> skipReason;
    };

    struct BatchResult
    {
        std::size_t total{};
        std::size_t successful{};
        std::size_t failed{}; // errors included
        std::size_t skipped{};
        std::vector<ConversionOutcome> outcomes; // same order as the input files
    };

    struct BatchParameters
    {
        std::optional<std::filesystem::path> outputDirectory; // next to each input file if not set
        av::VideoCodec codec{ av::VideoCodec::HEVC };
        std::optional<unsigned> quality;
        bool preserveHdr{ true };
        std::optional<std::string> suffix; // "_<codec>" if not set
    };

    struct BatchCallbacks
    {
        // index is zero based
        std::function<void(const std::filesystem::path& file, std::size_t index, std::size_t count, const av::ProgressSnapshot&)> onProgress;
        std::function<void(std::size_t index, std::size_t count, const ConversionOutcome&)> onFileDone;
    };

    // Sequential conversion of several files
    class BatchConverter
    {
    public:
        BatchConverter(const av::CapabilityRegistry& registry, av::IMediaProber& prober, Converter& converter);

        BatchConverter(const BatchConverter&) = delete;
        BatchConverter& operator=(const BatchConverter&) = delete;

        // Stops before the next file once shouldAbort returns true
        BatchResult convert(std::span<const std::filesystem::path> files, const BatchParameters& parameters, const BatchCallbacks& callbacks = {}, ShouldAbortCallback shouldAbort = {});

        // Destination and skip decision for a file, does not touch the filesystem
        // sourceInfo is the probe result of the file, nullptr if probing failed
        PlannedFile planFile(const std::filesystem::path& file, const av::MediaInfo* sourceInfo, const BatchParameters& parameters) const;

    private:
        void convertOne(ConversionOutcome& outcome, std::size_t index, std::size_t count, const BatchParameters& parameters, const BatchCallbacks& callbacks, const ShouldAbortCallback& shouldAbort);

        const av::CapabilityRegistry& _registry;
        av::IMediaProber& _prober;
        Converter& _converter;
    };
} // namespace vconv::conversion
