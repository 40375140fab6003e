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

#include <filesystem>
#include <optional>

#include "av/ConversionRequest.hpp"
#include "av/EncoderSelector.hpp"
#include "av/MediaInfo.hpp"
#include "core/IChildProcess.hpp"
#include "services/conversion/IProcessSupervisor.hpp"

namespace vconv::av
{
    class CommandBuilder;
} // namespace vconv::av

namespace vconv::conversion
{
    struct ConversionPlan
    {
        av::EncoderSelection selection;
        core::IChildProcess::Args args;
    };

    // Converts a single file, with one HDR-less retry for hardware encoders
    class Converter
    {
    public:
        struct Settings
        {
            bool preferHardware{ true };
        };

        Converter(const Settings& settings, const av::EncoderSelector& selector, av::IMediaProber& prober, const av::CommandBuilder& commandBuilder, IProcessSupervisor& supervisor);

        Converter(const Converter&) = delete;
        Converter& operator=(const Converter&) = delete;

        // Dry run: what would be executed for this request
        ConversionPlan plan(const av::ConversionRequest& request) const;

        // Return true if the output file has been produced
        // Refused if the output file is the input file
        // Partial output is removed on failure, an existing output file is only removed if written
        // throw av::UnsupportedCodecException, core::ChildProcessException
        bool convert(const av::ConversionRequest& request, ProgressCallback onProgress = {}, ShouldAbortCallback shouldAbort = {});

        // Same, sourceInfo being the probe result of the input file
        bool convert(const av::ConversionRequest& request, const std::optional<av::MediaInfo>& sourceInfo, ProgressCallback onProgress = {}, ShouldAbortCallback shouldAbort = {});

    private:
        RunResult runAttempt(const av::ConversionRequest& request, const av::EncoderSelection& selection, const av::MediaInfo& sourceInfo, const ProgressCallback& onProgress, const ShouldAbortCallback& shouldAbort);

        const Settings _settings;
        const av::EncoderSelector& _selector;
        av::IMediaProber& _prober;
        const av::CommandBuilder& _commandBuilder;
        IProcessSupervisor& _supervisor;
    };
} // namespace vconv::conversion
