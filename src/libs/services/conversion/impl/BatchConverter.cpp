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

#include "services/conversion/BatchConverter.hpp"

#include "av/CapabilityRegistry.hpp"
#include "av/ConversionRequest.hpp"
#include "av/MediaInfo.hpp"
#include "core/ILogger.hpp"
#include "services/conversion/Converter.hpp"
#include "services/conversion/FileUtils.hpp"

namespace vconv::conversion
{
    const char* toString(ConversionStatus status)
    {
        switch (status)
        {
        case ConversionStatus::Success:
            return "success";
        case ConversionStatus::Failed:
            return "failed";
        case ConversionStatus::Skipped:
            return "skipped";
        case ConversionStatus::Error:
            return "error";
        }
        return "";
    }

    const char* toString(SkipReason reason)
    {
        switch (reason)
        {
        case SkipReason::AlreadyTargetCodec:
            return "already in target codec";
        case SkipReason::DestinationExists:
            return "destination exists";
        }
        return "";
    }

    BatchConverter::BatchConverter(const av::CapabilityRegistry& registry, av::IMediaProber& prober, Converter& converter)
        : _registry{ registry }
        , _prober{ prober }
        , _converter{ converter }
    {
    }

    BatchResult BatchConverter::convert(std::span<const std::filesystem::path> files, const BatchParameters& parameters, const BatchCallbacks& callbacks, ShouldAbortCallback shouldAbort)
    {
        BatchResult result;
        result.total = files.size();

        VCONV_LOG(CONVERSION, INFO, "Starting batch conversion of " << files.size() << " file(s) to " << _registry.getCodec(parameters.codec).name);

        for (std::size_t index{}; index < files.size(); ++index)
        {
            if (shouldAbort && shouldAbort())
            {
                VCONV_LOG(CONVERSION, INFO, "Batch conversion aborted, " << (files.size() - index) << " file(s) not processed");
                break;
            }

            ConversionOutcome outcome;
            outcome.inputFile = files[index];
            try
            {
                convertOne(outcome, index, files.size(), parameters, callbacks, shouldAbort);
            }
            catch (const std::exception& e)
            {
                VCONV_LOG(CONVERSION, ERROR, "Error while converting '" << outcome.inputFile.string() << "': " << e.what());
                outcome.status = ConversionStatus::Error;
                outcome.skipReason.reset();
                outcome.detail = e.what();
            }

            switch (outcome.status)
            {
            case ConversionStatus::Success:
                result.successful++;
                break;
            case ConversionStatus::Skipped:
                result.skipped++;
                break;
            case ConversionStatus::Failed:
            case ConversionStatus::Error:
                result.failed++;
                break;
            }

            if (callbacks.onFileDone)
                callbacks.onFileDone(index, files.size(), outcome);

            result.outcomes.push_back(std::move(outcome));
        }

        VCONV_LOG(CONVERSION, INFO, "Batch conversion done: " << result.successful << " converted, " << result.failed << " failed, " << result.skipped << " skipped (" << result.total << " total)");

        return result;
    }

    PlannedFile BatchConverter::planFile(const std::filesystem::path& file, const av::MediaInfo* sourceInfo, const BatchParameters& parameters) const
    {
        PlannedFile res;
        res.inputFile = file;
        res.outputFile = generateOutputPath(file, parameters.outputDirectory, _registry.getCodec(parameters.codec), parameters.suffix ? *parameters.suffix : getDefaultSuffix(parameters.codec));

        const std::optional<std::string> codecName{ sourceInfo ? av::getVideoCodecName(*sourceInfo) : std::nullopt };
        std::error_code ec;
        if (codecName && av::videoCodecFromString(*codecName) == parameters.codec)
            res.skipReason = SkipReason::AlreadyTargetCodec;
        else if (std::filesystem::exists(res.outputFile, ec))
            res.skipReason = SkipReason::DestinationExists;

        return res;
    }

    void BatchConverter::convertOne(ConversionOutcome& outcome, std::size_t index, std::size_t count, const BatchParameters& parameters, const BatchCallbacks& callbacks, const ShouldAbortCallback& shouldAbort)
    {
        const std::filesystem::path& file{ outcome.inputFile };
        VCONV_LOG(CONVERSION, INFO, "[" << (index + 1) << "/" << count << "] " << file.string());

        const std::optional<av::MediaInfo> sourceInfo{ _prober.probe(file) };
        const PlannedFile planned{ planFile(file, sourceInfo ? &(*sourceInfo) : nullptr, parameters) };
        outcome.outputFile = planned.outputFile;

        if (planned.skipReason)
        {
            VCONV_LOG(CONVERSION, INFO, "Skipping '" << file.string() << "': " << toString(*planned.skipReason));
            outcome.status = ConversionStatus::Skipped;
            outcome.skipReason = planned.skipReason;
            return;
        }

        const av::ConversionRequest request{
            .inputFile = file,
            .outputFile = outcome.outputFile,
            .codec = parameters.codec,
            .quality = parameters.quality,
            .preserveHdr = parameters.preserveHdr,
        };

        ProgressCallback onProgress;
        if (callbacks.onProgress)
        {
            onProgress = [&](const av::ProgressSnapshot& snapshot) {
                callbacks.onProgress(file, index, count, snapshot);
            };
        }

        outcome.status = _converter.convert(request, sourceInfo, onProgress, shouldAbort) ? ConversionStatus::Success : ConversionStatus::Failed;
    }
} // namespace vconv::conversion
