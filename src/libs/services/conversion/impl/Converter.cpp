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

#include "services/conversion/Converter.hpp"

#include <iomanip>

#include "av/CapabilityRegistry.hpp"
#include "av/CommandBuilder.hpp"
#include "av/MediaInfo.hpp"
#include "core/ILogger.hpp"
#include "core/Path.hpp"
#include "core/String.hpp"

namespace vconv::conversion
{
    namespace
    {
        bool checkFiles(const av::ConversionRequest& request)
        {
            std::error_code ec;
            if (!std::filesystem::is_regular_file(request.inputFile, ec))
            {
                VCONV_LOG(CONVERSION, ERROR, "Input file '" << request.inputFile.string() << "' does not exist");
                return false;
            }

            if (core::pathUtils::isSameFile(request.inputFile, request.outputFile))
            {
                VCONV_LOG(CONVERSION, ERROR, "Output file '" << request.outputFile.string() << "' is the input file");
                return false;
            }

            return true;
        }

        std::optional<std::filesystem::file_time_type> getLastWriteTime(const std::filesystem::path& file)
        {
            std::error_code ec;
            const std::filesystem::file_time_type writeTime{ std::filesystem::last_write_time(file, ec) };
            if (ec)
                return std::nullopt;

            return writeTime;
        }

        // previousWriteTime is set if the output file existed before the conversion
        void removePartialOutput(const std::filesystem::path& outputFile, const std::optional<std::filesystem::file_time_type>& previousWriteTime)
        {
            if (previousWriteTime && getLastWriteTime(outputFile) == previousWriteTime)
            {
                VCONV_LOG(CONVERSION, DEBUG, "Output '" << outputFile.string() << "' not written, keeping it");
                return;
            }

            std::error_code ec;
            if (!std::filesystem::remove(outputFile, ec))
            {
                if (ec)
                    VCONV_LOG(CONVERSION, ERROR, "Cannot remove partial output '" << outputFile.string() << "': " << ec.message());
                return;
            }

            VCONV_LOG(CONVERSION, DEBUG, "Removed partial output '" << outputFile.string() << "'");
        }

        void logSizes(const std::filesystem::path& inputFile, const std::filesystem::path& outputFile)
        {
            const std::optional<std::uintmax_t> inputSize{ core::pathUtils::getFileSize(inputFile) };
            const std::optional<std::uintmax_t> outputSize{ core::pathUtils::getFileSize(outputFile) };
            if (!inputSize || !outputSize)
                return;

            VCONV_LOG(CONVERSION, INFO, "Size: " << core::stringUtils::formatFileSize(*inputSize) << " -> " << core::stringUtils::formatFileSize(*outputSize));
            if (*inputSize > 0)
            {
                const double ratio{ (1.0 - static_cast<double>(*outputSize) / static_cast<double>(*inputSize)) * 100.0 };
                VCONV_LOG(CONVERSION, INFO, "Compression: " << std::fixed << std::setprecision(1) << ratio << "%");
            }
        }
    } // namespace

    Converter::Converter(const Settings& settings, const av::EncoderSelector& selector, av::IMediaProber& prober, const av::CommandBuilder& commandBuilder, IProcessSupervisor& supervisor)
        : _settings{ settings }
        , _selector{ selector }
        , _prober{ prober }
        , _commandBuilder{ commandBuilder }
        , _supervisor{ supervisor }
    {
    }

    ConversionPlan Converter::plan(const av::ConversionRequest& request) const
    {
        ConversionPlan res{ .selection = _selector.select(request.codec, _settings.preferHardware), .args = {} };
        res.args = _commandBuilder.build(request, res.selection);

        return res;
    }

    bool Converter::convert(const av::ConversionRequest& request, ProgressCallback onProgress, ShouldAbortCallback shouldAbort)
    {
        if (!checkFiles(request))
            return false;

        return convert(request, _prober.probe(request.inputFile), std::move(onProgress), std::move(shouldAbort));
    }

    bool Converter::convert(const av::ConversionRequest& request, const std::optional<av::MediaInfo>& sourceInfo, ProgressCallback onProgress, ShouldAbortCallback shouldAbort)
    {
        if (!checkFiles(request))
            return false;

        const std::optional<std::string> sourceCodecName{ sourceInfo ? av::getVideoCodecName(*sourceInfo) : std::nullopt };
        if (!sourceCodecName)
        {
            VCONV_LOG(CONVERSION, ERROR, "Cannot detect the video codec of '" << request.inputFile.string() << "'");
            return false;
        }

        const av::CodecDescriptor& target{ _selector.getRegistry().getCodec(request.codec) };
        VCONV_LOG_IF(CONVERSION, WARNING, av::videoCodecFromString(*sourceCodecName) == request.codec, "'" << request.inputFile.string() << "' is already encoded in " << target.name << ", converting anyway");

        const std::optional<std::chrono::duration<double>> duration{ av::getDuration(*sourceInfo) };
        const std::optional<std::uintmax_t> inputSize{ core::pathUtils::getFileSize(request.inputFile) };

        VCONV_LOG(CONVERSION, INFO, "Converting '" << request.inputFile.string() << "' (" << *sourceCodecName << ", " << (av::hasHdrMetadata(*sourceInfo) ? "HDR" : "SDR")
                                                   << (inputSize ? ", " + core::stringUtils::formatFileSize(*inputSize) : "")
                                                   << (duration ? ", " + core::stringUtils::formatDuration(*duration) : "") << ") to " << target.name);

        const av::EncoderSelection selection{ _selector.select(request.codec, _settings.preferHardware) };
        VCONV_LOG(CONVERSION, INFO, "Using encoder '" << av::getEncoderName(selection.parameters) << "' (" << av::toString(selection.backend) << ")");

        const std::filesystem::path outputDirectory{ request.outputFile.parent_path() };
        if (!outputDirectory.empty() && !core::pathUtils::ensureDirectory(outputDirectory))
        {
            VCONV_LOG(CONVERSION, ERROR, "Cannot use output directory '" << outputDirectory.string() << "'");
            return false;
        }

        const std::optional<std::filesystem::file_time_type> previousWriteTime{ getLastWriteTime(request.outputFile) };

        try
        {
            RunResult result{ runAttempt(request, selection, *sourceInfo, onProgress, shouldAbort) };

            const bool hdrApplied{ request.preserveHdr && target.supportsHdr };
            if (!result.succeeded() && result.status != RunStatus::Cancelled && av::isHardware(selection.backend) && hdrApplied)
            {
                VCONV_LOG(CONVERSION, WARNING, "Hardware encoding with HDR parameters failed" << (result.invalidArgument ? " (invalid argument)" : "") << ", retrying without HDR");
                removePartialOutput(request.outputFile, previousWriteTime);

                av::ConversionRequest sdrRequest{ request };
                sdrRequest.preserveHdr = false;
                result = runAttempt(sdrRequest, selection, *sourceInfo, onProgress, shouldAbort);
            }

            if (!result.succeeded())
            {
                removePartialOutput(request.outputFile, previousWriteTime);
                if (result.status == RunStatus::Cancelled)
                    VCONV_LOG(CONVERSION, INFO, "Conversion of '" << request.inputFile.string() << "' cancelled");
                else
                    VCONV_LOG(CONVERSION, ERROR, "Conversion of '" << request.inputFile.string() << "' failed");

                return false;
            }

            VCONV_LOG(CONVERSION, INFO, "Converted '" << request.inputFile.string() << "' -> '" << request.outputFile.string() << "' in " << core::stringUtils::formatDuration(result.elapsed));
            logSizes(request.inputFile, request.outputFile);
        }
        catch (...)
        {
            removePartialOutput(request.outputFile, previousWriteTime);
            throw;
        }

        return true;
    }

    RunResult Converter::runAttempt(const av::ConversionRequest& request, const av::EncoderSelection& selection, const av::MediaInfo& sourceInfo, const ProgressCallback& onProgress, const ShouldAbortCallback& shouldAbort)
    {
        const core::IChildProcess::Args args{ _commandBuilder.build(request, selection, &sourceInfo) };
        return _supervisor.run(args, av::getDuration(sourceInfo), onProgress, shouldAbort);
    }
} // namespace vconv::conversion
