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

#include "ConversionService.hpp"

#include "av/CapabilityRegistry.hpp"
#include "core/IConfig.hpp"
#include "core/ILogger.hpp"
#include "core/Service.hpp"
#include "core/String.hpp"
#include "services/conversion/FileUtils.hpp"

namespace vconv::conversion
{
    namespace
    {
        // An abort request applies to the current or next run only
        class AbortRequestReset
        {
        public:
            explicit AbortRequestReset(std::atomic<bool>& abortRequested)
                : _abortRequested{ abortRequested }
            {
            }
            ~AbortRequestReset()
            {
                _abortRequested = false;
            }

            AbortRequestReset(const AbortRequestReset&) = delete;
            AbortRequestReset& operator=(const AbortRequestReset&) = delete;

        private:
            std::atomic<bool>& _abortRequested;
        };

        std::chrono::seconds getSeconds(core::IConfig* config, std::string_view setting, std::chrono::seconds def)
        {
            return config ? std::chrono::seconds{ config->getULong(setting, def.count()) } : def;
        }
    } // namespace

    std::unique_ptr<IConversionService> createConversionService(core::IChildProcessManager& childProcessManager)
    {
        return std::make_unique<ConversionService>(childProcessManager);
    }

    ConversionService::ConversionService(core::IChildProcessManager& childProcessManager)
        : _childProcessManager{ childProcessManager }
        , _registry{ av::getDefaultCapabilityRegistry() }
    {
        core::IConfig* config{ core::Service<core::IConfig>::get() };

        _supervisorSettings.ffmpegPath = config ? config->getPath("ffmpeg-file", "ffmpeg") : std::filesystem::path{ "ffmpeg" };
        _supervisorSettings.readTimeout = config ? std::chrono::milliseconds{ config->getULong("read-timeout-ms", 1000) } : std::chrono::milliseconds{ 1000 };
        _supervisorSettings.hangTimeout = getSeconds(config, "hang-timeout", std::chrono::seconds{ 30 });
        _supervisorSettings.exitTimeout = getSeconds(config, "exit-timeout", std::chrono::seconds{ 10 });
        _supervisorSettings.terminateTimeout = getSeconds(config, "terminate-timeout", std::chrono::seconds{ 5 });
        _converterSettings.preferHardware = config ? config->getBool("prefer-hardware", true) : true;
        _detectionTimeout = getSeconds(config, "detection-timeout", std::chrono::seconds{ 10 });
        _probeTimeout = getSeconds(config, "probe-timeout", std::chrono::seconds{ 30 });

        if (config)
        {
            const std::string_view outputSuffix{ config->getString("output-suffix", "") };
            if (!outputSuffix.empty())
                _outputSuffix = std::string{ outputSuffix };

            auto addExtension{ [this](std::string_view extension) {
                std::string normalized{ core::stringUtils::stringToLower(extension) };
                if (!normalized.empty() && normalized.front() != '.')
                    normalized.insert(0, 1, '.');
                _videoExtensions.emplace_back(normalized);
            } };
            config->visitStrings("video-extensions", addExtension, {});
        }
        if (_videoExtensions.empty())
        {
            const std::span<const std::filesystem::path> defaultExtensions{ getDefaultVideoExtensions() };
            _videoExtensions.assign(std::cbegin(defaultExtensions), std::cend(defaultExtensions));
        }

        const std::filesystem::path ffprobePath{ config ? config->getPath("ffprobe-file", "ffprobe") : std::filesystem::path{ "ffprobe" } };
        _prober = av::createMediaProber(_childProcessManager, ffprobePath, _probeTimeout);
        _supervisor = createProcessSupervisor(_childProcessManager, _supervisorSettings);
        _commandBuilder = std::make_unique<av::CommandBuilder>(_registry, *_prober);

        createPipeline(av::detectHardwareCapabilities(_childProcessManager, _supervisorSettings.ffmpegPath, _registry, _detectionTimeout));

        VCONV_LOG(SERVICE, INFO, "Service started!");
    }

    ConversionService::~ConversionService()
    {
        VCONV_LOG(SERVICE, INFO, "Service stopped!");
    }

    void ConversionService::createPipeline(av::HardwareCapabilities capabilities)
    {
        _batchConverter.reset();
        _converter.reset();

        _selector = std::make_unique<av::EncoderSelector>(_registry, std::move(capabilities));
        _converter = std::make_unique<Converter>(_converterSettings, *_selector, *_prober, *_commandBuilder, *_supervisor);
        _batchConverter = std::make_unique<BatchConverter>(_registry, *_prober, *_converter);
    }

    const av::HardwareCapabilities& ConversionService::getHardwareCapabilities() const
    {
        return _selector->getCapabilities();
    }

    void ConversionService::refreshHardwareCapabilities()
    {
        createPipeline(av::detectHardwareCapabilities(_childProcessManager, _supervisorSettings.ffmpegPath, _registry, _detectionTimeout));
    }

    bool ConversionService::validateEncoder()
    {
        return av::validateEncoder(_childProcessManager, _supervisorSettings.ffmpegPath, _detectionTimeout);
    }

    av::EncoderSelection ConversionService::selectEncoder(av::VideoCodec codec) const
    {
        return _selector->select(codec, _converterSettings.preferHardware);
    }

    ConversionPlan ConversionService::planConversion(const av::ConversionRequest& request) const
    {
        return _converter->plan(request);
    }

    std::vector<PlannedFile> ConversionService::planConversions(std::span<const std::filesystem::path> files, const BatchParameters& parameters)
    {
        const BatchParameters effectiveParameters{ withDefaultSuffix(parameters) };

        std::vector<PlannedFile> res;
        res.reserve(files.size());

        for (const std::filesystem::path& file : files)
        {
            const std::optional<av::MediaInfo> sourceInfo{ _prober->probe(file) };
            res.push_back(_batchConverter->planFile(file, sourceInfo ? &(*sourceInfo) : nullptr, effectiveParameters));
        }

        return res;
    }

    std::filesystem::path ConversionService::getOutputFile(const std::filesystem::path& inputFile, const BatchParameters& parameters) const
    {
        const BatchParameters effectiveParameters{ withDefaultSuffix(parameters) };
        return generateOutputPath(inputFile, effectiveParameters.outputDirectory, _registry.getCodec(parameters.codec), *effectiveParameters.suffix);
    }

    std::string ConversionService::estimateConversionTime(std::uintmax_t fileSize) const
    {
        return conversion::estimateConversionTime(fileSize, getHardwareCapabilities().hasHardwareBackend() && _converterSettings.preferHardware);
    }

    std::optional<av::MediaInfo> ConversionService::probe(const std::filesystem::path& file)
    {
        return _prober->probe(file);
    }

    std::vector<std::filesystem::path> ConversionService::findVideoFiles(const std::filesystem::path& directory, std::optional<av::VideoCodec> sourceCodec, bool recursive)
    {
        std::vector<std::filesystem::path> files{ conversion::findVideoFiles(directory, _videoExtensions, recursive) };
        if (sourceCodec)
            files = filterByVideoCodec(files, *_prober, av::toString(*sourceCodec));

        VCONV_LOG(CONVERSION, DEBUG, "Found " << files.size() << " video file(s) in '" << directory.string() << "'");
        return files;
    }

    bool ConversionService::convertFile(const av::ConversionRequest& request, ProgressCallback onProgress)
    {
        const AbortRequestReset abortRequestReset{ _abortRequested };
        return _converter->convert(request, std::move(onProgress), [this] { return shouldAbort(); });
    }

    BatchResult ConversionService::convertFiles(std::span<const std::filesystem::path> files, const BatchParameters& parameters, const BatchCallbacks& callbacks)
    {
        const AbortRequestReset abortRequestReset{ _abortRequested };
        return _batchConverter->convert(files, withDefaultSuffix(parameters), callbacks, [this] { return shouldAbort(); });
    }

    void ConversionService::abort()
    {
        _abortRequested = true;
    }

    bool ConversionService::shouldAbort() const
    {
        return _abortRequested;
    }

    BatchParameters ConversionService::withDefaultSuffix(const BatchParameters& parameters) const
    {
        BatchParameters res{ parameters };
        if (!res.suffix)
            res.suffix = _outputSuffix ? *_outputSuffix : getDefaultSuffix(parameters.codec);

        return res;
    }
} // namespace vconv::conversion
