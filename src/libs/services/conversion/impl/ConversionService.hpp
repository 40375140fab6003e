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

#include <atomic>
#include <vector>

#include "av/CommandBuilder.hpp"
#include "services/conversion/IConversionService.hpp"

namespace vconv::av
{
    class CapabilityRegistry;
}

namespace vconv::conversion
{
    class ConversionService final : public IConversionService
    {
    public:
        ConversionService(core::IChildProcessManager& childProcessManager);
        ~ConversionService() override;

        ConversionService(const ConversionService&) = delete;
        ConversionService& operator=(const ConversionService&) = delete;

    private:
        const av::HardwareCapabilities& getHardwareCapabilities() const override;
        void refreshHardwareCapabilities() override;
        bool validateEncoder() override;

        av::EncoderSelection selectEncoder(av::VideoCodec codec) const override;
        ConversionPlan planConversion(const av::ConversionRequest& request) const override;
        std::vector<PlannedFile> planConversions(std::span<const std::filesystem::path> files, const BatchParameters& parameters) override;
        std::filesystem::path getOutputFile(const std::filesystem::path& inputFile, const BatchParameters& parameters) const override;
        std::string estimateConversionTime(std::uintmax_t fileSize) const override;

        std::optional<av::MediaInfo> probe(const std::filesystem::path& file) override;
        std::vector<std::filesystem::path> findVideoFiles(const std::filesystem::path& directory, std::optional<av::VideoCodec> sourceCodec, bool recursive) override;

        bool convertFile(const av::ConversionRequest& request, ProgressCallback onProgress) override;
        BatchResult convertFiles(std::span<const std::filesystem::path> files, const BatchParameters& parameters, const BatchCallbacks& callbacks) override;

        void abort() override;

        BatchParameters withDefaultSuffix(const BatchParameters& parameters) const;
        bool shouldAbort() const;
        void createPipeline(av::HardwareCapabilities capabilities);

        core::IChildProcessManager& _childProcessManager;
        const av::CapabilityRegistry& _registry;

        SupervisorSettings _supervisorSettings;
        Converter::Settings _converterSettings;
        std::chrono::milliseconds _detectionTimeout;
        std::chrono::milliseconds _probeTimeout;
        std::optional<std::string> _outputSuffix;
        std::vector<std::filesystem::path> _videoExtensions;

        std::unique_ptr<av::IMediaProber> _prober;
        std::unique_ptr<IProcessSupervisor> _supervisor;
        std::unique_ptr<av::CommandBuilder> _commandBuilder;
        std::unique_ptr<av::EncoderSelector> _selector;
        std::unique_ptr<Converter> _converter;
        std::unique_ptr<BatchConverter> _batchConverter;

        std::atomic<bool> _abortRequested{};
    };
} // namespace vconv::conversion
