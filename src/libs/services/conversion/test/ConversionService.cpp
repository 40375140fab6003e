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

#include <gtest/gtest.h>

#include "core/IChildProcessManager.hpp"
#include "core/IConfig.hpp"
#include "core/Service.hpp"
#include "services/conversion/IConversionService.hpp"

#include "TempDirectory.hpp"

namespace vconv::conversion::tests
{
    namespace
    {
        // Stands for ffmpeg: lists software encoders only, writes the last argument
        constexpr std::string_view fakeFfmpeg{ R"sh(#!/bin/sh
case "$1" in
-hide_banner) echo "Encoders:"; echo " V....D libx265              libx265 H.265 / HEVC (codec hevc)"; exit 0 ;;
-version) echo "ffmpeg version n6.1"; exit 0 ;;
esac
for last in "$@"; do :; done
echo "frame=   24 fps=0.0 q=28.0 size=       1kB time=00:00:01.00 bitrate=   8.2kbits/s speed=2.0x" >&2
echo "converted" > "$last"
exit 0
)sh" };

        // Stands for ffprobe: files whose name contains "hevc" are HEVC, others are AV1
        constexpr std::string_view fakeFfprobe{ R"(#!/bin/sh
for last in "$@"; do :; done
case "$last" in
*hevc*) codec=hevc ;;
*) codec=av1 ;;
esac
printf '{"streams":[{"codec_type":"video","codec_name":"%s"}],"format":{"duration":"2.000000"}}\n' "$codec"
)" };

        class ConversionServiceTest : public ::testing::Test
        {
        protected:
            void SetUp() override
            {
                const std::filesystem::path ffmpeg{ createScript("bin/ffmpeg", fakeFfmpeg) };
                const std::filesystem::path ffprobe{ createScript("bin/ffprobe", fakeFfprobe) };

                const std::filesystem::path configPath{ _tmpDir.createFile("vconv.conf", "ffmpeg-file = \"" + ffmpeg.string() + "\";\n"
                                                                                          "ffprobe-file = \"" + ffprobe.string() + "\";\n"
                                                                                          "detection-timeout = 5;\n"
                                                                                          "probe-timeout = 5;\n"
                                                                                          "read-timeout-ms = 50;\n"
                                                                                          "hang-timeout = 5;\n"
                                                                                          "output-suffix = \"_conv\";\n"
                                                                                          "video-extensions = ( \"mkv\", \".MOV\" );\n") };
                _config.assign(core::createConfig(configPath));
                _service = createConversionService(*_childProcessManager);
            }

            std::filesystem::path createScript(const std::filesystem::path& relativePath, std::string_view content)
            {
                const std::filesystem::path path{ _tmpDir.createFile(relativePath, content) };
                std::filesystem::permissions(path, std::filesystem::perms::owner_all);
                return path;
            }

            TempDirectory _tmpDir;
            core::Service<core::IConfig> _config;
            std::unique_ptr<core::IChildProcessManager> _childProcessManager{ core::createChildProcessManager() };
            std::unique_ptr<IConversionService> _service;
        };
    } // namespace

    TEST_F(ConversionServiceTest, capabilities)
    {
        EXPECT_FALSE(_service->getHardwareCapabilities().hasHardwareBackend());
        EXPECT_EQ(_service->selectEncoder(av::VideoCodec::HEVC).backend, av::Backend::Software);
        EXPECT_TRUE(_service->validateEncoder());

        _service->refreshHardwareCapabilities();
        EXPECT_EQ(_service->getHardwareCapabilities().getDetectedBackend(), av::Backend::Software);

        EXPECT_EQ(_service->estimateConversionTime(1024 * 1024 * 1024), "~8 minutes");
    }

    TEST_F(ConversionServiceTest, probe)
    {
        const std::optional<av::MediaInfo> info{ _service->probe(_tmpDir.createFile("movie.mkv")) };
        ASSERT_TRUE(info);
        EXPECT_EQ(av::getVideoCodecName(*info), "av1");
        ASSERT_TRUE(info->duration);
        EXPECT_NEAR(info->duration->count(), 2, 0.001);
    }

    TEST_F(ConversionServiceTest, convertFile)
    {
        const std::filesystem::path input{ _tmpDir.createFile("movie.mkv") };
        const std::filesystem::path output{ _tmpDir.getPath() / "movie_hevc.mkv" };

        std::vector<av::ProgressSnapshot> snapshots;
        EXPECT_TRUE(_service->convertFile(av::ConversionRequest{ .inputFile = input, .outputFile = output }, [&](const av::ProgressSnapshot& snapshot) { snapshots.push_back(snapshot); }));

        EXPECT_TRUE(std::filesystem::exists(output));
        ASSERT_EQ(snapshots.size(), 1);
        EXPECT_EQ(snapshots.front().frame, 24);
        EXPECT_NEAR(snapshots.front().percentage, 50, 0.01);
    }

    TEST_F(ConversionServiceTest, findVideoFiles)
    {
        _tmpDir.createFile("videos/a.mkv");
        _tmpDir.createFile("videos/b_hevc.mkv");
        _tmpDir.createFile("videos/c.mov");
        _tmpDir.createFile("videos/d.mp4"); // not a configured extension

        const std::vector<std::filesystem::path> all{ _tmpDir.getPath() / "videos" / "a.mkv", _tmpDir.getPath() / "videos" / "b_hevc.mkv", _tmpDir.getPath() / "videos" / "c.mov" };
        EXPECT_EQ(_service->findVideoFiles(_tmpDir.getPath() / "videos"), all);

        const std::vector<std::filesystem::path> av1Only{ _tmpDir.getPath() / "videos" / "a.mkv", _tmpDir.getPath() / "videos" / "c.mov" };
        EXPECT_EQ(_service->findVideoFiles(_tmpDir.getPath() / "videos", av::VideoCodec::AV1), av1Only);
    }

    TEST_F(ConversionServiceTest, convertFiles)
    {
        const std::vector<std::filesystem::path> files{ _tmpDir.createFile("videos/a.mkv"), _tmpDir.createFile("videos/b_hevc.mkv"), _tmpDir.createFile("videos/c.mkv") };
        _tmpDir.createFile("out/c_conv.mkv");

        BatchParameters parameters;
        parameters.outputDirectory = _tmpDir.getPath() / "out";

        const std::vector<PlannedFile> plannedFiles{ _service->planConversions(files, parameters) };
        ASSERT_EQ(plannedFiles.size(), 3);
        EXPECT_EQ(plannedFiles[0].outputFile, _tmpDir.getPath() / "out" / "a_conv.mkv");
        EXPECT_FALSE(plannedFiles[0].skipReason);
        EXPECT_EQ(plannedFiles[1].skipReason, SkipReason::AlreadyTargetCodec);
        EXPECT_EQ(plannedFiles[2].skipReason, SkipReason::DestinationExists);

        const BatchResult result{ _service->convertFiles(files, parameters) };
        EXPECT_EQ(result.total, 3);
        EXPECT_EQ(result.successful, 1);
        EXPECT_EQ(result.skipped, 2);
        EXPECT_EQ(result.failed, 0);
        ASSERT_EQ(result.outcomes.size(), 3);
        for (std::size_t i{}; i < plannedFiles.size(); ++i)
        {
            EXPECT_EQ(result.outcomes[i].skipReason, plannedFiles[i].skipReason);
            EXPECT_EQ(result.outcomes[i].outputFile, plannedFiles[i].outputFile);
        }
        EXPECT_TRUE(std::filesystem::exists(_tmpDir.getPath() / "out" / "a_conv.mkv"));
    }

    TEST_F(ConversionServiceTest, planningWritesNothing)
    {
        const std::vector<std::filesystem::path> files{ _tmpDir.createFile("videos/a.mkv") };
        const std::filesystem::path outputDirectory{ _tmpDir.getPath() / "never" / "created" };

        BatchParameters parameters;
        parameters.outputDirectory = outputDirectory;

        const std::vector<PlannedFile> plannedFiles{ _service->planConversions(files, parameters) };
        ASSERT_EQ(plannedFiles.size(), 1);
        EXPECT_EQ(plannedFiles[0].outputFile, outputDirectory / "a_conv.mkv");
        EXPECT_EQ(_service->getOutputFile(files[0], parameters), outputDirectory / "a_conv.mkv");
        EXPECT_FALSE(std::filesystem::exists(_tmpDir.getPath() / "never"));

        const BatchResult result{ _service->convertFiles(files, parameters) };
        EXPECT_EQ(result.successful, 1);
        EXPECT_TRUE(std::filesystem::exists(outputDirectory / "a_conv.mkv"));
    }

    TEST_F(ConversionServiceTest, abortBeforeRun)
    {
        const std::vector<std::filesystem::path> files{ _tmpDir.createFile("a.mkv"), _tmpDir.createFile("b.mkv") };

        _service->abort();
        const BatchResult abortedResult{ _service->convertFiles(files, BatchParameters{}) };
        EXPECT_EQ(abortedResult.total, 2);
        EXPECT_TRUE(abortedResult.outcomes.empty());
        EXPECT_FALSE(std::filesystem::exists(_tmpDir.getPath() / "a_conv.mkv"));

        const BatchResult result{ _service->convertFiles(files, BatchParameters{}) };
        EXPECT_EQ(result.successful, 2);
    }

    TEST_F(ConversionServiceTest, abortBatch)
    {
        const std::vector<std::filesystem::path> files{ _tmpDir.createFile("a.mkv"), _tmpDir.createFile("b.mkv") };

        BatchCallbacks callbacks;
        callbacks.onFileDone = [this](std::size_t, std::size_t, const ConversionOutcome&) { _service->abort(); };

        const BatchResult result{ _service->convertFiles(files, BatchParameters{}, callbacks) };
        EXPECT_EQ(result.total, 2);
        EXPECT_EQ(result.successful, 1);
        EXPECT_EQ(result.outcomes.size(), 1);

        // next operation starts with a cleared abort request
        EXPECT_TRUE(_service->convertFile(av::ConversionRequest{ .inputFile = files[1], .outputFile = _tmpDir.getPath() / "b_hevc.mkv" }));
    }
} // namespace vconv::conversion::tests
