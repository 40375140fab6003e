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

#include <filesystem>
#include <fstream>

#include <gtest/gtest.h>

#include "core/Exception.hpp"
#include "core/IConfig.hpp"

namespace vconv::core::tests
{
    class ConfigTest : public ::testing::Test
    {
    protected:
        void SetUp() override
        {
            _path = std::filesystem::temp_directory_path() / ("vconv-config-" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) + "-" + ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".conf");
        }

        void TearDown() override
        {
            std::error_code ec;
            std::filesystem::remove(_path, ec);
        }

        std::unique_ptr<IConfig> writeConfig(std::string_view content)
        {
            {
                std::ofstream ofs{ _path };
                ofs << content;
            }
            return createConfig(_path);
        }

        std::filesystem::path _path;
    };

    TEST_F(ConfigTest, values)
    {
        auto config{ writeConfig(R"(
ffmpeg-file = "/opt/ffmpeg/bin/ffmpeg";
hang-timeout = 45;
prefer-hardware = false;
output-suffix = "_x";
video-extensions = [ ".mkv", ".mp4" ];
)") };

        EXPECT_EQ(config->getPath("ffmpeg-file", "ffmpeg"), "/opt/ffmpeg/bin/ffmpeg");
        EXPECT_EQ(config->getULong("hang-timeout", 30), 45);
        EXPECT_FALSE(config->getBool("prefer-hardware", true));
        EXPECT_EQ(config->getString("output-suffix", "_hevc"), "_x");

        std::vector<std::string> extensions;
        config->visitStrings("video-extensions", [&](std::string_view ext) { extensions.emplace_back(ext); }, { ".avi" });
        EXPECT_EQ(extensions, (std::vector<std::string>{ ".mkv", ".mp4" }));
    }

    TEST_F(ConfigTest, defaults)
    {
        auto config{ writeConfig("") };

        EXPECT_EQ(config->getPath("ffprobe-file", "ffprobe"), "ffprobe");
        EXPECT_EQ(config->getULong("exit-timeout", 10), 10);
        EXPECT_EQ(config->getLong("terminate-timeout", 5), 5);
        EXPECT_TRUE(config->getBool("prefer-hardware", true));

        std::vector<std::string> extensions;
        config->visitStrings("video-extensions", [&](std::string_view ext) { extensions.emplace_back(ext); }, { ".mkv", ".webm" });
        EXPECT_EQ(extensions, (std::vector<std::string>{ ".mkv", ".webm" }));
    }

    TEST_F(ConfigTest, wrongTypes)
    {
        auto config{ writeConfig(R"(
hang-timeout = "45";
prefer-hardware = 0;
ffmpeg-file = 12;
big-value = 5000000000L;
video-extensions = ( ".mkv", 3, ".mov" );
)") };

        EXPECT_EQ(config->getULong("hang-timeout", 30), 30);
        EXPECT_TRUE(config->getBool("prefer-hardware", true));
        EXPECT_EQ(config->getPath("ffmpeg-file", "ffmpeg"), "ffmpeg");
        EXPECT_EQ(config->getLong("big-value", 0), 5000000000L);

        std::vector<std::string> extensions;
        config->visitStrings("video-extensions", [&](std::string_view ext) { extensions.emplace_back(ext); }, {});
        EXPECT_EQ(extensions, (std::vector<std::string>{ ".mkv", ".mov" }));
    }

    TEST_F(ConfigTest, negativeULong)
    {
        auto config{ writeConfig("hang-timeout = -1;") };

        EXPECT_THROW(config->getULong("hang-timeout", 30), VconvException);
    }

    TEST_F(ConfigTest, parseError)
    {
        EXPECT_THROW(writeConfig("hang-timeout = ;"), VconvException);
    }

    TEST(Config, missingFile)
    {
        EXPECT_THROW(createConfig("/nonexistent/vconv.conf"), VconvException);
    }
} // namespace vconv::core::tests
