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

#include <vector>

#include <gtest/gtest.h>

#include <Wt/WDate.h>
#include <Wt/WDateTime.h>
#include <Wt/WTime.h>

#include "core/String.hpp"

namespace vconv::core::stringUtils::tests
{
    TEST(StringUtils, joinStrings)
    {
        const std::vector<std::string> empty;
        EXPECT_EQ(joinStrings(empty, " "), "");

        const std::vector<std::string> args{ "-y", "-i", "in.mkv" };
        EXPECT_EQ(joinStrings(args, " "), "-y -i in.mkv");

        const std::vector<std::string_view> single{ "a" };
        EXPECT_EQ(joinStrings(single, ", "), "a");
    }

    TEST(StringUtils, caseInsensitive)
    {
        EXPECT_TRUE(stringCaseInsensitiveEqual("HEVC", "hevc"));
        EXPECT_FALSE(stringCaseInsensitiveEqual("hevc", "hev"));
        EXPECT_TRUE(stringCaseInsensitiveContains("Error while opening encoder: Invalid Argument", "invalid argument"));
        EXPECT_FALSE(stringCaseInsensitiveContains("all good", "invalid"));
        EXPECT_EQ(stringToLower(".MKV"), ".mkv");
    }

    TEST(StringUtils, readAs)
    {
        EXPECT_EQ(readAs<int>("23"), 23);
        EXPECT_EQ(readAs<int>("abc"), std::nullopt);
        EXPECT_EQ(readAs<double>("1.25"), 1.25);
        EXPECT_EQ(readAs<bool>("true"), true);
        EXPECT_EQ(readAs<bool>("0"), false);
        EXPECT_EQ(readAs<bool>("maybe"), std::nullopt);
        EXPECT_EQ(readAs<std::string>("foo bar"), "foo bar");
    }

    TEST(StringUtils, shellQuote)
    {
        EXPECT_EQ(shellQuote("-c:v"), "-c:v");
        EXPECT_EQ(shellQuote("/tmp/movie.mkv"), "/tmp/movie.mkv");
        EXPECT_EQ(shellQuote("my movie.mkv"), "'my movie.mkv'");
        EXPECT_EQ(shellQuote("it's"), "'it'\\''s'");
        EXPECT_EQ(shellQuote(""), "''");
    }

    TEST(StringUtils, formatDuration)
    {
        EXPECT_EQ(formatDuration(std::chrono::seconds{ 0 }), "00:00:00");
        EXPECT_EQ(formatDuration(std::chrono::duration<double>{ 59.9 }), "00:00:59");
        EXPECT_EQ(formatDuration(std::chrono::seconds{ 3725 }), "01:02:05");
        EXPECT_EQ(formatDuration(std::chrono::duration<double>{ -3 }), "00:00:00");
    }

    TEST(StringUtils, formatFileSize)
    {
        EXPECT_EQ(formatFileSize(0), "0.00 MB");
        EXPECT_EQ(formatFileSize(1024 * 1024), "1.00 MB");
        EXPECT_EQ(formatFileSize(1024 * 1024 * 3 / 2), "1.50 MB");
    }

    TEST(StringUtils, toISO8601String)
    {
        EXPECT_EQ(toISO8601String(Wt::WDateTime{}), "");
        EXPECT_EQ(toISO8601String(Wt::WDateTime{ Wt::WDate{ 2025, 3, 4 }, Wt::WTime{ 12, 30, 15, 250 } }), "2025-03-04T12:30:15.250Z");
    }
} // namespace vconv::core::stringUtils::tests
