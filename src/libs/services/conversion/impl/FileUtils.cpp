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

#include "services/conversion/FileUtils.hpp"

#include <algorithm>

#include "av/CapabilityRegistry.hpp"
#include "av/MediaInfo.hpp"
#include "core/ILogger.hpp"
#include "core/Path.hpp"
#include "core/String.hpp"

namespace vconv::conversion
{
    std::span<const std::filesystem::path> getDefaultVideoExtensions()
    {
        static const std::filesystem::path extensions[]{ ".mkv", ".mp4", ".m4v", ".mov", ".avi", ".webm" };
        return extensions;
    }

    std::vector<std::filesystem::path> findVideoFiles(const std::filesystem::path& directory, std::span<const std::filesystem::path> extensions, bool recursive)
    {
        std::vector<std::filesystem::path> res;

        if (recursive)
        {
            core::pathUtils::exploreFilesRecursive(directory, [&](std::error_code ec, const std::filesystem::path& path) {
                if (ec)
                    VCONV_LOG(CONVERSION, ERROR, "Cannot explore '" << path.string() << "': " << ec.message());
                else if (core::pathUtils::hasFileAnyExtension(path, extensions))
                    res.push_back(path);

                return true;
            });
        }
        else
        {
            std::error_code ec;
            std::filesystem::directory_iterator itPath{ directory, ec };
            const std::filesystem::directory_iterator itEnd;
            while (!ec && itPath != itEnd)
            {
                std::error_code fileEc;
                if (itPath->is_regular_file(fileEc) && core::pathUtils::hasFileAnyExtension(itPath->path(), extensions))
                    res.push_back(itPath->path());

                itPath.increment(ec);
            }

            if (ec)
                VCONV_LOG(CONVERSION, ERROR, "Cannot explore '" << directory.string() << "': " << ec.message());
        }

        std::sort(std::begin(res), std::end(res));
        return res;
    }

    std::vector<std::filesystem::path> filterByVideoCodec(std::span<const std::filesystem::path> files, av::IMediaProber& prober, std::string_view codecName)
    {
        std::vector<std::filesystem::path> res;

        for (const std::filesystem::path& file : files)
        {
            const std::optional<av::MediaInfo> info{ prober.probe(file) };
            if (!info)
                continue;

            const std::optional<std::string> videoCodecName{ av::getVideoCodecName(*info) };
            if (videoCodecName && core::stringUtils::stringCaseInsensitiveEqual(*videoCodecName, codecName))
                res.push_back(file);
        }

        return res;
    }

    std::string getDefaultSuffix(av::VideoCodec codec)
    {
        return "_" + std::string{ av::toString(codec) };
    }

    std::filesystem::path generateOutputPath(const std::filesystem::path& inputFile, const std::optional<std::filesystem::path>& outputDirectory, const av::CodecDescriptor& codec, std::string_view suffix)
    {
        const std::filesystem::path directory{ outputDirectory ? *outputDirectory : inputFile.parent_path() };

        std::string filename{ inputFile.stem().string() };
        filename += suffix;
        filename += codec.extension;

        return directory / filename;
    }

    std::string estimateConversionTime(std::uintmax_t fileSize, bool hardware)
    {
        const double minutesPerGiB{ hardware ? 2.0 : 8.0 };
        const double minutes{ static_cast<double>(fileSize) / (1024.0 * 1024.0 * 1024.0) * minutesPerGiB };

        if (minutes < 1)
            return "< 1 minute";
        if (minutes < 60)
            return "~" + std::to_string(static_cast<unsigned>(minutes)) + " minutes";

        const auto totalMinutes{ static_cast<unsigned>(minutes) };
        return "~" + std::to_string(totalMinutes / 60) + "h " + std::to_string(totalMinutes % 60) + "m";
    }
} // namespace vconv::conversion
