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

#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "av/Types.hpp"

namespace vconv::av
{
    struct CodecDescriptor;
    class IMediaProber;
} // namespace vconv::av

namespace vconv::conversion
{
    std::span<const std::filesystem::path> getDefaultVideoExtensions();

    // Sorted, extensions are matched case insensitively
    std::vector<std::filesystem::path> findVideoFiles(const std::filesystem::path& directory, std::span<const std::filesystem::path> extensions, bool recursive = true);

    // Only keep files whose video stream uses the given codec name (ffprobe naming)
    std::vector<std::filesystem::path> filterByVideoCodec(std::span<const std::filesystem::path> files, av::IMediaProber& prober, std::string_view codecName);

    std::string getDefaultSuffix(av::VideoCodec codec);

    // <outputDirectory or input directory>/<stem><suffix><extension>
    // Path computation only, nothing is created
    std::filesystem::path generateOutputPath(const std::filesystem::path& inputFile, const std::optional<std::filesystem::path>& outputDirectory, const av::CodecDescriptor& codec, std::string_view suffix);

    // Rough human readable estimate, based on the file size
    std::string estimateConversionTime(std::uintmax_t fileSize, bool hardware);
} // namespace vconv::conversion
