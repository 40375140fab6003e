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

#include "av/Types.hpp"

namespace vconv::av
{
    struct ConversionRequest
    {
        std::filesystem::path inputFile;
        std::filesystem::path outputFile;
        VideoCodec codec{ VideoCodec::HEVC };
        std::optional<unsigned> quality; // backend default if not set
        bool preserveHdr{ true };
    };
} // namespace vconv::av
