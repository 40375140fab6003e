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

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace vconv::av
{
    // Updated in place for each progress line of one encoding attempt
    struct ProgressSnapshot
    {
        std::size_t frame{}; // never decreases
        float fps{};
        std::string bitrate; // as reported, ex "170.1kbits/s"
        std::string size;    // as reported, ex "1024kB"
        std::chrono::duration<double> elapsed{};
        std::string time{ "00:00:00" };
        float speed{};
        float percentage{}; // [0, 100], only set if the total duration is known
    };

    // Progress lines carry both a frame counter and a time marker
    bool isProgressLine(std::string_view line);

    // Never throws, fields that cannot be extracted are left unchanged
    // Return false if the line is not a progress line
    bool parseProgressLine(std::string_view line, ProgressSnapshot& snapshot, std::optional<std::chrono::duration<double>> totalDuration);
} // namespace vconv::av
