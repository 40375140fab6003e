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

#include "av/MediaInfo.hpp"

namespace vconv::av
{
    class MediaProber : public IMediaProber
    {
    public:
        MediaProber(core::IChildProcessManager& childProcessManager, const std::filesystem::path& ffprobePath, std::chrono::milliseconds timeout);
        ~MediaProber() override = default;

        MediaProber(const MediaProber&) = delete;
        MediaProber& operator=(const MediaProber&) = delete;

    private:
        std::optional<MediaInfo> probe(const std::filesystem::path& file) override;

        core::IChildProcessManager& _childProcessManager;
        const std::filesystem::path _ffprobePath;
        const std::chrono::milliseconds _timeout;
    };
} // namespace vconv::av
