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

#include <map>
#include <string>
#include <vector>

#include "av/BackendParameters.hpp"
#include "av/Types.hpp"

namespace vconv::av
{
    struct CodecDescriptor
    {
        VideoCodec codec;
        std::string name;      // display name
        std::string extension; // output container, with the leading dot
        bool supportsHdr{};
    };

    // Static table of codec -> backend -> parameters, lookup only
    class CapabilityRegistry
    {
    public:
        struct Entry
        {
            CodecDescriptor descriptor;
            std::vector<BackendParameters> backends; // at most one per backend
        };

        CapabilityRegistry(std::vector<Entry> entries);

        // throw UnsupportedCodecException if codec is not registered
        const CodecDescriptor& getCodec(VideoCodec codec) const;

        // nullptr if there is no parameter set for this pair
        // throw UnsupportedCodecException if codec is not registered
        const BackendParameters* lookup(VideoCodec codec, Backend backend) const;

        // in backend preference order
        std::vector<Backend> getBackends(VideoCodec codec) const;
        std::vector<VideoCodec> getOutputCodecs() const;

    private:
        const Entry& getEntry(VideoCodec codec) const;

        std::map<VideoCodec, Entry> _entries;
    };

    const CapabilityRegistry& getDefaultCapabilityRegistry();
} // namespace vconv::av
