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

#include "av/BackendParameters.hpp"
#include "av/HardwareCapabilities.hpp"
#include "av/Types.hpp"

namespace vconv::av
{
    class CapabilityRegistry;

    struct EncoderSelection
    {
        Backend backend;
        BackendParameters parameters;
    };

    // Deterministic: same capabilities and registry always give the same selection
    class EncoderSelector
    {
    public:
        EncoderSelector(const CapabilityRegistry& registry, HardwareCapabilities capabilities);

        // throw UnsupportedCodecException if the codec is not registered
        EncoderSelection select(VideoCodec codec, bool preferHardware = true) const;

        const HardwareCapabilities& getCapabilities() const { return _capabilities; }
        const CapabilityRegistry& getRegistry() const { return _registry; }

    private:
        const CapabilityRegistry& _registry;
        const HardwareCapabilities _capabilities;
    };
} // namespace vconv::av
