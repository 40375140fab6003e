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

#include "av/EncoderSelector.hpp"

#include "av/CapabilityRegistry.hpp"
#include "av/Exception.hpp"
#include "core/ILogger.hpp"

namespace vconv::av
{
    EncoderSelector::EncoderSelector(const CapabilityRegistry& registry, HardwareCapabilities capabilities)
        : _registry{ registry }
        , _capabilities{ std::move(capabilities) }
    {
    }

    EncoderSelection EncoderSelector::select(VideoCodec codec, bool preferHardware) const
    {
        // Backend availability differs per codec family, always check the codec itself
        Backend backend{ Backend::Software };
        if (preferHardware && _capabilities.isAvailable(codec, _capabilities.getDetectedBackend()))
            backend = _capabilities.getDetectedBackend();

        const BackendParameters* parameters{ _registry.lookup(codec, backend) };
        if (!parameters && backend != Backend::Software)
        {
            VCONV_LOG(ENCODING, DEBUG, "No " << toString(backend) << " parameters for codec '" << toString(codec) << "', using software encoding");
            backend = Backend::Software;
            parameters = _registry.lookup(codec, backend);
        }

        if (!parameters)
            throw UnsupportedCodecException{ "No encoder registered for codec '" + std::string{ toString(codec) } + "'" };

        return EncoderSelection{ .backend = backend, .parameters = *parameters };
    }
} // namespace vconv::av
