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

#include "av/BackendParameters.hpp"

namespace vconv::av
{
    namespace
    {
        template<typename... Ts>
        struct Overloaded : Ts...
        {
            using Ts::operator()...;
        };
    } // namespace

    Backend getBackend(const BackendParameters& parameters)
    {
        return std::visit(Overloaded{
                              [](const NvencParameters&) { return Backend::Nvidia; },
                              [](const AmfParameters&) { return Backend::Amd; },
                              [](const QsvParameters&) { return Backend::Intel; },
                              [](const SoftwareParameters&) { return Backend::Software; },
                          },
            parameters);
    }

    const std::string& getEncoderName(const BackendParameters& parameters)
    {
        return std::visit([](const auto& params) -> const std::string& { return params.encoder; }, parameters);
    }

    unsigned getQuality(const BackendParameters& parameters)
    {
        return std::visit(Overloaded{
                              [](const NvencParameters& params) { return params.constantQuality; },
                              [](const AmfParameters& params) { return params.qp; },
                              [](const QsvParameters& params) { return params.globalQuality; },
                              [](const SoftwareParameters& params) { return params.crf; },
                          },
            parameters);
    }
} // namespace vconv::av
