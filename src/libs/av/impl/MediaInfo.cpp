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

#include "av/MediaInfo.hpp"

#include <algorithm>

#include <Wt/Json/Array.h>
#include <Wt/Json/Object.h>
#include <Wt/Json/Parser.h>
#include <Wt/Json/Value.h>
#include <Wt/WException.h>

#include "av/Exception.hpp"
#include "core/String.hpp"

namespace vconv::av
{
    namespace
    {
        std::optional<std::string> getOptionalString(const Wt::Json::Object& obj, const std::string& name)
        {
            const Wt::Json::Value& value{ obj.get(name) };
            if (value.type() != Wt::Json::Type::String)
                return std::nullopt;

            std::string str{ static_cast<std::string>(value) };
            if (str.empty() || str == "unknown")
                return std::nullopt;

            return str;
        }

        // ffprobe outputs durations as strings
        std::optional<std::chrono::duration<double>> getOptionalDuration(const Wt::Json::Object& obj, const std::string& name)
        {
            const Wt::Json::Value& value{ obj.get(name) };

            std::optional<double> seconds;
            if (value.type() == Wt::Json::Type::String)
                seconds = core::stringUtils::readAs<double>(static_cast<std::string>(value));
            else if (value.type() == Wt::Json::Type::Number)
                seconds = static_cast<double>(value);

            if (!seconds || *seconds <= 0)
                return std::nullopt;

            return std::chrono::duration<double>{ *seconds };
        }

        StreamInfo parseStream(const Wt::Json::Object& streamObj)
        {
            StreamInfo stream;
            stream.codecType = getOptionalString(streamObj, "codec_type").value_or("");
            stream.codecName = getOptionalString(streamObj, "codec_name").value_or("");
            stream.colorPrimaries = getOptionalString(streamObj, "color_primaries");
            stream.colorTransfer = getOptionalString(streamObj, "color_transfer");
            stream.colorSpace = getOptionalString(streamObj, "color_space");
            stream.colorRange = getOptionalString(streamObj, "color_range");
            stream.duration = getOptionalDuration(streamObj, "duration");

            const Wt::Json::Value& sideDataList{ streamObj.get("side_data_list") };
            if (sideDataList.type() == Wt::Json::Type::Array)
            {
                for (const Wt::Json::Value& sideData : static_cast<const Wt::Json::Array&>(sideDataList))
                {
                    if (sideData.type() != Wt::Json::Type::Object)
                        continue;

                    if (std::optional<std::string> sideDataType{ getOptionalString(sideData, "side_data_type") })
                        stream.sideDataTypes.push_back(std::move(*sideDataType));
                }
            }

            return stream;
        }
    } // namespace

    MediaInfo parseMediaInfo(std::string_view ffprobeJsonOutput)
    {
        MediaInfo info;

        try
        {
            Wt::Json::Object root;
            Wt::Json::parse(std::string{ ffprobeJsonOutput }, root);

            const Wt::Json::Value& format{ root.get("format") };
            if (format.type() == Wt::Json::Type::Object)
                info.duration = getOptionalDuration(format, "duration");

            const Wt::Json::Value& streams{ root.get("streams") };
            if (streams.type() == Wt::Json::Type::Array)
            {
                for (const Wt::Json::Value& stream : static_cast<const Wt::Json::Array&>(streams))
                {
                    if (stream.type() == Wt::Json::Type::Object)
                        info.streams.push_back(parseStream(stream));
                }
            }
        }
        catch (const Wt::WException& e)
        {
            throw Exception{ std::string{ "Cannot parse ffprobe output: " } + e.what() };
        }

        return info;
    }

    const StreamInfo* getVideoStream(const MediaInfo& info)
    {
        const auto it{ std::find_if(std::cbegin(info.streams), std::cend(info.streams), [](const StreamInfo& stream) { return stream.codecType == "video"; }) };
        if (it == std::cend(info.streams))
            return nullptr;

        return &(*it);
    }

    std::optional<std::string> getVideoCodecName(const MediaInfo& info)
    {
        const StreamInfo* videoStream{ getVideoStream(info) };
        if (!videoStream || videoStream->codecName.empty())
            return std::nullopt;

        return videoStream->codecName;
    }

    std::optional<std::chrono::duration<double>> getDuration(const MediaInfo& info)
    {
        if (info.duration)
            return info.duration;

        if (const StreamInfo * videoStream{ getVideoStream(info) })
            return videoStream->duration;

        return std::nullopt;
    }

    bool hasHdrMetadata(const MediaInfo& info)
    {
        for (const StreamInfo& stream : info.streams)
        {
            if (stream.codecType != "video")
                continue;

            if (stream.colorTransfer == "smpte2084" || stream.colorTransfer == "arib-std-b67" || stream.colorPrimaries == "bt2020")
                return true;

            const bool hasHdrSideData{ std::any_of(std::cbegin(stream.sideDataTypes), std::cend(stream.sideDataTypes), [](const std::string& sideDataType) {
                return sideDataType == "Mastering display metadata" || sideDataType == "Content light level metadata";
            }) };
            if (hasHdrSideData)
                return true;
        }

        return false;
    }
} // namespace vconv::av
