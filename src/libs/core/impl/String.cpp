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

#include "core/String.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>

#include <Wt/WDateTime.h>

namespace vconv::core::stringUtils
{
    namespace details
    {
        template<typename StringType>
        std::string joinStrings(std::span<const StringType> strings, std::string_view delimiter)
        {
            std::string res;
            bool first{ true };

            for (const StringType& str : strings)
            {
                if (!first)
                    res += delimiter;
                res += str;
                first = false;
            }

            return res;
        }

        bool isShellSafe(char c)
        {
            return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.' || c == '/' || c == ':' || c == '=' || c == '+' || c == ',';
        }
    } // namespace details

    template<>
    std::optional<std::string> readAs(std::string_view str)
    {
        return std::string{ str };
    }

    template<>
    std::optional<bool> readAs(std::string_view str)
    {
        if (str == "1" || stringCaseInsensitiveEqual(str, "true"))
            return true;
        else if (str == "0" || stringCaseInsensitiveEqual(str, "false"))
            return false;

        return std::nullopt;
    }

    std::string joinStrings(std::span<const std::string_view> strings, std::string_view delimiter)
    {
        return details::joinStrings(strings, delimiter);
    }

    std::string joinStrings(std::span<const std::string> strings, std::string_view delimiter)
    {
        return details::joinStrings(strings, delimiter);
    }

    std::string stringToLower(std::string_view str)
    {
        std::string res;
        res.reserve(str.size());

        std::transform(std::cbegin(str), std::cend(str), std::back_inserter(res), [](unsigned char c) { return std::tolower(c); });

        return res;
    }

    bool stringCaseInsensitiveEqual(std::string_view strA, std::string_view strB)
    {
        if (strA.size() != strB.size())
            return false;

        for (std::size_t i{}; i < strA.size(); ++i)
        {
            if (std::tolower(static_cast<unsigned char>(strA[i])) != std::tolower(static_cast<unsigned char>(strB[i])))
                return false;
        }

        return true;
    }

    bool stringCaseInsensitiveContains(std::string_view str, std::string_view strtoFind)
    {
        const auto it{ std::search(
            std::cbegin(str), std::cend(str),
            std::cbegin(strtoFind), std::cend(strtoFind),
            [](char chA, char chB) { return std::tolower(static_cast<unsigned char>(chA)) == std::tolower(static_cast<unsigned char>(chB)); }) };
        return (it != std::cend(str));
    }

    std::string shellQuote(std::string_view arg)
    {
        if (!arg.empty() && std::all_of(std::cbegin(arg), std::cend(arg), details::isShellSafe))
            return std::string{ arg };

        std::string res{ "'" };
        for (const char c : arg)
        {
            if (c == '\'')
                res += "'\\''";
            else
                res += c;
        }
        res += "'";

        return res;
    }

    std::string toISO8601String(const Wt::WDateTime& dateTime)
    {
        if (dateTime.isValid())
        {
            // assume UTC
            return dateTime.toString("yyyy-MM-ddThh:mm:ss.zzz", false).toUTF8() + 'Z';
        }

        return "";
    }

    std::string formatDuration(std::chrono::duration<double> duration)
    {
        const auto totalSeconds{ std::max<long long>(0, static_cast<long long>(duration.count())) };

        std::ostringstream oss;
        oss << std::setfill('0')
            << std::setw(2) << (totalSeconds / 3600) << ':'
            << std::setw(2) << ((totalSeconds % 3600) / 60) << ':'
            << std::setw(2) << (totalSeconds % 60);

        return oss.str();
    }

    std::string formatFileSize(std::uintmax_t size)
    {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(2) << (static_cast<double>(size) / (1024 * 1024)) << " MB";
        return oss.str();
    }
} // namespace vconv::core::stringUtils
