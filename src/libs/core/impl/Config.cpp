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

#include "Config.hpp"

#include "core/Exception.hpp"
#include "core/ILogger.hpp"

namespace vconv::core
{
    namespace
    {
        const char* getTypeName(libconfig::Setting::Type type)
        {
            switch (type)
            {
            case libconfig::Setting::TypeString:
                return "string";
            case libconfig::Setting::TypeInt:
            case libconfig::Setting::TypeInt64:
                return "integer";
            case libconfig::Setting::TypeBoolean:
                return "boolean";
            case libconfig::Setting::TypeList:
            case libconfig::Setting::TypeArray:
                return "list";
            default:
                break;
            }
            return "unknown";
        }

        bool isCompatible(libconfig::Setting::Type actualType, libconfig::Setting::Type expectedType)
        {
            if (expectedType == libconfig::Setting::TypeInt)
                return actualType == libconfig::Setting::TypeInt || actualType == libconfig::Setting::TypeInt64;
            if (expectedType == libconfig::Setting::TypeList)
                return actualType == libconfig::Setting::TypeList || actualType == libconfig::Setting::TypeArray;

            return actualType == expectedType;
        }
    } // namespace

    std::unique_ptr<IConfig> createConfig(const std::filesystem::path& p)
    {
        return std::make_unique<Config>(p);
    }

    Config::Config(const std::filesystem::path& p)
        : _path{ p }
    {
        try
        {
            _config.readFile(p.c_str());
        }
        catch (const libconfig::FileIOException&)
        {
            throw VconvException{ "Cannot open config file '" + p.string() + "'" };
        }
        catch (const libconfig::ParseException& e)
        {
            throw VconvException{ "Cannot parse config file '" + p.string() + "', line = " + std::to_string(e.getLine()) + ", error = '" + e.getError() + "'" };
        }
    }

    const libconfig::Setting* Config::findSetting(std::string_view setting, libconfig::Setting::Type expectedType)
    {
        const std::string path{ setting };
        if (!_config.exists(path))
            return nullptr;

        const libconfig::Setting& res{ _config.lookup(path) };
        if (!isCompatible(res.getType(), expectedType))
        {
            VCONV_LOG(MAIN, ERROR, "Setting '" << setting << "' in '" << _path.string() << "' must be a " << getTypeName(expectedType) << ", using default value");
            return nullptr;
        }

        return &res;
    }

    std::string_view Config::getString(std::string_view setting, std::string_view def)
    {
        const libconfig::Setting* value{ findSetting(setting, libconfig::Setting::TypeString) };
        return value ? std::string_view{ value->c_str() } : def;
    }

    void Config::visitStrings(std::string_view setting, std::function<void(std::string_view)> func, std::initializer_list<std::string_view> defs)
    {
        const libconfig::Setting* values{ findSetting(setting, libconfig::Setting::TypeList) };
        if (!values)
        {
            for (std::string_view def : defs)
                func(def);
            return;
        }

        for (int i{}; i < values->getLength(); ++i)
        {
            const libconfig::Setting& value{ (*values)[i] };
            if (value.getType() != libconfig::Setting::TypeString)
            {
                VCONV_LOG(MAIN, ERROR, "Setting '" << setting << "' in '" << _path.string() << "' must only contain strings, skipping entry " << i);
                continue;
            }

            func(value.c_str());
        }
    }

    std::filesystem::path Config::getPath(std::string_view setting, const std::filesystem::path& def)
    {
        const libconfig::Setting* value{ findSetting(setting, libconfig::Setting::TypeString) };
        return value ? std::filesystem::path{ value->c_str() } : def;
    }

    unsigned long Config::getULong(std::string_view setting, unsigned long def)
    {
        const long value{ getLong(setting, static_cast<long>(def)) };
        if (value < 0)
            throw VconvException{ "Setting '" + std::string{ setting } + "' in '" + _path.string() + "' must be a positive value" };

        return static_cast<unsigned long>(value);
    }

    long Config::getLong(std::string_view setting, long def)
    {
        const libconfig::Setting* value{ findSetting(setting, libconfig::Setting::TypeInt) };
        if (!value)
            return def;

        if (value->getType() == libconfig::Setting::TypeInt64)
            return static_cast<long>(static_cast<long long>(*value));

        return static_cast<int>(*value);
    }

    bool Config::getBool(std::string_view setting, bool def)
    {
        const libconfig::Setting* value{ findSetting(setting, libconfig::Setting::TypeBoolean) };
        return value ? static_cast<bool>(*value) : def;
    }
} // namespace vconv::core
