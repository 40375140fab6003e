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

#include "Logger.hpp"

#include <Wt/WDateTime.h>

#include <cassert>
#include <cerrno>
#include <iostream>
#include <system_error>
#include <thread>

#include "core/Exception.hpp"
#include "core/String.hpp"

namespace vconv::core::logging
{
    const char* getModuleName(Module mod)
    {
        switch (mod)
        {
        case Module::CHILDPROCESS:
            return "CHILDPROC";
        case Module::CONVERSION:
            return "CONVERSION";
        case Module::ENCODING:
            return "ENCODING";
        case Module::MAIN:
            return "MAIN";
        case Module::PROBE:
            return "PROBE";
        case Module::SERVICE:
            return "SERVICE";
        }
        return "";
    }

    const char* getSeverityName(Severity sev)
    {
        switch (sev)
        {
        case Severity::FATAL:
            return "fatal";
        case Severity::ERROR:
            return "error";
        case Severity::WARNING:
            return "warning";
        case Severity::INFO:
            return "info";
        case Severity::DEBUG:
            return "debug";
        }
        return "";
    }

    Log::Log(ILogger& logger, Module module, Severity severity)
        : _logger{ logger }
        , _module{ module }
        , _severity{ severity }
    {
    }

    Log::~Log()
    {
        assert(_logger.isSeverityActive(_severity));
        _logger.processLog(*this);
    }

    std::string Log::getMessage() const
    {
        return _oss.str();
    }

    std::unique_ptr<ILogger> createLogger(Severity minSeverity, const std::filesystem::path& logFilePath)
    {
        return std::make_unique<Logger>(minSeverity, logFilePath);
    }

    Logger::Logger(Severity minSeverity, const std::filesystem::path& logFilePath)
        : _minSeverity{ minSeverity }
    {
        if (logFilePath.empty())
            return;

        _logFile.open(logFilePath, std::ios::out | std::ios::app);
        if (!_logFile.is_open())
        {
            const std::error_code ec{ errno, std::generic_category() };
            throw VconvException{ "Cannot open log file '" + logFilePath.string() + "' for writing: " + ec.message() };
        }
    }

    bool Logger::isSeverityActive(Severity severity) const
    {
        // Severity enum is ordered from the most to the least critical
        return static_cast<int>(severity) <= static_cast<int>(_minSeverity);
    }

    std::ostream& Logger::getOutputStream(Severity severity)
    {
        if (_logFile.is_open())
            return _logFile;

        if (severity == Severity::INFO || severity == Severity::DEBUG)
            return std::cout;

        return std::cerr;
    }

    void Logger::processLog(const Log& log)
    {
        processLog(log.getModule(), log.getSeverity(), log.getMessage());
    }

    void Logger::processLog(Module module, Severity severity, std::string_view message)
    {
        const Wt::WDateTime now{ Wt::WDateTime::currentDateTime() };

        const std::scoped_lock lock{ _mutex };
        getOutputStream(severity) << stringUtils::toISO8601String(now) << " " << std::this_thread::get_id() << " [" << getSeverityName(severity) << "] [" << getModuleName(module) << "] " << message << std::endl;
    }
} // namespace vconv::core::logging
