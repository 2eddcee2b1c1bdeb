/*
 * Copyright (C) 2013 Emeric Poupon
 *
 * This file is part of BLM.
 *
 * BLM is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * BLM is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with BLM.  If not, see <http://www.gnu.org/licenses/>.
 */

#include "Logger.hpp"

#include <Wt/WDateTime.h>

#include <array>
#include <cassert>
#include <iostream>
#include <thread>

#include "core/Exception.hpp"
#include "core/String.hpp"

namespace blm::core::logging
{
    const char* getModuleName(Module mod)
    {
        switch (mod)
        {
        case Module::DB:
            return "DB";
        case Module::IDENTITY:
            return "IDENTITY";
        case Module::INDEX:
            return "INDEX";
        case Module::MAIN:
            return "MAIN";
        case Module::MATCHING:
            return "MATCHING";
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

    std::optional<Severity> getSeverityFromName(std::string_view name)
    {
        constexpr std::array severities{ Severity::FATAL, Severity::ERROR, Severity::WARNING, Severity::INFO, Severity::DEBUG };

        for (const Severity severity : severities)
        {
            if (stringUtils::stringCaseInsensitiveEqual(name, getSeverityName(severity)))
                return severity;
        }

        return std::nullopt;
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

    std::unique_ptr<ILogger> createStreamLogger(Severity minSeverity, std::ostream& os)
    {
        return std::make_unique<Logger>(minSeverity, os);
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
            throw BlmException{ "Cannot open log file '" + logFilePath.string() + "' for writing: " + ec.message() };
        }
        _forcedStream = &_logFile;
    }

    Logger::Logger(Severity minSeverity, std::ostream& os)
        : _minSeverity{ minSeverity }
        , _forcedStream{ &os }
    {
    }

    bool Logger::isSeverityActive(Severity severity) const
    {
        return severity <= _minSeverity;
    }

    std::ostream& Logger::getStream(Severity severity)
    {
        if (_forcedStream)
            return *_forcedStream;

        return severity <= Severity::WARNING ? std::cerr : std::cout;
    }

    void Logger::processLog(const Log& log)
    {
        const Wt::WDateTime now{ Wt::WDateTime::currentDateTime() };

        std::scoped_lock lock{ _mutex };
        getStream(log.getSeverity()) << stringUtils::toISO8601String(now) << " " << std::this_thread::get_id() << " [" << getSeverityName(log.getSeverity()) << "] [" << getModuleName(log.getModule()) << "] " << log.getMessage() << std::endl;
    }
} // namespace blm::core::logging
