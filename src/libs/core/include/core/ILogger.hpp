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

#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

#include "core/Service.hpp"

namespace blm::core::logging
{
    enum class Severity
    {
        FATAL,
        ERROR,
        WARNING,
        INFO,
        DEBUG,
    };

    enum class Module
    {
        DB,
        IDENTITY,
        INDEX,
        MAIN,
        MATCHING,
    };

    const char* getModuleName(Module mod);
    const char* getSeverityName(Severity sev);
    std::optional<Severity> getSeverityFromName(std::string_view name);

    class ILogger;
    class Log
    {
    public:
        Log(ILogger& logger, Module module, Severity severity);
        ~Log();

        Module getModule() const { return _module; }
        Severity getSeverity() const { return _severity; }
        std::string getMessage() const;

        std::ostringstream& getOstream() { return _oss; }

    private:
        Log(const Log&) = delete;
        Log& operator=(const Log&) = delete;

        ILogger& _logger;
        Module _module;
        Severity _severity;
        std::ostringstream _oss;
    };

    class ILogger
    {
    public:
        virtual ~ILogger() = default;

        virtual bool isSeverityActive(Severity severity) const = 0;
        virtual void processLog(const Log& log) = 0;
    };

    static constexpr Severity defaultMinSeverity{ Severity::INFO };
    // Logs to logFilePath if set, otherwise errors and warnings go to stderr and the rest to stdout
    std::unique_ptr<ILogger> createLogger(Severity minSeverity = defaultMinSeverity, const std::filesystem::path& logFilePath = {});
    // For tests, logs everything up to minSeverity to os
    std::unique_ptr<ILogger> createStreamLogger(Severity minSeverity, std::ostream& os);
} // namespace blm::core::logging

#define BLM_LOG(module, severity, message)                                                                                                                               \
    do                                                                                                                                                                   \
    {                                                                                                                                                                    \
        if (auto* logger_{ ::blm::core::Service<::blm::core::logging::ILogger>::get() }; logger_ && logger_->isSeverityActive(::blm::core::logging::Severity::severity)) \
            ::blm::core::logging::Log{ *logger_, ::blm::core::logging::Module::module, ::blm::core::logging::Severity::severity }.getOstream() << message;               \
    } while (0)

#define BLM_LOG_IF(module, severity, cond, message)                                                                                                                              \
    do                                                                                                                                                                           \
    {                                                                                                                                                                            \
        if (auto* logger_{ ::blm::core::Service<::blm::core::logging::ILogger>::get() }; logger_ && logger_->isSeverityActive(::blm::core::logging::Severity::severity) && cond) \
            ::blm::core::logging::Log{ *logger_, ::blm::core::logging::Module::module, ::blm::core::logging::Severity::severity }.getOstream() << message;                       \
    } while (0)
