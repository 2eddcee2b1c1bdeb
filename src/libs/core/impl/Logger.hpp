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
#include <fstream>
#include <iosfwd>
#include <mutex>

#include "core/ILogger.hpp"

namespace blm::core::logging
{
    class Logger final : public ILogger
    {
    public:
        Logger(Severity minSeverity, const std::filesystem::path& logFilePath);
        Logger(Severity minSeverity, std::ostream& os);
        ~Logger() override = default;
        Logger(const Logger&) = delete;
        Logger& operator=(const Logger&) = delete;

    private:
        bool isSeverityActive(Severity severity) const override;
        void processLog(const Log& log) override;

        std::ostream& getStream(Severity severity);

        const Severity _minSeverity;
        std::ofstream _logFile;
        std::ostream* _forcedStream{}; // every severity goes there if set
        std::mutex _mutex;
    };
} // namespace blm::core::logging
