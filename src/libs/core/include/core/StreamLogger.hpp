/*
 * Copyright (C) 2019 Emeric Poupon
 *
 * This file is part of LPD.
 *
 * LPD is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * LPD is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with LPD.  If not, see <http://www.gnu.org/licenses/>.
 */

#pragma once

#include <mutex>
#include <ostream>

#include "core/ILogger.hpp"

namespace lpd::core::logging
{
    // Plain logger for tools: no timestamp, optional program prefix
    class StreamLogger final : public ILogger
    {
    public:
        StreamLogger(std::ostream& os, Severity minSeverity = defaultMinSeverity, std::string_view prefix = "");

    private:
        bool isSeverityActive(Severity severity) const override { return severity <= _minSeverity; }
        void processLog(const Log& log) override;
        void processLog(Module module, Severity severity, std::string_view message) override;

        std::mutex _mutex;
        std::ostream& _os;
        const Severity _minSeverity;
        const std::string _prefix;
    };
} // namespace lpd::core::logging
