/*
 * Copyright (C) 2013 Emeric Poupon
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

#include "Logger.hpp"

#include <Wt/WDateTime.h>

#include <algorithm>
#include <cassert>
#include <fstream>
#include <iostream>
#include <thread>

#include "core/Exception.hpp"
#include "core/String.hpp"

namespace lpd::core::logging
{
    const char* getModuleName(Module mod)
    {
        switch (mod)
        {
        case Module::BACKUP:
            return "BACKUP";
        case Module::CHILDPROCESS:
            return "CHILDPROC";
        case Module::COPY:
            return "COPY";
        case Module::DEVICES:
            return "DEVICES";
        case Module::DOWNLOAD:
            return "DOWNLOAD";
        case Module::JOBCODE:
            return "JOBCODE";
        case Module::MAIN:
            return "MAIN";
        case Module::OFFLOAD:
            return "OFFLOAD";
        case Module::PREFS:
            return "PREFS";
        case Module::PROGRESS:
            return "PROGRESS";
        case Module::RENAME:
            return "RENAME";
        case Module::SCAN:
            return "SCAN";
        case Module::UTILS:
            return "UTILS";
        case Module::WORKER:
            return "WORKER";
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

    Logger::OutputStream::OutputStream(std::ostream& os)
        : stream{ os }
    {
    }

    Logger::Logger(Severity minSeverity, const std::filesystem::path& logFilePath)
    {
        if (!logFilePath.empty())
        {
            _logFileStream = std::make_unique<std::ofstream>(logFilePath, std::ios::out | std::ios::app);
            if (!_logFileStream->is_open())
            {
                const std::error_code ec{ errno, std::generic_category() };
                throw LpdException{ "Cannot open log file '" + logFilePath.string() + "' for writing: " + ec.message() };
            }
        }

        // informational output goes to stdout, problems to stderr, everything to the log file if any
        auto outputFor{ [this](Severity severity) -> std::ostream& {
            if (_logFileStream)
                return *_logFileStream;

            return severity >= Severity::INFO ? std::cout : std::cerr;
        } };

        switch (minSeverity)
        {
        case Severity::DEBUG:
            addOutputStream(outputFor(Severity::DEBUG), Severity::DEBUG);
            [[fallthrough]];
        case Severity::INFO:
            addOutputStream(outputFor(Severity::INFO), Severity::INFO);
            [[fallthrough]];
        case Severity::WARNING:
            addOutputStream(outputFor(Severity::WARNING), Severity::WARNING);
            [[fallthrough]];
        case Severity::ERROR:
            addOutputStream(outputFor(Severity::ERROR), Severity::ERROR);
            [[fallthrough]];
        case Severity::FATAL:
            addOutputStream(outputFor(Severity::FATAL), Severity::FATAL);
            break;
        }
    }

    Logger::~Logger() = default;

    void Logger::addOutputStream(std::ostream& os, Severity severity)
    {
        auto it{ std::find_if(_outputStreams.begin(), _outputStreams.end(), [&os](const OutputStream& outputStream) { return &outputStream.stream == &os; }) };
        if (it == _outputStreams.end())
            it = _outputStreams.emplace(_outputStreams.end(), os);

        assert(!_severityToOutputStreamMap.contains(severity));
        _severityToOutputStreamMap.emplace(severity, &(*it));
    }

    bool Logger::isSeverityActive(Severity severity) const
    {
        return _severityToOutputStreamMap.contains(severity);
    }

    void Logger::processLog(const Log& log)
    {
        processLog(log.getModule(), log.getSeverity(), log.getMessage());
    }

    void Logger::processLog(Module module, Severity severity, std::string_view message)
    {
        assert(isSeverityActive(severity)); // should have been filtered out by a isSeverityActive call
        OutputStream* outputStream{ _severityToOutputStreamMap.at(severity) };
        const Wt::WDateTime now{ Wt::WDateTime::currentDateTime() };

        std::unique_lock lock{ outputStream->mutex };
        outputStream->stream << stringUtils::toISO8601String(now) << " " << std::this_thread::get_id() << " [" << getSeverityName(severity) << "] [" << getModuleName(module) << "] " << message << std::endl;
    }
} // namespace lpd::core::logging
