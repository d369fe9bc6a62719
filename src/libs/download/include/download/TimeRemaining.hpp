/*
 * Copyright (C) 2025 Emeric Poupon
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

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

#include "download/Types.hpp"

namespace lpd::download
{
    // Estimates the remaining download time from per device transfer rates
    class TimeRemaining
    {
    public:
        using Clock = std::chrono::steady_clock;

        explicit TimeRemaining(std::chrono::milliseconds minSampleInterval = std::chrono::seconds{ 1 });

        void addDevice(DeviceId id, std::uint64_t bytesToTransfer, Clock::time_point now);
        void removeDevice(DeviceId id);
        bool contains(DeviceId id) const { return _devices.contains(id); }
        void clear();

        void update(DeviceId id, std::uint64_t bytesTransferred, Clock::time_point now);
        // Bytes that will never be transferred (failed file)
        void excludeBytes(DeviceId id, std::uint64_t bytes);

        // Samples are not turned into rates while paused
        void pause();
        void resume(Clock::time_point now);
        void setTimeMark(DeviceId id, Clock::time_point now);

        // 0 once nothing is outstanding, unset as long as no rate could be computed
        std::optional<std::chrono::seconds> getTimeRemaining() const;

    private:
        struct DeviceRate
        {
            std::uint64_t bytesToTransfer{};
            std::uint64_t bytesTransferred{};
            std::uint64_t bytesAtMark{};
            Clock::time_point mark;
            std::optional<double> bytesPerSecond;
        };

        const std::chrono::milliseconds _minSampleInterval;
        std::map<DeviceId, DeviceRate> _devices;
        bool _paused{};
    };

    // Throttles the time remaining and speed notifications
    class TimeCheck
    {
    public:
        using Clock = std::chrono::steady_clock;

        explicit TimeCheck(std::chrono::milliseconds updateInterval = std::chrono::seconds{ 1 });

        void setDownloadMark(Clock::time_point now);
        void increment(std::uint64_t bytes);
        void pause();

        // Set to the transfer speed (bytes/s) if an update is due
        std::optional<double> checkForUpdate(Clock::time_point now);

    private:
        const std::chrono::milliseconds _updateInterval;
        std::optional<Clock::time_point> _mark;
        std::uint64_t _bytesSinceMark{};
    };

    // "About 5 seconds remaining", "About 2:05 minutes remaining"
    std::string formatTimeRemaining(std::chrono::seconds remaining);
    // "2.5 MB/s"
    std::string formatDownloadSpeed(double bytesPerSecond);
} // namespace lpd::download
