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

#include "download/TimeRemaining.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

#include "core/String.hpp"

namespace lpd::download
{
    TimeRemaining::TimeRemaining(std::chrono::milliseconds minSampleInterval)
        : _minSampleInterval{ minSampleInterval }
    {
    }

    void TimeRemaining::addDevice(DeviceId id, std::uint64_t bytesToTransfer, Clock::time_point now)
    {
        DeviceRate device;
        device.bytesToTransfer = bytesToTransfer;
        device.mark = now;
        _devices[id] = device;
    }

    void TimeRemaining::removeDevice(DeviceId id)
    {
        _devices.erase(id);
    }

    void TimeRemaining::clear()
    {
        _devices.clear();
        _paused = false;
    }

    void TimeRemaining::update(DeviceId id, std::uint64_t bytesTransferred, Clock::time_point now)
    {
        auto it{ _devices.find(id) };
        if (it == std::end(_devices))
            return;

        DeviceRate& device{ it->second };
        device.bytesTransferred += bytesTransferred;

        if (_paused)
            return;

        const auto elapsed{ now - device.mark };
        if (elapsed < _minSampleInterval)
            return;

        const double seconds{ std::chrono::duration<double>(elapsed).count() };
        device.bytesPerSecond = (device.bytesTransferred - device.bytesAtMark) / seconds;
        device.bytesAtMark = device.bytesTransferred;
        device.mark = now;
    }

    void TimeRemaining::excludeBytes(DeviceId id, std::uint64_t bytes)
    {
        auto it{ _devices.find(id) };
        if (it == std::end(_devices))
            return;

        it->second.bytesToTransfer -= std::min(it->second.bytesToTransfer, bytes);
    }

    void TimeRemaining::pause()
    {
        _paused = true;
    }

    void TimeRemaining::resume(Clock::time_point now)
    {
        _paused = false;
        for (auto& [id, device] : _devices)
            setTimeMark(id, now);
    }

    void TimeRemaining::setTimeMark(DeviceId id, Clock::time_point now)
    {
        auto it{ _devices.find(id) };
        if (it == std::end(_devices))
            return;

        // bytes moved while paused must not count in the next rate
        it->second.mark = now;
        it->second.bytesAtMark = it->second.bytesTransferred;
    }

    std::optional<std::chrono::seconds> TimeRemaining::getTimeRemaining() const
    {
        std::uint64_t outstanding{};
        double rate{};
        for (const auto& [id, device] : _devices)
        {
            if (device.bytesTransferred < device.bytesToTransfer)
                outstanding += device.bytesToTransfer - device.bytesTransferred;
            if (device.bytesPerSecond)
                rate += *device.bytesPerSecond;
        }

        if (outstanding == 0)
            return std::chrono::seconds{ 0 };
        if (rate <= 0)
            return std::nullopt;

        return std::chrono::seconds{ std::llround(outstanding / rate) };
    }

    TimeCheck::TimeCheck(std::chrono::milliseconds updateInterval)
        : _updateInterval{ updateInterval }
    {
    }

    void TimeCheck::setDownloadMark(Clock::time_point now)
    {
        _mark = now;
        _bytesSinceMark = 0;
    }

    void TimeCheck::increment(std::uint64_t bytes)
    {
        _bytesSinceMark += bytes;
    }

    void TimeCheck::pause()
    {
        _mark.reset();
    }

    std::optional<double> TimeCheck::checkForUpdate(Clock::time_point now)
    {
        if (!_mark)
            return std::nullopt;

        const auto elapsed{ now - *_mark };
        if (elapsed < _updateInterval)
            return std::nullopt;

        const double speed{ _bytesSinceMark / std::chrono::duration<double>(elapsed).count() };
        setDownloadMark(now);

        return speed;
    }

    std::string formatTimeRemaining(std::chrono::seconds remaining)
    {
        const long long secs{ remaining.count() };

        if (secs <= 0)
            return "";
        if (secs == 1)
            return "About 1 second remaining";
        if (secs < 60)
            return "About " + std::to_string(secs) + " seconds remaining";
        if (secs == 60)
            return "About 1 minute remaining";

        std::ostringstream oss;
        oss << "About " << secs / 60 << ":" << std::setw(2) << std::setfill('0') << secs % 60 << " minutes remaining";
        return oss.str();
    }

    std::string formatDownloadSpeed(double bytesPerSecond)
    {
        return core::stringUtils::formatByteSize(static_cast<std::uint64_t>(std::max(0., bytesPerSecond))) + "/s";
    }
} // namespace lpd::download
