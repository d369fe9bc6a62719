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

#include "download/JobCodeCoordinator.hpp"

#include <algorithm>
#include <utility>

#include "core/ILogger.hpp"
#include "core/String.hpp"

namespace lpd::download
{
    namespace
    {
        constexpr std::string_view jobCodeToken{ "{jobcode}" };
    }

    JobCodeCoordinator::JobCodeCoordinator(std::vector<std::string> previousCodes)
        : _previousCodes{ std::move(previousCodes) }
    {
    }

    bool JobCodeCoordinator::isUsedBy(const messages::NamingPreferences& naming)
    {
        for (const std::string* pattern : { &naming.photoSubfolder, &naming.videoSubfolder, &naming.photoRename, &naming.videoRename })
        {
            if (pattern->find(jobCodeToken) != std::string::npos)
                return true;
        }

        return false;
    }

    bool JobCodeCoordinator::isRequired(const messages::NamingPreferences& naming) const
    {
        return _code.empty() && isUsedBy(naming);
    }

    bool JobCodeCoordinator::request(std::span<const DeviceId> devices)
    {
        for (const DeviceId id : devices)
        {
            if (std::find(std::cbegin(_waitingDevices), std::cend(_waitingDevices), id) == std::cend(_waitingDevices))
                _waitingDevices.push_back(id);
        }

        if (_promptOutstanding)
        {
            LPD_LOG(JOBCODE, DEBUG, "Job code prompt already outstanding, " << _waitingDevices.size() << " device(s) waiting");
            return false;
        }

        _promptOutstanding = true;
        return true;
    }

    std::vector<DeviceId> JobCodeCoordinator::provide(const std::string& code, bool remember)
    {
        _code = core::stringUtils::stringTrim(code);
        _promptOutstanding = false;

        if (remember && !_code.empty())
        {
            std::erase(_previousCodes, _code);
            _previousCodes.insert(std::begin(_previousCodes), _code);
        }

        LPD_LOG(JOBCODE, DEBUG, "Job code set to '" << _code << "'");

        return std::exchange(_waitingDevices, {});
    }

    std::vector<DeviceId> JobCodeCoordinator::cancel()
    {
        _promptOutstanding = false;
        return std::exchange(_waitingDevices, {});
    }

    void JobCodeCoordinator::removeWaitingDevice(DeviceId id)
    {
        std::erase(_waitingDevices, id);
    }
} // namespace lpd::download
