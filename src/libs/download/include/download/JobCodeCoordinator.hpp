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

#include <span>
#include <string>
#include <vector>

#include "download/Types.hpp"
#include "messages/Types.hpp"

namespace lpd::download
{
    // Current job code, previously used codes and the single outstanding prompt
    class JobCodeCoordinator
    {
    public:
        explicit JobCodeCoordinator(std::vector<std::string> previousCodes = {});
        JobCodeCoordinator(const JobCodeCoordinator&) = delete;
        JobCodeCoordinator& operator=(const JobCodeCoordinator&) = delete;

        static bool isUsedBy(const messages::NamingPreferences& naming);
        // naming needs a job code and none is set
        bool isRequired(const messages::NamingPreferences& naming) const;

        bool isPromptOutstanding() const { return _promptOutstanding; }

        // Adds devices to the waiting list
        // returns true if a prompt has to be shown (no other prompt outstanding)
        bool request(std::span<const DeviceId> devices);
        // Returns the devices that were waiting for the code
        std::vector<DeviceId> provide(const std::string& code, bool remember);
        std::vector<DeviceId> cancel();
        void removeWaitingDevice(DeviceId id);

        const std::string& getCode() const { return _code; }
        // most recent first
        const std::vector<std::string>& getPreviousCodes() const { return _previousCodes; }

        // End of a download cycle
        void resetCode() { _code.clear(); }

    private:
        std::string _code;
        std::vector<std::string> _previousCodes;
        bool _promptOutstanding{};
        std::vector<DeviceId> _waitingDevices;
    };
} // namespace lpd::download
