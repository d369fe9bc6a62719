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

#include <filesystem>
#include <string>
#include <vector>

#include "download/IPreferences.hpp"

namespace lpd::download
{
    class Preferences : public IPreferences
    {
    public:
        Preferences(const DownloadPreferences& preferences, const std::filesystem::path& stateFilePath);
        ~Preferences() override = default;
        Preferences(const Preferences&) = delete;
        Preferences& operator=(const Preferences&) = delete;

    private:
        const DownloadPreferences& getDownloadPreferences() const override { return _preferences; }
        ValidityCheck checkValidity() const override;

        messages::SequenceState getSequenceState() const override { return _sequenceState; }
        void setSequenceState(const messages::SequenceState& state) override;
        std::vector<std::string> getJobCodes() const override { return _jobCodes; }
        void setJobCodes(std::span<const std::string> jobCodes) override;

        void readState();
        void writeState() const;

        const DownloadPreferences _preferences;
        const std::filesystem::path _stateFilePath;
        messages::SequenceState _sequenceState;
        std::vector<std::string> _jobCodes;
    };
} // namespace lpd::download
