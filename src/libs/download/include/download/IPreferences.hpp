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

#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>
#include <string>
#include <vector>

#include "core/Exception.hpp"
#include "messages/Types.hpp"

namespace lpd::core
{
    class IConfig;
}

namespace lpd::download
{
    class PreferencesException : public core::LpdException
    {
    public:
        using core::LpdException::LpdException;
    };

    struct DownloadPreferences
    {
        std::filesystem::path photoDownloadFolder;
        std::filesystem::path videoDownloadFolder;
        messages::NamingPreferences naming{ "%Y/%Y%m%d", "%Y/%Y%m%d", "{name}{ext}", "{name}{ext}" };

        bool backupFiles{};
        bool backupDeviceAutodetection{ true };
        std::string photoBackupIdentifier{ "Photos" };
        std::string videoBackupIdentifier{ "Videos" };
        std::filesystem::path backupPhotoLocation;
        std::filesystem::path backupVideoLocation;
        bool backupDuplicateOverwrite{};
        bool verifyFile{ true };

        bool move{};
        bool autoUnmount{};
        bool autoDownloadAtStartup{};
        bool autoDownloadUponDeviceInsertion{};
        bool autoExit{};
        bool autoExitForce{};
        bool generateThumbnails{ true };

        bool deviceAutodetection{ true };
        bool deviceWithoutDcimAutodetection{};
        std::vector<std::filesystem::path> sources;
        std::filesystem::path thisComputerPath;
        std::vector<std::filesystem::path> backupDestinations;
        std::vector<std::string> ignoredPaths;
        std::vector<std::string> cameraBlacklist;
        std::vector<std::filesystem::path> pathBlacklist;
        std::vector<std::filesystem::path> pathWhitelist;
        bool ignoreOtherPhotoTypes{};
        std::uint32_t proximityThresholdSeconds{ 3600 };
    };

    DownloadPreferences readDownloadPreferences(core::IConfig& config);

    struct ValidityCheck
    {
        bool valid{ true };
        std::string diagnostic;
    };
    ValidityCheck checkValidity(const DownloadPreferences& preferences);

    class IPreferences
    {
    public:
        virtual ~IPreferences() = default;

        virtual const DownloadPreferences& getDownloadPreferences() const = 0;
        virtual ValidityCheck checkValidity() const = 0;

        // persisted state
        virtual messages::SequenceState getSequenceState() const = 0;
        virtual void setSequenceState(const messages::SequenceState& state) = 0;
        virtual std::vector<std::string> getJobCodes() const = 0;
        virtual void setJobCodes(std::span<const std::string> jobCodes) = 0;
    };

    // throws PreferencesException if the existing state file cannot be read
    std::unique_ptr<IPreferences> createPreferences(const DownloadPreferences& preferences, const std::filesystem::path& stateFilePath);
} // namespace lpd::download
