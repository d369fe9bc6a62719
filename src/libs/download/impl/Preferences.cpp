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

#include "Preferences.hpp"

#include <cstdlib>

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <Wt/WDate.h>

#include "core/IConfig.hpp"
#include "core/ILogger.hpp"
#include "core/Path.hpp"
#include "core/String.hpp"

namespace lpd::download
{
    namespace
    {
        std::filesystem::path getHomeFolder()
        {
            const char* home{ std::getenv("HOME") };
            return home ? std::filesystem::path{ home } : std::filesystem::path{ "/" };
        }

        std::vector<std::string> readStrings(core::IConfig& config, std::string_view setting)
        {
            std::vector<std::string> res;
            config.visitStrings(setting, [&](std::string_view value) {
                res.emplace_back(value);
            });
            return res;
        }

        std::vector<std::filesystem::path> readPaths(core::IConfig& config, std::string_view setting)
        {
            std::vector<std::filesystem::path> res;
            config.visitStrings(setting, [&](std::string_view value) {
                if (!value.empty())
                    res.emplace_back(value);
            });
            return res;
        }
    } // namespace

    DownloadPreferences readDownloadPreferences(core::IConfig& config)
    {
        DownloadPreferences prefs;

        prefs.photoDownloadFolder = config.getPath("photo-download-folder", getHomeFolder() / "Pictures");
        prefs.videoDownloadFolder = config.getPath("video-download-folder", getHomeFolder() / "Videos");
        prefs.naming.photoSubfolder = config.getString("photo-subfolder", prefs.naming.photoSubfolder);
        prefs.naming.videoSubfolder = config.getString("video-subfolder", prefs.naming.videoSubfolder);
        prefs.naming.photoRename = config.getString("photo-rename", prefs.naming.photoRename);
        prefs.naming.videoRename = config.getString("video-rename", prefs.naming.videoRename);

        prefs.backupFiles = config.getBool("backup-files", prefs.backupFiles);
        prefs.backupDeviceAutodetection = config.getBool("backup-device-autodetection", prefs.backupDeviceAutodetection);
        prefs.photoBackupIdentifier = config.getString("photo-backup-identifier", prefs.photoBackupIdentifier);
        prefs.videoBackupIdentifier = config.getString("video-backup-identifier", prefs.videoBackupIdentifier);
        prefs.backupPhotoLocation = config.getPath("backup-photo-location");
        prefs.backupVideoLocation = config.getPath("backup-video-location");
        prefs.backupDuplicateOverwrite = config.getBool("backup-duplicate-overwrite", prefs.backupDuplicateOverwrite);
        prefs.verifyFile = config.getBool("verify-file", prefs.verifyFile);

        prefs.move = config.getBool("move", prefs.move);
        prefs.autoUnmount = config.getBool("auto-unmount", prefs.autoUnmount);
        prefs.autoDownloadAtStartup = config.getBool("auto-download-at-startup", prefs.autoDownloadAtStartup);
        prefs.autoDownloadUponDeviceInsertion = config.getBool("auto-download-upon-device-insertion", prefs.autoDownloadUponDeviceInsertion);
        prefs.autoExit = config.getBool("auto-exit", prefs.autoExit);
        prefs.autoExitForce = config.getBool("auto-exit-force", prefs.autoExitForce);
        prefs.generateThumbnails = config.getBool("generate-thumbnails", prefs.generateThumbnails);

        prefs.deviceAutodetection = config.getBool("device-autodetection", prefs.deviceAutodetection);
        prefs.deviceWithoutDcimAutodetection = config.getBool("device-without-dcim-autodetection", prefs.deviceWithoutDcimAutodetection);
        prefs.sources = readPaths(config, "sources");
        prefs.thisComputerPath = config.getPath("this-computer-path");
        prefs.backupDestinations = readPaths(config, "backup-destinations");
        prefs.ignoredPaths = readStrings(config, "ignored-paths");
        prefs.cameraBlacklist = readStrings(config, "camera-blacklist");
        prefs.pathBlacklist = readPaths(config, "path-blacklist");
        prefs.pathWhitelist = readPaths(config, "path-whitelist");
        prefs.ignoreOtherPhotoTypes = config.getBool("ignore-other-photo-types", prefs.ignoreOtherPhotoTypes);
        prefs.proximityThresholdSeconds = static_cast<std::uint32_t>(config.getULong("proximity-threshold-seconds", prefs.proximityThresholdSeconds));

        return prefs;
    }

    ValidityCheck checkValidity(const DownloadPreferences& prefs)
    {
        if (prefs.naming.photoRename.empty())
            return ValidityCheck{ false, "Photo rename pattern is empty" };
        if (prefs.naming.videoRename.empty())
            return ValidityCheck{ false, "Video rename pattern is empty" };

        if (prefs.backupFiles)
        {
            if (prefs.backupDeviceAutodetection)
            {
                if (prefs.photoBackupIdentifier.empty())
                    return ValidityCheck{ false, "Photo backup identifier is empty" };
                if (prefs.videoBackupIdentifier.empty())
                    return ValidityCheck{ false, "Video backup identifier is empty" };
            }
            else
            {
                if (prefs.backupPhotoLocation.empty())
                    return ValidityCheck{ false, "Photo backup location is not set" };
                if (prefs.backupVideoLocation.empty())
                    return ValidityCheck{ false, "Video backup location is not set" };
            }
        }

        return ValidityCheck{};
    }

    std::unique_ptr<IPreferences> createPreferences(const DownloadPreferences& preferences, const std::filesystem::path& stateFilePath)
    {
        return std::make_unique<Preferences>(preferences, stateFilePath);
    }

    Preferences::Preferences(const DownloadPreferences& preferences, const std::filesystem::path& stateFilePath)
        : _preferences{ preferences }
        , _stateFilePath{ stateFilePath }
    {
        readState();
    }

    ValidityCheck Preferences::checkValidity() const
    {
        return download::checkValidity(_preferences);
    }

    void Preferences::setSequenceState(const messages::SequenceState& state)
    {
        _sequenceState = state;
        writeState();

        LPD_LOG(PREFS, DEBUG, "Saved sequence values: stored sequence no = " << state.storedSequenceNo << ", downloads today = " << state.downloadsTodayCount << " (" << state.downloadsTodayDate << ")");
    }

    void Preferences::setJobCodes(std::span<const std::string> jobCodes)
    {
        _jobCodes.assign(std::cbegin(jobCodes), std::cend(jobCodes));
        writeState();
    }

    void Preferences::readState()
    {
        if (!std::filesystem::exists(_stateFilePath))
        {
            LPD_LOG(PREFS, INFO, "No state file found at '" << _stateFilePath.string() << "', starting from scratch");
            return;
        }

        try
        {
            boost::property_tree::ptree root;
            boost::property_tree::read_json(_stateFilePath.string(), root);

            _sequenceState.storedSequenceNo = root.get<std::uint32_t>("stored-sequence-no", 0);
            _sequenceState.downloadsTodayDate = root.get<std::string>("downloads-today.date", "");
            _sequenceState.downloadsTodayCount = root.get<std::uint32_t>("downloads-today.count", 0);
            if (!_sequenceState.downloadsTodayDate.empty() && !core::stringUtils::fromISO8601DateString(_sequenceState.downloadsTodayDate).isValid())
                throw PreferencesException{ "Cannot read state file '" + _stateFilePath.string() + "': invalid downloads-today date '" + _sequenceState.downloadsTodayDate + "'" };

            _jobCodes.clear();
            if (const auto jobCodes{ root.get_child_optional("job-codes") })
            {
                for (const auto& [key, node] : *jobCodes)
                    _jobCodes.push_back(node.get_value<std::string>());
            }
        }
        catch (const boost::property_tree::ptree_error& error)
        {
            throw PreferencesException{ "Cannot read state file '" + _stateFilePath.string() + "': " + error.what() };
        }
    }

    void Preferences::writeState() const
    {
        if (_stateFilePath.has_parent_path() && !core::pathUtils::ensureDirectory(_stateFilePath.parent_path()))
        {
            LPD_LOG(PREFS, ERROR, "Cannot create directory for state file '" << _stateFilePath.string() << "'");
            return;
        }

        try
        {
            boost::property_tree::ptree root;

            root.put("stored-sequence-no", _sequenceState.storedSequenceNo);
            root.put("downloads-today.date", _sequenceState.downloadsTodayDate);
            root.put("downloads-today.count", _sequenceState.downloadsTodayCount);

            boost::property_tree::ptree jobCodes;
            for (const std::string& jobCode : _jobCodes)
            {
                boost::property_tree::ptree node;
                node.put_value(jobCode);
                jobCodes.push_back(std::make_pair("", node));
            }
            root.add_child("job-codes", jobCodes);

            boost::property_tree::write_json(_stateFilePath.string(), root);
        }
        catch (const boost::property_tree::ptree_error& error)
        {
            LPD_LOG(PREFS, ERROR, "Cannot write state file '" << _stateFilePath.string() << "': " << error.what());
        }
    }
} // namespace lpd::download
