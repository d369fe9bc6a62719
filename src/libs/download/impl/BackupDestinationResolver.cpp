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

#include "download/BackupDestinationResolver.hpp"

#include "core/ILogger.hpp"
#include "core/Path.hpp"

namespace lpd::download
{
    BackupDestinationResolver::BackupDestinationResolver(const BackupResolverSettings& settings)
        : _settings{ settings }
        , _identifierFolders{ settings.photoIdentifier, settings.videoIdentifier }
    {
    }

    void BackupDestinationResolver::updateCounts(BackupLocationType type, bool increment)
    {
        for (const FileType fileType : { FileType::Photo, FileType::Video })
        {
            if (!messages::canBackup(type, fileType))
                continue;

            if (increment)
                _destinationCounts[fileType] += 1;
            else
                _destinationCounts[fileType] -= 1;
        }
    }

    std::optional<BackupLocationType> BackupDestinationResolver::checkCapability(const std::filesystem::path& path) const
    {
        if (_settings.autodetection)
        {
            auto hasWritableFolder{ [&](FileType type) {
                const std::filesystem::path& folder{ _identifierFolders[type] };
                return !folder.empty() && core::pathUtils::isWritableDirectory(path / folder);
            } };
            const bool photos{ hasWritableFolder(FileType::Photo) };
            const bool videos{ hasWritableFolder(FileType::Video) };

            if (photos && videos)
                return BackupLocationType::PhotosAndVideos;
            if (photos)
                return BackupLocationType::Photos;
            if (videos)
                return BackupLocationType::Videos;

            return std::nullopt;
        }

        const bool photos{ !_settings.photoLocation.empty() && path == _settings.photoLocation };
        const bool videos{ !_settings.videoLocation.empty() && path == _settings.videoLocation };
        if (photos && videos)
            return BackupLocationType::PhotosAndVideos;
        if (photos)
            return BackupLocationType::Photos;
        if (videos)
            return BackupLocationType::Videos;

        return std::nullopt;
    }

    BackupDestinationResolver::AddResult BackupDestinationResolver::add(const std::filesystem::path& path, BackupLocationType type)
    {
        auto it{ _destinations.find(path) };
        if (it != std::end(_destinations))
        {
            BackupDestination& destination{ it->second };
            if (destination.type == type)
                return AddResult{ destination.id, false };

            LPD_LOG(BACKUP, INFO, "Backup destination '" << path.string() << "' now used for " << messages::toString(type));
            updateCounts(destination.type, false);
            destination.type = type;
            updateCounts(destination.type, true);
            return AddResult{ destination.id, false };
        }

        const BackupDestination destination{ _nextId++, path, type };
        _destinations.emplace(path, destination);
        updateCounts(type, true);

        LPD_LOG(BACKUP, INFO, "Backing up " << messages::toString(type) << " to '" << path.string() << "'");

        return AddResult{ destination.id, true };
    }

    std::optional<BackupDestination> BackupDestinationResolver::remove(const std::filesystem::path& path)
    {
        auto it{ _destinations.find(path) };
        if (it == std::end(_destinations))
            return std::nullopt;

        const BackupDestination destination{ it->second };
        _destinations.erase(it);
        updateCounts(destination.type, false);

        LPD_LOG(BACKUP, INFO, "Backup destination '" << path.string() << "' removed");

        return destination;
    }

    const BackupDestination* BackupDestinationResolver::find(const std::filesystem::path& path) const
    {
        auto it{ _destinations.find(path) };
        return it != std::cend(_destinations) ? &it->second : nullptr;
    }

    const BackupDestination* BackupDestinationResolver::find(BackupDestinationId id) const
    {
        for (const auto& [path, destination] : _destinations)
        {
            if (destination.id == id)
                return &destination;
        }

        return nullptr;
    }

    std::size_t BackupDestinationResolver::getDestinationCount(FileType type) const
    {
        return _destinationCounts[type];
    }

    std::vector<BackupDestination> BackupDestinationResolver::getDestinationsFor(FileType type) const
    {
        std::vector<BackupDestination> res;
        for (const auto& [path, destination] : _destinations)
        {
            if (messages::canBackup(destination.type, type))
                res.push_back(destination);
        }

        return res;
    }

    std::vector<BackupDestination> BackupDestinationResolver::getDestinations() const
    {
        std::vector<BackupDestination> res;
        for (const auto& [path, destination] : _destinations)
            res.push_back(destination);

        return res;
    }

    std::filesystem::path BackupDestinationResolver::getIdentifierFolder(FileType type) const
    {
        if (!_settings.autodetection)
            return {};

        return _identifierFolders[type];
    }
} // namespace lpd::download
