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
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "download/Types.hpp"

namespace lpd::download
{
    using BackupDestinationId = std::uint32_t;

    struct BackupDestination
    {
        BackupDestinationId id{};
        std::filesystem::path path;
        BackupLocationType type{ BackupLocationType::PhotosAndVideos };
    };

    struct BackupResolverSettings
    {
        bool autodetection{ true };
        std::string photoIdentifier{ "Photos" };
        std::string videoIdentifier{ "Videos" };
        // manual mode
        std::filesystem::path photoLocation;
        std::filesystem::path videoLocation;
    };

    class BackupDestinationResolver
    {
    public:
        explicit BackupDestinationResolver(const BackupResolverSettings& settings);
        BackupDestinationResolver(const BackupDestinationResolver&) = delete;
        BackupDestinationResolver& operator=(const BackupDestinationResolver&) = delete;

        // Autodetection: checks for writable identifier folders under path
        // Manual: literal match against the configured locations
        std::optional<BackupLocationType> checkCapability(const std::filesystem::path& path) const;

        struct AddResult
        {
            BackupDestinationId id{};
            bool added{}; // false if the path was already known with the same capability
        };
        // A known path with a different capability is updated in place
        AddResult add(const std::filesystem::path& path, BackupLocationType type);
        std::optional<BackupDestination> remove(const std::filesystem::path& path);

        const BackupDestination* find(const std::filesystem::path& path) const;
        const BackupDestination* find(BackupDestinationId id) const;
        bool contains(const std::filesystem::path& path) const { return find(path) != nullptr; }

        std::size_t getDestinationCount() const { return _destinations.size(); }
        std::size_t getDestinationCount(FileType type) const;
        std::vector<BackupDestination> getDestinationsFor(FileType type) const;
        std::vector<BackupDestination> getDestinations() const;

        // folder the files of this type go into, relative to the destination
        std::filesystem::path getIdentifierFolder(FileType type) const;

    private:
        void updateCounts(BackupLocationType type, bool increment);

        const BackupResolverSettings _settings;
        const FileTypeMap<std::filesystem::path> _identifierFolders;
        BackupDestinationId _nextId{ 1 };
        std::map<std::filesystem::path, BackupDestination> _destinations;
        FileTypeMap<std::size_t> _destinationCounts;
    };
} // namespace lpd::download
