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
#include <functional>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

#include "download/Types.hpp"
#include "messages/Types.hpp"

namespace lpd::download
{
    struct FileRecord
    {
        messages::MediaFileInfo info;
        FileStatus status{ FileStatus::Discovered };
        bool marked{ true };
        std::uint32_t downloadCount{};
        std::filesystem::path tempPath;
        std::filesystem::path finalPath;
        std::filesystem::path subfolder;
        bool fullyBackedUp{};
        std::string error;
    };

    struct DeviceDescription
    {
        DeviceKind kind{ DeviceKind::Volume };
        std::string displayName;
        std::filesystem::path path; // volumes and paths
        std::string cameraModel;
        std::string cameraPort;
        std::string iconName;
        bool ejectable{};
        bool autoStart{}; // download as soon as the scan is done
    };

    struct DeviceRecord
    {
        DeviceId id;
        DeviceDescription description;
        DeviceState state{ DeviceState::Registered };
        std::optional<std::uint64_t> storageCapacity;
        std::optional<std::uint64_t> storageFree;
        std::optional<CameraErrorCode> scanError;
        FileCounts discovered;

        // in discovery order
        std::vector<FileRecord> files;
        std::unordered_map<std::string, std::size_t> fileIndexByUniqueId;
    };

    // Authoritative state of every device of the session
    // Removed devices are kept, so that late results can still be attributed
    class DeviceRegistry
    {
    public:
        DeviceRegistry() = default;
        DeviceRegistry(const DeviceRegistry&) = delete;
        DeviceRegistry& operator=(const DeviceRegistry&) = delete;

        DeviceId add(const DeviceDescription& description);

        DeviceRecord* find(DeviceId id);
        const DeviceRecord* find(DeviceId id) const;
        // throws core::LpdException if not found
        DeviceRecord& get(DeviceId id);
        const DeviceRecord& get(DeviceId id) const;

        // Not removed devices only
        std::optional<DeviceId> findCamera(std::string_view model, std::string_view port) const;
        std::optional<DeviceId> findByPath(const std::filesystem::path& path, DeviceKind kind) const;

        static bool isTransitionAllowed(DeviceState from, DeviceState to);
        // returns false (and leaves the state untouched) if the transition is not allowed
        bool transition(DeviceId id, DeviceState newState);
        // returns false if the device is unknown or already removed
        bool remove(DeviceId id);

        bool isActive(DeviceId id) const; // known and not removed

        // Files already known are ignored, new files are marked
        // returns the number of added files
        std::size_t addFiles(DeviceId id, std::span<const messages::MediaFileInfo> files);
        FileRecord* findFile(DeviceId id, std::string_view uniqueId);
        // Only files not yet downloaded can be (un)marked
        std::size_t setFilesMarked(DeviceId id, std::span<const std::string> uniqueIds, bool marked);

        std::vector<DeviceId> getDevices(DeviceState state) const;
        std::vector<DeviceId> getActiveDevices() const;
        std::size_t getActiveDeviceCount() const;

        // Marked files waiting for a download
        std::vector<const FileRecord*> getFilesToDownload(DeviceId id) const;
        // Files not yet downloaded, marked or not
        std::size_t getRemainingFileCount(DeviceId id) const;

        void visitActiveFiles(std::function<void(const DeviceRecord&, const FileRecord&)> visitor) const;

    private:
        static bool isDownloadable(const FileRecord& file);

        std::uint32_t _nextId{ 1 };
        std::map<DeviceId, DeviceRecord> _devices;
    };
} // namespace lpd::download
