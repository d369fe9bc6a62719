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

#include "download/DeviceRegistry.hpp"

#include <algorithm>

#include "core/Exception.hpp"
#include "core/ILogger.hpp"

namespace lpd::download
{
    DeviceId DeviceRegistry::add(const DeviceDescription& description)
    {
        const DeviceId id{ _nextId++ };

        DeviceRecord record;
        record.id = id;
        record.description = description;
        _devices.emplace(id, std::move(record));

        LPD_LOG(DEVICES, DEBUG, "Registered device " << id.value() << " '" << description.displayName << "' (" << messages::toString(description.kind) << ")");

        return id;
    }

    DeviceRecord* DeviceRegistry::find(DeviceId id)
    {
        auto it{ _devices.find(id) };
        return it != std::end(_devices) ? &it->second : nullptr;
    }

    const DeviceRecord* DeviceRegistry::find(DeviceId id) const
    {
        auto it{ _devices.find(id) };
        return it != std::cend(_devices) ? &it->second : nullptr;
    }

    DeviceRecord& DeviceRegistry::get(DeviceId id)
    {
        DeviceRecord* device{ find(id) };
        if (!device)
            throw core::LpdException{ "Unknown device " + std::to_string(id.value()) };

        return *device;
    }

    const DeviceRecord& DeviceRegistry::get(DeviceId id) const
    {
        const DeviceRecord* device{ find(id) };
        if (!device)
            throw core::LpdException{ "Unknown device " + std::to_string(id.value()) };

        return *device;
    }

    std::optional<DeviceId> DeviceRegistry::findCamera(std::string_view model, std::string_view port) const
    {
        for (const auto& [id, device] : _devices)
        {
            if (device.state != DeviceState::Removed
                && device.description.kind == DeviceKind::Camera
                && device.description.cameraModel == model
                && device.description.cameraPort == port)
                return id;
        }

        return std::nullopt;
    }

    std::optional<DeviceId> DeviceRegistry::findByPath(const std::filesystem::path& path, DeviceKind kind) const
    {
        for (const auto& [id, device] : _devices)
        {
            if (device.state != DeviceState::Removed
                && device.description.kind == kind
                && device.description.path == path)
                return id;
        }

        return std::nullopt;
    }

    bool DeviceRegistry::isTransitionAllowed(DeviceState from, DeviceState to)
    {
        if (from == DeviceState::Removed)
            return false;
        if (to == DeviceState::Removed)
            return true;

        switch (from)
        {
        case DeviceState::Registered:
            return to == DeviceState::Scanning;
        case DeviceState::Scanning:
            return to == DeviceState::Scanned || to == DeviceState::Error;
        case DeviceState::Error:
            return to == DeviceState::Scanning;
        case DeviceState::Scanned:
            return to == DeviceState::DownloadPending;
        case DeviceState::DownloadPending:
            return to == DeviceState::Downloading;
        case DeviceState::Downloading:
            return to == DeviceState::Completed;
        case DeviceState::Completed:
        case DeviceState::Removed:
            break;
        }

        return false;
    }

    bool DeviceRegistry::transition(DeviceId id, DeviceState newState)
    {
        DeviceRecord* device{ find(id) };
        if (!device)
        {
            LPD_LOG(DEVICES, ERROR, "Cannot change state of unknown device " << id.value());
            return false;
        }

        if (!isTransitionAllowed(device->state, newState))
        {
            LPD_LOG(DEVICES, ERROR, "Device " << id.value() << ": transition from '" << toString(device->state) << "' to '" << toString(newState) << "' not allowed");
            return false;
        }

        LPD_LOG(DEVICES, DEBUG, "Device " << id.value() << ": '" << toString(device->state) << "' -> '" << toString(newState) << "'");
        device->state = newState;
        if (newState == DeviceState::Scanning)
            device->scanError.reset();

        return true;
    }

    bool DeviceRegistry::remove(DeviceId id)
    {
        DeviceRecord* device{ find(id) };
        if (!device || device->state == DeviceState::Removed)
            return false;

        return transition(id, DeviceState::Removed);
    }

    bool DeviceRegistry::isActive(DeviceId id) const
    {
        const DeviceRecord* device{ find(id) };
        return device && device->state != DeviceState::Removed;
    }

    std::size_t DeviceRegistry::addFiles(DeviceId id, std::span<const messages::MediaFileInfo> files)
    {
        DeviceRecord& device{ get(id) };

        std::size_t added{};
        for (const messages::MediaFileInfo& file : files)
        {
            if (device.fileIndexByUniqueId.contains(file.uniqueId))
                continue;

            device.fileIndexByUniqueId.emplace(file.uniqueId, device.files.size());
            FileRecord& record{ device.files.emplace_back() };
            record.info = file;
            record.info.deviceId = id;
            device.discovered.add(file.type, file.size);
            added += 1;
        }

        return added;
    }

    FileRecord* DeviceRegistry::findFile(DeviceId id, std::string_view uniqueId)
    {
        DeviceRecord* device{ find(id) };
        if (!device)
            return nullptr;

        auto it{ device->fileIndexByUniqueId.find(std::string{ uniqueId }) };
        if (it == std::end(device->fileIndexByUniqueId))
            return nullptr;

        return &device->files[it->second];
    }

    std::size_t DeviceRegistry::setFilesMarked(DeviceId id, std::span<const std::string> uniqueIds, bool marked)
    {
        std::size_t count{};
        for (const std::string& uniqueId : uniqueIds)
        {
            FileRecord* file{ findFile(id, uniqueId) };
            if (!file || !isDownloadable(*file))
                continue;

            file->marked = marked;
            count += 1;
        }

        return count;
    }

    std::vector<DeviceId> DeviceRegistry::getDevices(DeviceState state) const
    {
        std::vector<DeviceId> res;
        for (const auto& [id, device] : _devices)
        {
            if (device.state == state)
                res.push_back(id);
        }

        return res;
    }

    std::vector<DeviceId> DeviceRegistry::getActiveDevices() const
    {
        std::vector<DeviceId> res;
        for (const auto& [id, device] : _devices)
        {
            if (device.state != DeviceState::Removed)
                res.push_back(id);
        }

        return res;
    }

    std::size_t DeviceRegistry::getActiveDeviceCount() const
    {
        return std::count_if(std::cbegin(_devices), std::cend(_devices), [](const auto& entry) { return entry.second.state != DeviceState::Removed; });
    }

    std::vector<const FileRecord*> DeviceRegistry::getFilesToDownload(DeviceId id) const
    {
        std::vector<const FileRecord*> res;

        const DeviceRecord& device{ get(id) };
        for (const FileRecord& file : device.files)
        {
            if (file.marked && isDownloadable(file))
                res.push_back(&file);
        }

        return res;
    }

    std::size_t DeviceRegistry::getRemainingFileCount(DeviceId id) const
    {
        const DeviceRecord& device{ get(id) };
        return std::count_if(std::cbegin(device.files), std::cend(device.files), [](const FileRecord& file) { return isDownloadable(file); });
    }

    void DeviceRegistry::visitActiveFiles(std::function<void(const DeviceRecord&, const FileRecord&)> visitor) const
    {
        for (const auto& [id, device] : _devices)
        {
            if (device.state == DeviceState::Removed)
                continue;

            for (const FileRecord& file : device.files)
                visitor(device, file);
        }
    }

    bool DeviceRegistry::isDownloadable(const FileRecord& file)
    {
        return file.status == FileStatus::Discovered || file.status == FileStatus::ThumbnailPending;
    }
} // namespace lpd::download
