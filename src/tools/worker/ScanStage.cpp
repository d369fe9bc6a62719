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

#include <algorithm>
#include <array>
#include <chrono>
#include <cstdlib>
#include <optional>
#include <variant>
#include <vector>

#include "core/Exception.hpp"
#include "core/ILogger.hpp"
#include "core/Path.hpp"
#include "core/String.hpp"

#include "StageIO.hpp"
#include "Stages.hpp"

namespace lpd::stages
{
    namespace
    {
        constexpr std::size_t batchSize{ 100 };
        constexpr std::string_view cameraDiskPortPrefix{ "disk:" };

        const std::array<std::filesystem::path, 20> photoExtensions{
            ".arw", ".cr2", ".cr3", ".crw", ".dcr", ".dng", ".jpe", ".jpeg", ".jpg", ".mef",
            ".mos", ".mrw", ".nef", ".nrw", ".orf", ".pef", ".raf", ".raw", ".rw2", ".srw"
        };
        const std::array<std::filesystem::path, 6> otherPhotoExtensions{ ".heic", ".heif", ".hif", ".mpo", ".tif", ".tiff" };
        const std::array<std::filesystem::path, 11> videoExtensions{ ".3gp", ".avi", ".m2t", ".m2ts", ".mod", ".mov", ".mp4", ".mpeg", ".mpg", ".mts", ".tod" };

        std::optional<messages::FileType> getFileType(const std::filesystem::path& file, bool ignoreOtherPhotoTypes)
        {
            if (core::pathUtils::hasFileAnyExtension(file, photoExtensions))
                return messages::FileType::Photo;
            if (!ignoreOtherPhotoTypes && core::pathUtils::hasFileAnyExtension(file, otherPhotoExtensions))
                return messages::FileType::Photo;
            if (core::pathUtils::hasFileAnyExtension(file, videoExtensions))
                return messages::FileType::Video;

            return std::nullopt;
        }

        bool isIgnored(const std::filesystem::path& directory, const std::vector<std::string>& ignoredPaths)
        {
            const std::string genericPath{ directory.generic_string() };
            return std::any_of(std::cbegin(ignoredPaths), std::cend(ignoredPaths), [&](const std::string& ignoredPath) {
                return !ignoredPath.empty() && core::stringUtils::stringEndsWith(genericPath, "/" + ignoredPath);
            });
        }

        std::int64_t getModificationTime(const std::filesystem::directory_entry& entry)
        {
            std::error_code ec;
            const auto lastWriteTime{ entry.last_write_time(ec) };
            if (ec)
                return 0;

            const auto systemTime{ std::chrono::file_clock::to_sys(lastWriteTime) };
            return std::chrono::duration_cast<std::chrono::seconds>(systemTime.time_since_epoch()).count();
        }

        std::optional<std::filesystem::path> getCameraRoot(const messages::ScanArguments& arguments)
        {
            if (!core::stringUtils::stringStartsWith(arguments.cameraPort, cameraDiskPortPrefix))
                return std::nullopt;

            std::filesystem::path root{ arguments.cameraPort.substr(cameraDiskPortPrefix.size()) };
            if (!core::pathUtils::isReadableDirectory(root))
                return std::nullopt;

            return root;
        }

        // waits for a resume request after reporting a device error
        bool waitForResume(StageIO& io)
        {
            while (const std::optional<std::string> line{ io.readLine() })
            {
                try
                {
                    if (std::holds_alternative<messages::ScanResume>(messages::decodeScanRequest(*line)))
                        return true;

                    LPD_LOG(SCAN, WARNING, "Unexpected request while waiting for a resume");
                }
                catch (const messages::CodecException& e)
                {
                    LPD_LOG(SCAN, ERROR, "Dropping malformed request: " << e.what());
                }
            }

            return false;
        }

        messages::ScanDeviceInfo getDeviceInfo(const messages::ScanArguments& arguments, const std::filesystem::path& root)
        {
            messages::ScanDeviceInfo info;

            switch (arguments.kind)
            {
            case messages::DeviceKind::Camera:
                info.displayName = arguments.cameraModel;
                break;
            case messages::DeviceKind::Path:
                info.displayName = root.filename().empty() ? root.string() : root.filename().string();
                break;
            case messages::DeviceKind::Volume:
                // the partition name given by the platform is kept
                break;
            }

            std::error_code ec;
            const std::filesystem::space_info space{ std::filesystem::space(root, ec) };
            if (!ec)
            {
                info.storageCapacity = space.capacity;
                info.storageFree = space.available;
            }

            return info;
        }

        class Scanner
        {
        public:
            Scanner(StageIO& io, const messages::ScanArguments& arguments, const std::filesystem::path& root)
                : _io{ io }
                , _arguments{ arguments }
                , _root{ root }
            {
            }

            void scan()
            {
                std::error_code ec;
                std::filesystem::recursive_directory_iterator itEntry{ _root, std::filesystem::directory_options::skip_permission_denied, ec };
                for (; !ec && itEntry != std::filesystem::recursive_directory_iterator{}; itEntry.increment(ec))
                {
                    if (_io.isInputClosed())
                    {
                        LPD_LOG(SCAN, DEBUG, "Scan aborted");
                        return;
                    }

                    processEntry(itEntry);
                }

                LPD_LOG_IF(SCAN, WARNING, ec, "Scan of " << _root << " stopped: " << ec.message());

                flush();
                LPD_LOG(SCAN, DEBUG, "Found " << _photoCount << " photos and " << _videoCount << " videos under " << _root);
            }

        private:
            void processEntry(std::filesystem::recursive_directory_iterator& itEntry)
            {
                const std::filesystem::directory_entry& entry{ *itEntry };

                std::error_code ec;
                if (entry.is_directory(ec))
                {
                    if (isIgnored(entry.path(), _arguments.ignoredPaths))
                    {
                        LPD_LOG(SCAN, DEBUG, "Skipping ignored directory " << entry.path());
                        itEntry.disable_recursion_pending();
                    }
                    return;
                }

                if (!entry.is_regular_file(ec))
                    return;

                const std::optional<messages::FileType> type{ getFileType(entry.path(), _arguments.ignoreOtherPhotoTypes) };
                if (!type)
                    return;

                messages::MediaFileInfo file;
                file.uniqueId = entry.path().lexically_relative(_root).generic_string();
                file.deviceId = _arguments.deviceId;
                file.type = *type;
                file.path = entry.path();
                file.size = entry.file_size(ec);
                file.modificationTime = getModificationTime(entry);
                if (ec)
                {
                    LPD_LOG(SCAN, WARNING, "Skipping " << entry.path() << ": " << ec.message());
                    return;
                }

                (*type == messages::FileType::Photo ? _photoCount : _videoCount) += 1;

                _batch.files.push_back(std::move(file));
                if (_batch.files.size() >= batchSize)
                    flush();
            }

            void flush()
            {
                if (_batch.files.empty())
                    return;

                _io.write(messages::ScanResult{ std::move(_batch) });
                _batch = messages::ScanFilesFound{};
            }

            StageIO& _io;
            const messages::ScanArguments& _arguments;
            const std::filesystem::path _root;
            messages::ScanFilesFound _batch;
            std::size_t _photoCount{};
            std::size_t _videoCount{};
        };
    } // namespace

    int runScanStage(StageIO& io)
    {
        const std::optional<std::string> line{ io.readLine() };
        if (!line)
            return EXIT_SUCCESS;

        const messages::ScanRequest request{ messages::decodeScanRequest(*line) };
        const auto* arguments{ std::get_if<messages::ScanArguments>(&request) };
        if (!arguments)
            throw core::LpdException{ "First scan request must hold the scan arguments" };

        LPD_LOG(SCAN, INFO, "Scanning device " << arguments->deviceId.value() << " (" << messages::toString(arguments->kind) << ")");

        std::filesystem::path root{ arguments->path };
        if (arguments->kind == messages::DeviceKind::Camera)
        {
            std::optional<std::filesystem::path> cameraRoot;
            while (!(cameraRoot = getCameraRoot(*arguments)))
            {
                io.write(messages::ScanResult{ messages::ScanDeviceError{ messages::CameraErrorCode::Inaccessible, "Cannot access camera " + arguments->cameraModel + " on port " + arguments->cameraPort } });
                if (!waitForResume(io))
                    return EXIT_SUCCESS;
            }
            root = *cameraRoot;
        }

        io.write(messages::ScanResult{ getDeviceInfo(*arguments, root) });

        Scanner scanner{ io, *arguments, root };
        scanner.scan();

        return EXIT_SUCCESS;
    }
} // namespace lpd::stages
