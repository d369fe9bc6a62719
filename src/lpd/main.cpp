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

#include <csignal>
#include <cstdlib>
#include <iostream>
#include <unistd.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/signal_set.hpp>

#include "core/IChildProcessManager.hpp"
#include "core/IConfig.hpp"
#include "core/ILogger.hpp"
#include "core/Service.hpp"
#include "download/DeviceRegistry.hpp"
#include "download/IDownloadOrchestrator.hpp"
#include "download/IPreferences.hpp"
#include "download/StageChannels.hpp"

#include "DeviceMonitor.hpp"

namespace lpd
{
    namespace
    {
        core::logging::Severity getLogMinSeverity()
        {
            std::string_view minSeverity{ core::Service<core::IConfig>::get()->getString("log-min-severity", "info") };

            if (minSeverity == "debug")
                return core::logging::Severity::DEBUG;
            else if (minSeverity == "info")
                return core::logging::Severity::INFO;
            else if (minSeverity == "warning")
                return core::logging::Severity::WARNING;
            else if (minSeverity == "error")
                return core::logging::Severity::ERROR;
            else if (minSeverity == "fatal")
                return core::logging::Severity::FATAL;

            throw core::LpdException{ "Invalid config value for 'log-min-severity'" };
        }

        std::filesystem::path getDefaultWorkerBinary(const char* argv0)
        {
            std::error_code ec;
            const std::filesystem::path self{ std::filesystem::read_symlink("/proc/self/exe", ec) };
            return (ec ? std::filesystem::path{ argv0 } : self).parent_path() / "lpd-worker";
        }

        std::string getDeviceName(const download::IDownloadOrchestrator& orchestrator, download::DeviceId id)
        {
            const download::DeviceRecord* device{ orchestrator.getDeviceRegistry().find(id) };
            if (!device || device->description.displayName.empty())
                return "device " + std::to_string(id.value());

            return device->description.displayName;
        }

        // No interactive front end: events are reported to the log and decisions are taken right away
        void reportEventsToLog(download::IDownloadOrchestrator& orchestrator)
        {
            download::Events& events{ orchestrator.getEvents() };

            events.deviceAdded.connect([&](download::DeviceId id) {
                LPD_LOG(MAIN, INFO, "Added " << getDeviceName(orchestrator, id));
            });
            events.deviceRemoved.connect([&](download::DeviceId id) {
                LPD_LOG(MAIN, INFO, "Removed " << getDeviceName(orchestrator, id));
            });
            events.deviceStateChanged.connect([&](download::DeviceId id, download::DeviceState state) {
                LPD_LOG(MAIN, DEBUG, getDeviceName(orchestrator, id) << " is now " << download::toString(state));
            });
            events.scanCountsUpdated.connect([&](download::DeviceId id, const download::FileCounts& counts) {
                LPD_LOG(MAIN, DEBUG, getDeviceName(orchestrator, id) << ": found " << download::getFileTypesText(counts.photos, counts.videos));
            });
            events.deviceProgress.connect([&](download::DeviceId id, float progress, const std::string& text) {
                LPD_LOG(MAIN, DEBUG, getDeviceName(orchestrator, id) << ": " << static_cast<int>(progress * 100) << "% " << text);
            });
            events.timeRemaining.connect([](const std::string& text) {
                LPD_LOG(MAIN, INFO, text);
            });
            events.downloadStarted.connect([] {
                LPD_LOG(MAIN, INFO, "Download started");
            });
            events.deviceDownloadCompleted.connect([&](download::DeviceId id, const download::DownloadCounts& counts) {
                LPD_LOG(MAIN, INFO, getDeviceName(orchestrator, id) << ": downloaded " << counts.getDownloaded() << ", failed " << counts.getFailed() << ", warnings " << counts.warnings);
            });
            events.downloadSummary.connect([](const download::DownloadCounts& counts) {
                LPD_LOG(MAIN, INFO, "All devices: downloaded " << counts.getDownloaded() << ", failed " << counts.getFailed() << ", warnings " << counts.warnings);
            });
            events.errorReported.connect([](const download::ErrorReport& report) {
                switch (report.severity)
                {
                case download::ErrorSeverity::Warning:
                    LPD_LOG(MAIN, WARNING, report.problem << ": " << report.details);
                    break;
                case download::ErrorSeverity::SeriousError:
                case download::ErrorSeverity::CriticalError:
                    LPD_LOG(MAIN, ERROR, report.problem << ": " << report.details);
                    break;
                }
            });
            events.jobCodeRequested.connect([&](const std::vector<std::string>& previousCodes) {
                if (previousCodes.empty())
                {
                    LPD_LOG(MAIN, WARNING, "A job code is required but none was ever entered, cancelling");
                    orchestrator.cancelJobCode();
                    return;
                }

                LPD_LOG(MAIN, INFO, "Using last job code '" << previousCodes.front() << "'");
                orchestrator.provideJobCode(previousCodes.front(), true);
            });
            events.scanErrorDecisionRequested.connect([&](download::DeviceId id, download::CameraErrorCode code, const std::string& details) {
                LPD_LOG(MAIN, WARNING, getDeviceName(orchestrator, id) << " is " << messages::toString(code) << " (" << details << "), ignoring it");
                orchestrator.resolveScanError(id, download::ScanErrorDecision::Ignore);
            });
            events.proximityGroupsGenerated.connect([](const messages::ProximityGroups& groups) {
                LPD_LOG(MAIN, DEBUG, "Files split into " << groups.groups.size() << " time groups");
            });
        }
    } // namespace

    int main(int argc, char* argv[])
    {
        std::filesystem::path configFilePath{ "/etc/lpd.conf" };
        int res{ EXIT_FAILURE };

        auto displayUsage{ [&](std::ostream& os) {
            os << "Usage:\t" << argv[0] << "\t[conf_file]\n\n"
               << "Options:\n"
               << "\tconf_file:\t path to the LPD configuration file (defaults to " << configFilePath << ")\n\n";
        } };

        if (argc == 2)
        {
            const std::string_view arg{ argv[1] };
            if (arg == "-h" || arg == "--help")
            {
                displayUsage(std::cout);
                return EXIT_SUCCESS;
            }
            configFilePath = std::string(arg, 0, 256);
        }
        else if (argc > 2)
        {
            displayUsage(std::cerr);
            return EXIT_FAILURE;
        }

        try
        {
            close(STDIN_FILENO);

            core::Service<core::IConfig> config{ core::createConfig(configFilePath) };
            core::Service<core::logging::ILogger> logger{ core::logging::createLogger(getLogMinSeverity(), config->getPath("log-file", "")) };

            // child processes exiting early must not kill us
            std::signal(SIGPIPE, SIG_IGN);

            const std::filesystem::path workingDir{ config->getPath("working-dir", "/var/lib/lpd") };
            std::filesystem::create_directories(workingDir);

            boost::asio::io_context ioContext; // supervising loop, everything runs on the main thread

            core::Service<core::IChildProcessManager> childProcessManager{ core::createChildProcessManager(ioContext) };

            const download::StageChannelSettings channelSettings{ download::readStageChannelSettings(*config, getDefaultWorkerBinary(argv[0])) };
            LPD_LOG(MAIN, INFO, "Using worker " << channelSettings.workerBinary);

            auto preferences{ download::createPreferences(download::readDownloadPreferences(*config), workingDir / "state.json") };
            DeviceMonitor deviceMonitor{ ioContext, *childProcessManager, config->getPath("umount-binary", "/bin/umount") };

            auto orchestrator{ download::createDownloadOrchestrator(*preferences, deviceMonitor, download::createStageChannels(ioContext, *childProcessManager, channelSettings)) };
            reportEventsToLog(*orchestrator);

            bool shutdownRequested{};
            auto shutdown{ [&] {
                if (shutdownRequested)
                    return;
                shutdownRequested = true;

                LPD_LOG(MAIN, INFO, "Stopping...");
                orchestrator->requestShutdown([&] {
                    LPD_LOG(MAIN, INFO, "Ready to quit");
                    ioContext.stop();
                });
            } };

            boost::asio::signal_set signals{ ioContext, SIGINT, SIGTERM };
            signals.async_wait([&](const boost::system::error_code& ec, int signalNumber) {
                if (ec)
                    return;

                LPD_LOG(MAIN, INFO, "Received signal " << signalNumber);
                shutdown();
            });

            orchestrator->getEvents().exitRequested.connect([&] { shutdown(); });

            boost::asio::post(ioContext, [&] { orchestrator->start({}); });

            LPD_LOG(MAIN, INFO, "Now running...");
            ioContext.run();

            LPD_LOG(MAIN, INFO, "Quitting...");
            res = EXIT_SUCCESS;
        }
        catch (const std::exception& e)
        {
            LPD_LOG(MAIN, FATAL, "Caught std::exception: " << e.what());
            std::cerr << "Caught std::exception: " << e.what() << std::endl;
            res = EXIT_FAILURE;
        }

        return res;
    }
} // namespace lpd

int main(int argc, char* argv[])
{
    return lpd::main(argc, argv);
}
