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
#include <functional>
#include <iostream>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>

#include <boost/program_options.hpp>

#include "core/ILogger.hpp"
#include "core/Service.hpp"
#include "core/StreamLogger.hpp"
#include "core/String.hpp"

#include "StageIO.hpp"
#include "Stages.hpp"

namespace lpd::stages
{
    namespace
    {
        std::optional<core::logging::Severity> parseSeverity(std::string_view str)
        {
            static const std::map<std::string, core::logging::Severity> severities{
                { "debug", core::logging::Severity::DEBUG },
                { "info", core::logging::Severity::INFO },
                { "warning", core::logging::Severity::WARNING },
                { "error", core::logging::Severity::ERROR },
                { "fatal", core::logging::Severity::FATAL },
            };

            const auto it{ severities.find(core::stringUtils::stringToLower(str)) };
            if (it == std::cend(severities))
                return std::nullopt;

            return it->second;
        }
    } // namespace
} // namespace lpd::stages

int main(int argc, char* argv[])
{
    try
    {
        using namespace lpd;
        namespace program_options = boost::program_options;

        program_options::options_description options{ "Options" };
        // clang-format off
        options.add_options()
            ("help,h", "Display this help message")
            ("stage", program_options::value<std::string>(), "Stage to run (value can be \"scan\", \"copy\", \"rename\", \"backup\" or \"offload\")")
            ("log-min-severity", program_options::value<std::string>()->default_value("warning"), "Minimum severity of the messages logged on stderr");
        // clang-format on

        program_options::variables_map vm;
        program_options::store(program_options::parse_command_line(argc, argv, options), vm);
        program_options::notify(vm);

        auto displayHelp = [&](std::ostream& os) {
            os << "Usage: " << argv[0] << " --stage <stage> [options]" << std::endl;
            os << "Requests are read from stdin and results written to stdout, one JSON document per line" << std::endl;
            os << options << std::endl;
        };

        if (vm.count("help"))
        {
            displayHelp(std::cout);
            return EXIT_SUCCESS;
        }

        if (vm.count("stage") == 0)
        {
            std::cerr << "No stage provided" << std::endl;
            displayHelp(std::cerr);
            return EXIT_FAILURE;
        }

        const std::map<std::string, std::function<int(stages::StageIO&)>> stageRunners{
            { "scan", stages::runScanStage },
            { "copy", stages::runCopyStage },
            { "rename", stages::runRenameStage },
            { "backup", stages::runBackupStage },
            { "offload", stages::runOffloadStage },
        };

        const std::string& stage{ vm["stage"].as<std::string>() };
        const auto itRunner{ stageRunners.find(stage) };
        if (itRunner == std::cend(stageRunners))
        {
            std::cerr << "Invalid stage '" << stage << "'" << std::endl;
            return EXIT_FAILURE;
        }

        const std::optional<core::logging::Severity> minSeverity{ stages::parseSeverity(vm["log-min-severity"].as<std::string>()) };
        if (!minSeverity)
        {
            std::cerr << "Invalid log severity '" << vm["log-min-severity"].as<std::string>() << "'" << std::endl;
            return EXIT_FAILURE;
        }

        // stdout is reserved for results
        core::Service<core::logging::ILogger> logger{ std::make_unique<core::logging::StreamLogger>(std::cerr, *minSeverity, "lpd-worker " + stage) };

        // the parent may go away at any time
        std::signal(SIGPIPE, SIG_IGN);

        stages::StageIO io{ std::cin, std::cout };
        const int res{ itRunner->second(io) };
        LPD_LOG(WORKER, DEBUG, "Stage " << stage << " done, exit code = " << res);
        return res;
    }
    catch (const std::exception& e)
    {
        std::cerr << "Caught exception: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }
}
