// Copyright 2018 The Beam Team
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//    http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "options.h"
#include <fstream>
#include <map>

using namespace std;

namespace yieldproxy
{
    namespace cli
    {
        const char* HELP = "help";
        const char* HELP_FULL = "help,h";
        const char* SCENARIO = "scenario";
        const char* SCENARIO_FULL = "scenario,s";
        const char* LOG_LEVEL = "log_level";
        const char* FILE_LOG_LEVEL = "file_log_level";
        const char* LOG_PATH = "log_path";
        const char* LOG_INFO = "info";
        const char* LOG_DEBUG = "debug";
        const char* LOG_VERBOSE = "verbose";
        const char* LOG_WARNING = "warning";
        const char* VERSION = "version";
        const char* VERSION_FULL = "version,v";
    }

    po::options_description createOptionsDescription()
    {
        po::options_description general_options("General options");
        general_options.add_options()
            (cli::HELP_FULL, "list of all options")
            (cli::VERSION_FULL, "return project version")
            (cli::LOG_LEVEL, po::value<string>(), "log level [warning|info|debug|verbose]")
            (cli::FILE_LOG_LEVEL, po::value<string>(), "file log level [warning|info|debug|verbose], file log is disabled if omitted")
            (cli::LOG_PATH, po::value<string>()->default_value("./logs"), "directory for the log files");

        po::options_description sim_options("Simulation options");
        sim_options.add_options()
            (cli::SCENARIO_FULL, po::value<string>(), "path to the scenario file (JSON, '#' comments allowed), built-in scenario if omitted");

        po::options_description options{ "Allowed options" };
        options.add(general_options);
        options.add(sim_options);
        return options;
    }

    po::variables_map getOptions(int argc, char* argv[], const char* configFile, const po::options_description& options)
    {
        po::variables_map vm;
        po::store(po::command_line_parser(argc, argv).options(options).run(), vm); // value stored first is preferred

        if (configFile)
        {
            std::ifstream cfg(configFile);
            if (cfg)
                po::store(po::parse_config_file(cfg, options), vm);
        }

        po::notify(vm);
        return vm;
    }

    int getLogLevel(const std::string &dstLog, const po::variables_map& vm, int defaultValue)
    {
        const map<std::string, int> logLevels
        {
            { cli::LOG_WARNING, LOG_LEVEL_WARNING },
            { cli::LOG_INFO, LOG_LEVEL_INFO },
            { cli::LOG_DEBUG, LOG_LEVEL_DEBUG },
            { cli::LOG_VERBOSE, LOG_LEVEL_VERBOSE }
        };

        if (vm.count(dstLog))
        {
            auto level = vm[dstLog].as<string>();
            if (auto it = logLevels.find(level); it != logLevels.end())
            {
                return it->second;
            }
        }

        return defaultValue;
    }

    LoggerConfig getLoggerConfig(const po::variables_map& vm, const std::string& filePrefix)
    {
        LoggerConfig cfg;
        cfg.consoleLevel = getLogLevel(cli::LOG_LEVEL, vm, LOG_LEVEL_INFO);
        cfg.fileLevel = getLogLevel(cli::FILE_LOG_LEVEL, vm, LOG_SINK_DISABLED);
        cfg.filePrefix = filePrefix;
        if (vm.count(cli::LOG_PATH))
            cfg.path = vm[cli::LOG_PATH].as<string>();
        return cfg;
    }
}
