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

#pragma once

#include <boost/program_options.hpp>
#include "logger.h"

namespace yieldproxy
{
    namespace po = boost::program_options;
    namespace cli
    {
        extern const char* HELP;
        extern const char* HELP_FULL;
        extern const char* SCENARIO;
        extern const char* SCENARIO_FULL;
        extern const char* LOG_LEVEL;
        extern const char* FILE_LOG_LEVEL;
        extern const char* LOG_PATH;
        extern const char* LOG_INFO;
        extern const char* LOG_DEBUG;
        extern const char* LOG_VERBOSE;
        extern const char* LOG_WARNING;
        extern const char* VERSION;
        extern const char* VERSION_FULL;
    }

    po::options_description createOptionsDescription();

    // command line values take precedence over the ones from configFile (ini-style, optional)
    po::variables_map getOptions(int argc, char* argv[], const char* configFile, const po::options_description& options);

    int getLogLevel(const std::string &dstLog, const po::variables_map& vm, int defaultValue = LOG_LEVEL_DEBUG);

    LoggerConfig getLoggerConfig(const po::variables_map& vm, const std::string& filePrefix);
}
