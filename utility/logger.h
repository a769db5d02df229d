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
#include <iostream>
#include <memory>
#include <string>
#include <string.h>
#include <stdio.h>
#include <assert.h>

#ifndef LOG_VERBOSE_ENABLED
    #define LOG_VERBOSE_ENABLED 0
#endif

#ifndef LOG_DEBUG_ENABLED
    #ifndef NDEBUG
        #define LOG_DEBUG_ENABLED 1
    #else
        #define LOG_DEBUG_ENABLED 0
    #endif
#endif

#ifndef SHOW_CODE_LOCATION
    #define SHOW_CODE_LOCATION 0
#endif

// API

#define LOG_LEVEL_CRITICAL 6
#define LOG_LEVEL_ERROR    5
#define LOG_LEVEL_WARNING  4
#define LOG_LEVEL_INFO     3
#define LOG_LEVEL_DEBUG    2
#define LOG_LEVEL_VERBOSE  1

#define LOG_SINK_DISABLED  0

// This stub will be optimized out;
struct LogMessageStub {
    LogMessageStub() {}
    template <typename T> LogMessageStub& operator<<(const T&) { return *this; }
};

#if SHOW_CODE_LOCATION
    #define LOG_MESSAGE(LEVEL) if (yieldproxy::Logger::will_log(LEVEL)) yieldproxy::LogMessage(LEVEL, __FILE__, __LINE__, __FUNCTION__)
#else
    #define LOG_MESSAGE(LEVEL) if (yieldproxy::Logger::will_log(LEVEL)) yieldproxy::LogMessage(LEVEL)
#endif

#define LOG_CRITICAL() LOG_MESSAGE(LOG_LEVEL_CRITICAL)
#define LOG_ERROR() LOG_MESSAGE(LOG_LEVEL_ERROR)
#define LOG_WARNING() LOG_MESSAGE(LOG_LEVEL_WARNING)
#define LOG_INFO() LOG_MESSAGE(LOG_LEVEL_INFO)

#if LOG_DEBUG_ENABLED
    #define LOG_DEBUG() LOG_MESSAGE(LOG_LEVEL_DEBUG)
#else
    #define LOG_DEBUG() LogMessageStub()
#endif

#if LOG_VERBOSE_ENABLED
    #define LOG_VERBOSE() LOG_MESSAGE(LOG_LEVEL_VERBOSE)
#else
    #define LOG_VERBOSE() LogMessageStub()
#endif

namespace yieldproxy {

// Logger options, filled from command line
struct LoggerConfig {
    int fileLevel=LOG_SINK_DISABLED;
    int consoleLevel=LOG_LEVEL_INFO;
    int flushLevel=LOG_LEVEL_WARNING;
    std::string filePrefix;
    std::string path;
};

struct LogMessageHeader {
    uint64_t timestamp;
    const char* func;
    const char* file;
    int line;
    int level;

    LogMessageHeader(int _level, const char* _file, int _line, const char* _func);
};

/// Returns char corresponding to log level
inline char loglevel_tag(int level) {
    static const char logTags[] = "~VDIWEC";
    if (level < 0 || level >= int(sizeof(logTags))) level = 0;
    return logTags[level];
}

/// Named context of the current thread, printed in the header of every message written while alive.
/// Scopes nest, the innermost is printed last
class LogScope {
public:
    explicit LogScope(std::string name);
    ~LogScope();

    LogScope(const LogScope&) = delete;
    LogScope& operator=(const LogScope&) = delete;

    /// Innermost scope of the calling thread, or nullptr
    static const LogScope* current();

    const std::string& name() const { return _name; }
    const LogScope* parent() const { return _parent; }

    /// Writes "outer/inner" path into buf, returns bytes consumed
    static size_t format_path(char* buf, size_t maxSize);

private:
    std::string _name;
    LogScope* _parent;
};

/// Logger interface
class Logger {
public:
    /// RAII
    static std::shared_ptr<Logger> create(
        // flushes sinks if level >= flushLevel
        int flushLevel=LOG_LEVEL_WARNING,

        // default console minimal level, use LOG_SINK_DISABLED to disable console log
        int consoleLevel=LOG_LEVEL_DEBUG,

        // default file logger minimal level, use LOG_SINK_DISABLED to disable file log
        int fileLevel=LOG_SINK_DISABLED,

        // filename prefix, needed if file log enabled
        const std::string& fileNamePrefix = std::string(),

        // path to log file
        const std::string& dstPath = std::string()
    );

    static std::shared_ptr<Logger> create(const LoggerConfig& cfg) {
        return create(cfg.flushLevel, cfg.consoleLevel, cfg.fileLevel, cfg.filePrefix, cfg.path);
    }

    virtual ~Logger() {}

    /// Returns current log file name, empty if file log is disabled
    virtual const std::string& get_current_file_name() const = 0;

    static bool will_log(int level) {
        return g_logger && g_logger->level_accepted(level);
    }

protected:
    friend class LogMessage;

    virtual bool level_accepted(int level) const = 0;

    /// Called from LogMessage dtor on message completed
    virtual void write_message(const LogMessageHeader& header, const char* buf, size_t size) = 0;

    static Logger* g_logger;
};

// Log message, supports operator<< and writes itself in destructor
// NOTE: must not be nested, i.e. operator<< of the logged objects must not log
class LogMessage {
public:
    LogMessageHeader header;

    LogMessage(int _level, const char* _file=0, int _line=0, const char* _func=0);

    template <class T> LogMessage& operator<<(const T& x) {
        *_formatter << x;
        return *this;
    }

    ~LogMessage();
private:
    std::ostream* _formatter=0;
};

} //namespace
