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

#include "logger.h"
#include "helpers.h"
#include <boost/filesystem.hpp>
#include <boost/iostreams/device/back_inserter.hpp>
#include <boost/iostreams/filtering_stream.hpp>
#include <stdexcept>
#include <mutex>
#include <vector>
#include <algorithm>

namespace yieldproxy {

using namespace std;

Logger* Logger::g_logger = 0;

namespace {

static constexpr size_t MAX_MSG_SIZE = 10000;
static constexpr size_t MAX_HEADER_SIZE = 512;
static constexpr size_t MAX_TIMESTAMP_SIZE = 80;
static constexpr size_t MAX_SCOPE_SIZE = 256;

thread_local LogScope* g_scope = nullptr;

struct Sink {
    FILE* file;
    int minLevel;
    bool owned;
};

string make_log_file_path(const string& fileNamePrefix, const string& dstPath) {
    string fileName(fileNamePrefix);
    fileName += format_timestamp("%y_%m_%d_%H_%M_%S", local_timestamp_msec(), false);
    fileName += ".log";

    if (dstPath.empty())
        return fileName;

    boost::filesystem::path path{ dstPath };
    if (!boost::filesystem::exists(path)) {
        boost::filesystem::create_directories(path);
    }
    path /= fileName;
    return path.string();
}

// "I 2026-10-19.12:00:00.000 [tx 3/proxy] "
size_t format_header(char* buf, size_t maxSize, const LogMessageHeader& header) {
    char timestampFormatted[MAX_TIMESTAMP_SIZE];
    format_timestamp(timestampFormatted, MAX_TIMESTAMP_SIZE, "%Y-%m-%d.%T", header.timestamp, true);

    char scopeFormatted[MAX_SCOPE_SIZE];
    size_t scopeSize = LogScope::format_path(scopeFormatted, MAX_SCOPE_SIZE);

    int n = 0;
    if (header.line) {
        n = scopeSize ?
            snprintf(buf, maxSize, "%c %s [%s] (%s, %s:%d) ", loglevel_tag(header.level), timestampFormatted, scopeFormatted, header.func, header.file, header.line) :
            snprintf(buf, maxSize, "%c %s (%s, %s:%d) ", loglevel_tag(header.level), timestampFormatted, header.func, header.file, header.line);
    } else {
        n = scopeSize ?
            snprintf(buf, maxSize, "%c %s [%s] ", loglevel_tag(header.level), timestampFormatted, scopeFormatted) :
            snprintf(buf, maxSize, "%c %s ", loglevel_tag(header.level), timestampFormatted);
    }

    if (n < 0) return 0;
    return min(size_t(n), maxSize - 1);
}

// Console and/or file, each with its own minimal level
class LoggerImpl : public Logger {
    mutable mutex _mutex;
    vector<Sink> _sinks;
    int _minLevel = LOG_LEVEL_CRITICAL + 1;
    int _flushLevel;
    string _fileName;

public:
    explicit LoggerImpl(int flushLevel) :
        _flushLevel(flushLevel)
    {}

    ~LoggerImpl() override {
        if (this == g_logger) {
            g_logger = 0;
        }
        for (const auto& s : _sinks) {
            if (s.owned) fclose(s.file);
        }
    }

    void add_console(int minLevel) {
        add_sink(Sink{ stdout, minLevel, false });
    }

    void add_file(int minLevel, const string& fileNamePrefix, const string& dstPath) {
        string fullPath = make_log_file_path(fileNamePrefix, dstPath);
        FILE* f = fopen(fullPath.c_str(), "ab");
        if (!f) throw runtime_error(string("cannot open file ") + fullPath);

        add_sink(Sink{ f, minLevel, true });
        _fileName = move(fullPath);
    }

    const string& get_current_file_name() const override {
        return _fileName;
    }

    bool level_accepted(int level) const override {
        return level >= _minLevel;
    }

    void write_message(const LogMessageHeader& header, const char* buf, size_t size) override {
        char headerFormatted[MAX_HEADER_SIZE];
        size_t headerSize = format_header(headerFormatted, MAX_HEADER_SIZE, header);

        lock_guard<mutex> lock(_mutex);
        for (const auto& s : _sinks) {
            if (header.level < s.minLevel) continue;
            fwrite(headerFormatted, 1, headerSize, s.file);
            fwrite(buf, 1, size, s.file);
            if (header.level >= _flushLevel) fflush(s.file);
        }
    }

private:
    void add_sink(const Sink& s) {
        if (s.minLevel <= 0) throw runtime_error("logger: minimal level out of range");
        _sinks.push_back(s);
        _minLevel = min(_minLevel, s.minLevel);
    }
};

struct LogThreadContext {
    using Formatter = boost::iostreams::filtering_ostream;

    std::string msgBuffer;
    std::unique_ptr<Formatter> formatter;
    bool in_use = false;

    LogThreadContext() :
        formatter(std::make_unique<Formatter>(boost::iostreams::back_inserter(msgBuffer)))
    {}

    void reset() {
        msgBuffer = std::string();
        formatter = std::make_unique<Formatter>(boost::iostreams::back_inserter(msgBuffer));
    }
};

LogThreadContext* get_context() {
    static thread_local LogThreadContext ctx;
    return &ctx;
}

} //namespace

std::shared_ptr<Logger> Logger::create(
    int flushLevel,
    int consoleLevel,
    int fileLevel,
    const std::string& fileNamePrefix,
    const std::string& dstPath
) {
    if (g_logger) {
        throw runtime_error("logger already initialized");
    }

    if (consoleLevel <= 0 && fileLevel <= 0) {
        throw runtime_error("no logger sink configured");
    }

    auto logger = std::make_shared<LoggerImpl>(flushLevel);
    if (consoleLevel > 0) logger->add_console(consoleLevel);
    if (fileLevel > 0) logger->add_file(fileLevel, fileNamePrefix, dstPath);

    g_logger = logger.get();
    return logger;
}

LogScope::LogScope(std::string name) :
    _name(std::move(name)),
    _parent(g_scope)
{
    g_scope = this;
}

LogScope::~LogScope() {
    g_scope = _parent;
}

const LogScope* LogScope::current() {
    return g_scope;
}

size_t LogScope::format_path(char* buf, size_t maxSize) {
    if (!g_scope || !maxSize) return 0;

    vector<const LogScope*> chain;
    for (const LogScope* p = g_scope; p; p = p->_parent) {
        chain.push_back(p);
    }

    size_t n = 0;
    for (auto it = chain.rbegin(); it != chain.rend(); ++it) {
        if (n && n + 1 < maxSize) buf[n++] = '/';
        size_t len = min((*it)->_name.size(), maxSize - 1 - n);
        memcpy(buf + n, (*it)->_name.data(), len);
        n += len;
    }
    buf[n] = 0;
    return n;
}

LogMessageHeader::LogMessageHeader(int _level, const char* _file, int _line, const char* _func) :
    timestamp(local_timestamp_msec()),
    func(_func ? _func : ""),
    file(_file ? _file : ""),
    line(_line),
    level(_level)
{
#ifdef PROJECT_SOURCE_DIR
    static const size_t offset = strlen(PROJECT_SOURCE_DIR)+1;
    if (_file && strlen(_file) > offset) file += offset;
#endif
}

LogMessage::LogMessage(int _level, const char* _file, int _line, const char* _func) :
    header(_level, _file, _line, _func)
{
    LogThreadContext* ctx = get_context();
    assert(!ctx->in_use);

    ctx->in_use = true;

    if (ctx->msgBuffer.capacity() < MAX_MSG_SIZE) {
        ctx->msgBuffer.reserve(MAX_MSG_SIZE);
    }

    _formatter = ctx->formatter.get();
}

LogMessage::~LogMessage() {
    LogThreadContext* ctx = get_context();
    if (Logger::g_logger && _formatter) {
        *_formatter << '\n';
        _formatter->flush();
        Logger::g_logger->write_message(header, ctx->msgBuffer.data(), ctx->msgBuffer.size());
    }
    if (ctx->msgBuffer.size() > MAX_MSG_SIZE) {
        ctx->reset();
    } else {
        ctx->msgBuffer.clear();
    }
    ctx->in_use = false;
}

} //namespace
