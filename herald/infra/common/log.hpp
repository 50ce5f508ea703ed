// Copyright 2025 The Herald Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace herald::log {

//! Severity of a log line, each level printing also all the lower ones
enum class Level {
    kNone,  // Always printed unless logging is disabled
    kCritical,
    kError,
    kWarning,
    kInfo,
    kDebug,
    kTrace,
};

struct Settings {
    bool log_std_out{false};            // Print to std::cout instead of std::cerr
    bool log_nocolor{false};            // Never colorize, colors are also off when not on a TTY or teeing to file
    bool log_utc{false};                // Timestamps in UTC instead of local time
    bool log_threads{false};            // Prefix each line with the thread name
    Level log_verbosity{Level::kInfo};  // Most verbose level printed
    std::string log_file;               // Copy every line into this file when not empty
};

//! Apply the settings. Call it at startup before any logging thread is running.
//! \throws std::runtime_error if the log file cannot be opened
void init(const Settings& settings = {});

Level get_verbosity();
void set_verbosity(Level level);

//! Check if lines at the given level are printed
bool test_verbosity(Level level);

//! Name shown for the calling thread when Settings::log_threads is on, the thread id by default
void set_thread_name(std::string name);

//! Flat key/value list appended to a log line as key=value pairs
using Args = std::vector<std::string>;

//! One log line: accumulates the message and prints it atomically on destruction
class BufferBase {
  public:
    BufferBase(Level level, std::string_view message, const Args& args);
    ~BufferBase();

    BufferBase(const BufferBase&) = delete;
    BufferBase& operator=(const BufferBase&) = delete;

    template <class T>
    BufferBase& operator<<(const T& value) {
        if (enabled_) line_ << value;
        return *this;
    }
    BufferBase& operator<<(const Args& args) {
        append(args);
        return *this;
    }

  protected:
    void append(const Args& args);

    const bool enabled_;
    bool colored_{false};
    std::ostringstream line_;
};

template <Level level>
class LogBuffer : public BufferBase {
  public:
    LogBuffer() : BufferBase(level, {}, {}) {}
    explicit LogBuffer(std::string_view message, const Args& args = {}) : BufferBase(level, message, args) {}
};

using Trace = LogBuffer<Level::kTrace>;
using Debug = LogBuffer<Level::kDebug>;
using Info = LogBuffer<Level::kInfo>;
using Warning = LogBuffer<Level::kWarning>;
using Error = LogBuffer<Level::kError>;
using Critical = LogBuffer<Level::kCritical>;
using Message = LogBuffer<Level::kNone>;

}  // namespace herald::log

// The stream arguments are not evaluated at all when the level is filtered out
#define HERALD_LOGBUFFER(level_, ...)           \
    if (!herald::log::test_verbosity(level_)) { \
    } else                                      \
        herald::log::LogBuffer<level_>(__VA_ARGS__)

#define HERALD_TRACE_M(...) HERALD_LOGBUFFER(herald::log::Level::kTrace, __VA_ARGS__)
#define HERALD_DEBUG_M(...) HERALD_LOGBUFFER(herald::log::Level::kDebug, __VA_ARGS__)
#define HERALD_INFO_M(...) HERALD_LOGBUFFER(herald::log::Level::kInfo, __VA_ARGS__)
#define HERALD_WARN_M(...) HERALD_LOGBUFFER(herald::log::Level::kWarning, __VA_ARGS__)
#define HERALD_ERROR_M(...) HERALD_LOGBUFFER(herald::log::Level::kError, __VA_ARGS__)
#define HERALD_CRIT_M(...) HERALD_LOGBUFFER(herald::log::Level::kCritical, __VA_ARGS__)

#define HERALD_TRACE HERALD_TRACE_M()
#define HERALD_DEBUG HERALD_DEBUG_M()
#define HERALD_INFO HERALD_INFO_M()
#define HERALD_WARN HERALD_WARN_M()
#define HERALD_ERROR HERALD_ERROR_M()
#define HERALD_CRIT HERALD_CRIT_M()
