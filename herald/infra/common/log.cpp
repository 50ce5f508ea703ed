// Copyright 2025 The Herald Authors
// SPDX-License-Identifier: Apache-2.0

#include "log.hpp"

#include <atomic>
#include <fstream>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <utility>

#include <absl/strings/str_cat.h>
#include <absl/time/clock.h>
#include <absl/time/time.h>

#include <herald/infra/common/terminal.hpp>

namespace herald::log {

namespace {

    struct Sink {
        Settings settings;
        bool colored{false};
        std::mutex mutex;
        std::ofstream file;
    };

    Sink& sink() {
        static Sink instance;
        return instance;
    }

    std::atomic<Level> verbosity{Level::kInfo};

    thread_local std::string thread_name;

    std::string_view level_tag(Level level) {
        switch (level) {
            case Level::kTrace:
                return "TRACE";
            case Level::kDebug:
                return "DEBUG";
            case Level::kInfo:
                return " INFO";
            case Level::kWarning:
                return " WARN";
            case Level::kError:
                return "ERROR";
            case Level::kCritical:
                return " CRIT";
            case Level::kNone:
                break;
        }
        return "  LOG";
    }

    std::string_view level_color(Level level) {
        switch (level) {
            case Level::kTrace:
            case Level::kDebug:
                return kColorCoal;
            case Level::kInfo:
                return kColorGreen;
            case Level::kWarning:
                return kColorOrange;
            case Level::kError:
            case Level::kCritical:
                return kColorRed;
            case Level::kNone:
                break;
        }
        return kColorWhite;
    }

    std::string thread_label() {
        if (!thread_name.empty()) {
            return thread_name;
        }
        std::ostringstream id;
        id << std::this_thread::get_id();
        return id.str();
    }

}  // namespace

void init(const Settings& settings) {
    auto& s = sink();
    std::scoped_lock lock{s.mutex};
    if (s.file.is_open()) {
        s.file.close();
    }
    if (!settings.log_file.empty()) {
        s.file.open(settings.log_file, std::ios::out | std::ios::app);
        if (!s.file.is_open()) {
            throw std::runtime_error{"cannot open log file: " + settings.log_file};
        }
    }
    const bool on_terminal = settings.log_std_out ? is_terminal_stdout() : is_terminal_stderr();
    // The file gets exactly the console lines, so no escape sequences when teeing
    s.colored = on_terminal && !settings.log_nocolor && settings.log_file.empty();
    s.settings = settings;
    verbosity.store(settings.log_verbosity);
}

Level get_verbosity() {
    return verbosity.load();
}

void set_verbosity(Level level) {
    verbosity.store(level);
}

bool test_verbosity(Level level) {
    return level <= verbosity.load();
}

void set_thread_name(std::string name) {
    thread_name = std::move(name);
}

BufferBase::BufferBase(Level level, std::string_view message, const Args& args) : enabled_{test_verbosity(level)} {
    if (!enabled_) return;

    const auto& s = sink();
    colored_ = s.colored;
    const absl::TimeZone time_zone = s.settings.log_utc ? absl::UTCTimeZone() : absl::LocalTimeZone();

    std::string prefix = colored_ ? absl::StrCat(level_color(level), level_tag(level), kColorReset) : std::string{level_tag(level)};
    absl::StrAppend(&prefix, " [", absl::FormatTime("%m-%d|%H:%M:%E3S", absl::Now(), time_zone), "] ");
    if (s.settings.log_threads) {
        absl::StrAppend(&prefix, "[", thread_label(), "] ");
    }
    line_ << prefix << message;
    append(args);
}

BufferBase::~BufferBase() {
    if (!enabled_) return;

    const std::string line = line_.str();
    auto& s = sink();
    std::scoped_lock lock{s.mutex};
    (s.settings.log_std_out ? std::cout : std::cerr) << line << '\n';
    if (s.file.is_open()) {
        s.file << line << '\n';
        s.file.flush();
    }
}

void BufferBase::append(const Args& args) {
    if (!enabled_) return;
    for (size_t i{0}; i < args.size(); i += 2) {
        const std::string_view value = i + 1 < args.size() ? std::string_view{args[i + 1]} : std::string_view{};
        if (colored_) {
            line_ << ' ' << absl::StrCat(kColorGreen, args[i], kColorReset, "=", value);
        } else {
            line_ << ' ' << absl::StrCat(args[i], "=", value);
        }
    }
}

}  // namespace herald::log
