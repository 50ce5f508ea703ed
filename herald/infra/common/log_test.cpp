// Copyright 2025 The Herald Authors
// SPDX-License-Identifier: Apache-2.0

#include "log.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <string>

#include <absl/strings/match.h>
#include <catch2/catch_test_macros.hpp>

#include <herald/infra/common/terminal.hpp>
#include <herald/infra/test_util/log.hpp>

namespace herald::log {

//! Exposes the line accumulated so far
template <Level level>
class LogBufferForTest : public LogBuffer<level> {
  public:
    LogBufferForTest() = default;
    LogBufferForTest(std::string_view message, const Args& args) : LogBuffer<level>(message, args) {}

    std::string content() const { return LogBuffer<level>::line_.str(); }
};

template <Level level>
static std::string log_line(std::string_view message) {
    LogBufferForTest<level> log_buffer;
    log_buffer << message;
    return log_buffer.content();
}

static std::filesystem::path unique_log_file_path() {
    const auto ticks = std::chrono::steady_clock::now().time_since_epoch().count();
    return std::filesystem::temp_directory_path() / ("herald_log_test_" + std::to_string(ticks) + ".log");
}

TEST_CASE("LogBuffer", "[herald][common][log]") {
    test_util::SetLogVerbosityGuard log_guard{get_verbosity()};

    // Keep the test output clean
    std::stringstream string_cout, string_cerr;
    test_util::StreamSwap cout_swap{std::cout, string_cout};
    test_util::StreamSwap cerr_swap{std::cerr, string_cerr};
    const Settings settings{.log_nocolor = true, .log_verbosity = Level::kInfo};
    init(settings);

    SECTION("levels above verbosity are dropped") {
        CHECK(log_line<Level::kDebug>("test").empty());
        CHECK(log_line<Level::kTrace>("test").empty());
    }

    SECTION("levels up to verbosity are kept with their tag") {
        CHECK(absl::StrContains(log_line<Level::kInfo>("test"), " INFO ["));
        CHECK(absl::StrContains(log_line<Level::kWarning>("test"), " WARN ["));
        CHECK(absl::StrContains(log_line<Level::kError>("test"), "ERROR ["));
        CHECK(absl::StrContains(log_line<Level::kCritical>("test"), " CRIT ["));
        CHECK(absl::StrContains(log_line<Level::kNone>("test"), "test"));
    }

    SECTION("narrower verbosity") {
        test_util::SetLogVerbosityGuard guard{Level::kWarning};
        CHECK(log_line<Level::kInfo>("test").empty());
        CHECK_FALSE(log_line<Level::kWarning>("test").empty());
    }

    SECTION("test_verbosity") {
        test_util::SetLogVerbosityGuard guard{Level::kDebug};
        CHECK(test_verbosity(Level::kInfo));
        CHECK(test_verbosity(Level::kDebug));
        CHECK_FALSE(test_verbosity(Level::kTrace));
        CHECK(test_verbosity(Level::kNone));
    }

    SECTION("disabled macro does not evaluate its arguments") {
        int evaluations{0};
        auto count = [&]() { return ++evaluations; };
        HERALD_DEBUG << count();
        CHECK(evaluations == 0);
        HERALD_INFO << count();
        CHECK(evaluations == 1);
    }

    SECTION("line is printed on destruction") {
        HERALD_WARN_M("notify", {"woken", "3"});
        CHECK(absl::StrContains(string_cerr.str(), "notify woken=3\n"));
        CHECK(string_cout.str().empty());
    }

    SECTION("std::cout when configured") {
        init(Settings{.log_std_out = true, .log_nocolor = true});
        HERALD_INFO << "to stdout";
        CHECK(absl::StrContains(string_cout.str(), "to stdout"));
        CHECK_FALSE(absl::StrContains(string_cerr.str(), "to stdout"));
    }

    SECTION("thread name") {
        init(Settings{.log_nocolor = true, .log_threads = true});
        set_thread_name("listener-7");
        CHECK(absl::StrContains(log_line<Level::kInfo>("test"), "[listener-7] test"));

        init(settings);
        CHECK_FALSE(absl::StrContains(log_line<Level::kInfo>("test"), "listener-7"));
        set_thread_name("");
    }

    SECTION("key/value arguments") {
        LogBufferForTest<Level::kInfo> log_buffer{"notify", {"woken", "3", "generation", "7"}};
        log_buffer << Args{"waiters", "0", "dangling"};
        CHECK(absl::StrContains(log_buffer.content(), "notify woken=3 generation=7 waiters=0 dangling="));
    }

    SECTION("log file gets the same uncolored lines") {
        const auto log_file{unique_log_file_path()};
        init(Settings{.log_nocolor = false, .log_file = log_file.string()});
        HERALD_INFO_M("notify", {"woken", "3"});
        CHECK(absl::StrContains(string_cerr.str(), "notify woken=3"));
        CHECK_FALSE(absl::StrContains(string_cerr.str(), kColorReset));

        init(settings);  // closes the file
        std::ifstream tee{log_file};
        const std::string tee_content{std::istreambuf_iterator<char>{tee}, std::istreambuf_iterator<char>{}};
        CHECK(absl::StrContains(tee_content, "notify woken=3"));
        tee.close();
        std::filesystem::remove(log_file);
    }

    SECTION("unwritable log file") {
        const auto log_file = std::filesystem::temp_directory_path() / "herald_missing_dir" / "herald.log";
        CHECK_THROWS_AS(init(Settings{.log_file = log_file.string()}), std::runtime_error);
    }

    init(settings);
}

}  // namespace herald::log
