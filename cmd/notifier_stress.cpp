// Copyright 2025 The Herald Authors
// SPDX-License-Identifier: Apache-2.0

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <future>
#include <string>
#include <thread>
#include <vector>

#include <CLI/CLI.hpp>

#include <herald/infra/cli/common.hpp>
#include <herald/infra/common/log.hpp>
#include <herald/infra/concurrency/change_notifier.hpp>
#include <herald/infra/concurrency/context_pool.hpp>
#include <herald/infra/concurrency/spawn.hpp>
#include <herald/infra/concurrency/task.hpp>

using namespace herald;
using namespace std::chrono_literals;

using Counter = concurrency::ChangeNotifier<std::atomic_uint64_t>;

struct StressSettings {
    log::Settings log_settings;
    concurrency::ContextPoolSettings context_pool_settings;
    uint32_t num_listeners{16};      // Number of concurrent listener tasks
    uint32_t num_waits{1000};        // Number of waits performed by each listener task
    uint32_t update_interval_us{0};  // Pause between two consecutive updates in microseconds
    uint32_t timeout_s{60};          // Give up if the listeners are not done by then
};

void parse_command_line(int argc, char* argv[], CLI::App& cli, StressSettings& settings) {
    cmd::common::add_logging_options(cli, settings.log_settings);
    cmd::common::add_context_pool_options(cli, settings.context_pool_settings);

    cli.add_option("--listeners", settings.num_listeners, "Number of concurrent listener tasks")
        ->capture_default_str()
        ->check(CLI::Range(1u, 1'000'000u));
    cli.add_option("--waits", settings.num_waits, "Number of waits performed by each listener task")
        ->capture_default_str()
        ->check(CLI::Range(1u, UINT32_MAX));
    cli.add_option("--updates.interval", settings.update_interval_us, "Pause between updates in microseconds")
        ->capture_default_str();
    cli.add_option("--timeout", settings.timeout_s, "Fail if the listeners do not complete within this many seconds")
        ->capture_default_str()
        ->check(CLI::Range(1u, 86'400u));

    cli.parse(argc, argv);
}

//! Wait for the given number of updates, then report the last update count observed
Task<uint64_t> listen_repeatedly(const Counter& counter, uint32_t num_waits) {
    for (uint32_t i{0}; i < num_waits; ++i) {
        auto listener = counter.listen();
        co_await listener.wait();
    }
    co_return counter->load();
}

bool all_ready(std::vector<std::future<uint64_t>>& futures) {
    for (auto& future : futures) {
        if (future.wait_for(0s) != std::future_status::ready) return false;
    }
    return true;
}

int main(int argc, char* argv[]) {
    CLI::App cli{"Herald change notifier stress test"};
    StressSettings settings;

    try {
        parse_command_line(argc, argv, cli, settings);
    } catch (const CLI::ParseError& pe) {
        return cli.exit(pe);
    }

    try {
        log::init(settings.log_settings);
        log::set_thread_name("main");

        HERALD_INFO_M("Stress test started",
                      {"contexts", std::to_string(settings.context_pool_settings.num_contexts),
                       "listeners", std::to_string(settings.num_listeners),
                       "waits", std::to_string(settings.num_waits),
                       "interval", std::to_string(settings.update_interval_us) + "us",
                       "timeout", std::to_string(settings.timeout_s) + "s"});

        // Declared before the pool: listener tasks still suspended at pool destruction refer to it
        Counter counter{std::in_place, 0u};

        concurrency::ContextPool context_pool{settings.context_pool_settings};
        context_pool.start();

        const auto start_time = std::chrono::steady_clock::now();
        const auto deadline = start_time + std::chrono::seconds{settings.timeout_s};

        std::vector<std::future<uint64_t>> futures;
        futures.reserve(settings.num_listeners);
        for (uint32_t i{0}; i < settings.num_listeners; ++i) {
            futures.push_back(concurrency::spawn_future(context_pool.any_executor(), listen_repeatedly(counter, settings.num_waits)));
        }

        uint64_t num_updates{0};
        while (!all_ready(futures)) {
            counter.update([](std::atomic_uint64_t& value) { value.fetch_add(1); });
            ++num_updates;
            if (settings.update_interval_us > 0) {
                std::this_thread::sleep_for(std::chrono::microseconds{settings.update_interval_us});
            } else {
                std::this_thread::yield();
            }
            if (std::chrono::steady_clock::now() > deadline) {
                HERALD_ERROR_M("Stress test timed out",
                               {"updates", std::to_string(num_updates),
                                "waiters", std::to_string(counter.event()->num_waiters())});
                return 1;
            }
            if (num_updates % 100'000 == 0) {
                HERALD_DEBUG << "Stress test progress: updates=" << num_updates << " waiters=" << counter.event()->num_waiters();
            }
        }

        // Each listener returns the update count seen after its last wake
        uint64_t min_observed{num_updates};
        for (auto& future : futures) {
            min_observed = std::min(min_observed, future.get());
        }
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start_time);

        context_pool.stop();
        context_pool.join();

        HERALD_INFO_M("Stress test completed",
                      {"updates", std::to_string(num_updates),
                       "waits", std::to_string(uint64_t{settings.num_listeners} * settings.num_waits),
                       "min_observed", std::to_string(min_observed),
                       "elapsed", std::to_string(elapsed.count()) + "ms"});
        return 0;
    } catch (const std::exception& e) {
        HERALD_CRIT << "Stress test failed: " << e.what();
    } catch (...) {
        HERALD_CRIT << "Stress test failed: unexpected exception";
    }
    return 1;
}
