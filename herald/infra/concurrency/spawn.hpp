// Copyright 2025 The Herald Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <utility>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/execution/executor.hpp>
#include <boost/asio/use_future.hpp>

namespace herald::concurrency {

//! Start a Task (or a callable returning one) on the executor and get its result as std::future
template <typename Executor, typename F>
    requires boost::asio::execution::is_executor<Executor>::value
auto spawn_future(const Executor& executor, F&& f) {
    return boost::asio::co_spawn(executor, std::forward<F>(f), boost::asio::use_future);
}

//! Block the calling thread until the spawned Task completes. Never call it from the executor's own threads.
template <typename Executor, typename F>
    requires boost::asio::execution::is_executor<Executor>::value
auto spawn_future_and_wait(const Executor& executor, F&& f) {
    return spawn_future(executor, std::forward<F>(f)).get();
}

}  // namespace herald::concurrency
