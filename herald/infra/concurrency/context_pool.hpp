// Copyright 2025 The Herald Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/detail/thread_group.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include <herald/infra/concurrency/context_pool_settings.hpp>

namespace herald::concurrency {

//! Fixed set of io_context instances, each one run by a dedicated thread until the pool is stopped.
//! Tasks suspended at stop time are destroyed together with their io_context.
class ContextPool {
  public:
    explicit ContextPool(uint32_t num_contexts)
        : ContextPool{ContextPoolSettings{.num_contexts = num_contexts}} {}

    //! \throws std::logic_error if the pool is empty
    explicit ContextPool(ContextPoolSettings settings);

    //! Stop and join
    ~ContextPool();

    ContextPool(const ContextPool&) = delete;
    ContextPool& operator=(const ContextPool&) = delete;

    void start();

    //! Stop all the running loops without waiting for them, use \ref join() for that
    void stop();

    //! Block until all threads are done, i.e. after \ref stop()
    void join();

    size_t size() const { return contexts_.size(); }

    //! Pick the next io_context in round-robin order. Thread-safe.
    boost::asio::io_context& next_ioc();

    boost::asio::any_io_executor any_executor() { return next_ioc().get_executor(); }

  private:
    struct Context {
        std::unique_ptr<boost::asio::io_context> ioc;
        boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work;
    };

    void run(size_t index);

    std::vector<Context> contexts_;
    boost::asio::detail::thread_group threads_;
    std::atomic_size_t next_index_{0};
    std::atomic_bool stopped_{false};
};

}  // namespace herald::concurrency
