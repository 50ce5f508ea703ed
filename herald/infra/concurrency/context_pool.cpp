// Copyright 2025 The Herald Authors
// SPDX-License-Identifier: Apache-2.0

#include "context_pool.hpp"

#include <exception>
#include <string>
#include <utility>

#include <herald/infra/common/ensure.hpp>
#include <herald/infra/common/log.hpp>

namespace herald::concurrency {

ContextPool::ContextPool(ContextPoolSettings settings) {
    ensure(settings.num_contexts > 0, "ContextPool: at least one context is required");

    contexts_.reserve(settings.num_contexts);
    for (uint32_t i{0}; i < settings.num_contexts; ++i) {
        auto ioc = std::make_unique<boost::asio::io_context>();
        auto work = boost::asio::make_work_guard(*ioc);
        contexts_.push_back(Context{std::move(ioc), std::move(work)});
    }
    HERALD_TRACE << "ContextPool created size=" << contexts_.size();
}

ContextPool::~ContextPool() {
    stop();
    join();
}

void ContextPool::start() {
    for (size_t i{0}; i < contexts_.size(); ++i) {
        threads_.create_thread([this, i]() { run(i); });
    }
    HERALD_DEBUG << "ContextPool started threads=" << contexts_.size();
}

void ContextPool::run(size_t index) {
    log::set_thread_name("ctx" + std::to_string(index));
    try {
        contexts_[index].ioc->run();
    } catch (const std::exception& e) {
        // Handlers are not expected to throw: a failure here leaves the pool unusable
        HERALD_CRIT << "ContextPool context " << index << " loop failed: " << e.what();
        std::terminate();
    }
    HERALD_TRACE << "ContextPool context " << index << " loop done";
}

void ContextPool::stop() {
    if (stopped_.exchange(true)) {
        return;
    }
    for (auto& context : contexts_) {
        context.work.reset();
        context.ioc->stop();
    }
    HERALD_DEBUG << "ContextPool stopped";
}

void ContextPool::join() {
    threads_.join();
}

boost::asio::io_context& ContextPool::next_ioc() {
    const size_t index = next_index_.fetch_add(1) % contexts_.size();
    return *contexts_[index].ioc;
}

}  // namespace herald::concurrency
