// Copyright 2025 The Herald Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <algorithm>
#include <cstdint>
#include <thread>

namespace herald::concurrency {

//! Default number of threads running the listener tasks
inline const uint32_t kDefaultNumContexts{std::max(std::thread::hardware_concurrency() / 2, 1u)};

//! The configuration settings for \refitem ContextPool
struct ContextPoolSettings {
    uint32_t num_contexts{kDefaultNumContexts};  // The number of execution contexts to activate
};

}  // namespace herald::concurrency
