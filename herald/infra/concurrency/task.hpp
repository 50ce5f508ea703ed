// Copyright 2025 The Herald Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <boost/asio/awaitable.hpp>

namespace herald {

//! Coroutine result type of every asynchronous operation in herald, e.g. Listener::wait()
template <typename T>
using Task = boost::asio::awaitable<T>;

}  // namespace herald
