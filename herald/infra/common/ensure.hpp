// Copyright 2025 The Herald Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <concepts>
#include <functional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace herald {

//! Throw std::logic_error carrying the message unless the condition holds
inline void ensure(bool condition, std::string_view message) {
    if (!condition) [[unlikely]] {
        throw std::logic_error{std::string{message}};
    }
}

//! Same as above, but the message is built only on failure
//! e.g. `ensure(ok, [&]() { return "listener " + std::to_string(id) + " already waiting"; });`
template <std::invocable F>
    requires std::convertible_to<std::invoke_result_t<F>, std::string>
inline void ensure(bool condition, F&& build_message) {
    if (!condition) [[unlikely]] {
        throw std::logic_error{std::invoke(std::forward<F>(build_message))};
    }
}

//! For conditions that only a bug in herald itself can break
inline void ensure_invariant(bool condition, std::string_view what) {
    if (!condition) [[unlikely]] {
        throw std::logic_error{"Invariant violation: " + std::string{what}};
    }
}

}  // namespace herald
