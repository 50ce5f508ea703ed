// Copyright 2025 The Herald Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

namespace herald {

//! Log the failed expression and abort the process
[[noreturn]] void abort_on_assertion_failure(const char* expression, const char* file, int line);

}  // namespace herald

// Checked also in release builds: use it for internal invariants whose breach leaves no safe way to go on,
// e.g. inside noexcept functions. Use ensure() for caller mistakes.
#define HERALD_ASSERT(expr)   \
    if ((expr)) [[likely]]    \
        static_cast<void>(0); \
    else                      \
        ::herald::abort_on_assertion_failure(#expr, __FILE__, __LINE__)
