// Copyright 2025 The Herald Authors
// SPDX-License-Identifier: Apache-2.0

#include "assert.hpp"

#include <cstdlib>
#include <string>

#include <herald/infra/common/log.hpp>

namespace herald {

void abort_on_assertion_failure(const char* expression, const char* file, int line) {
    // Level kNone is printed whatever the configured verbosity
    log::Message{"Assertion failed", {"expression", expression, "file", file, "line", std::to_string(line)}};
    std::abort();
}

}  // namespace herald
