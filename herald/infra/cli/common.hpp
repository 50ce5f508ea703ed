// Copyright 2025 The Herald Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>

#include <CLI/CLI.hpp>

#include <herald/infra/common/log.hpp>
#include <herald/infra/concurrency/context_pool_settings.hpp>

namespace herald::cmd::common {

//! \brief Set up options to populate log settings after cli.parse()
void add_logging_options(CLI::App& cli, log::Settings& log_settings);

//! \brief Set up option for the number of execution contexts
void add_option_num_contexts(CLI::App& cli, uint32_t& num_contexts);

//! \brief Set up context pool options
void add_context_pool_options(CLI::App& cli, concurrency::ContextPoolSettings& settings);

}  // namespace herald::cmd::common
