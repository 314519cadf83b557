// Copyright 2025 The Ember Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>
#include <string>

#include <CLI/CLI.hpp>

#include <ember/infra/common/log.hpp>

namespace ember::cmd::common {

//! \brief Set up options to populate log settings after cli.parse()
void add_logging_options(CLI::App& cli, log::Settings& log_settings);

//! \brief Set up option for the database name in projects/{project}/databases/{database} form
void add_option_database(CLI::App& cli, std::string& database);

//! \brief Set up option for an existing JSON fixture file
void add_option_fixture(CLI::App& cli, std::filesystem::path& fixture, bool is_required);

}  // namespace ember::cmd::common
