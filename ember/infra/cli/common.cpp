// Copyright 2025 The Ember Authors
// SPDX-License-Identifier: Apache-2.0

#include "common.hpp"

#include <map>
#include <string_view>
#include <vector>

#include <absl/strings/str_split.h>

namespace ember::cmd::common {

//! CLI11 validator for database names: projects/{project}/databases/{database}
struct DatabaseNameValidator : public CLI::Validator {
    DatabaseNameValidator() {
        description("projects/{project}/databases/{database}");
        func_ = [](const std::string& value) -> std::string {
            const std::vector<std::string_view> segments = absl::StrSplit(value, '/');
            if (segments.size() != 4 || segments[0] != "projects" || segments[2] != "databases" ||
                segments[1].empty() || segments[3].empty()) {
                return "Invalid database name: " + value;
            }
            return {};
        };
    }
};

void add_logging_options(CLI::App& cli, log::Settings& log_settings) {
    std::map<std::string, log::Level> level_mapping{
        {"critical", log::Level::kCritical},
        {"error", log::Level::kError},
        {"warning", log::Level::kWarning},
        {"info", log::Level::kInfo},
        {"debug", log::Level::kDebug},
        {"trace", log::Level::kTrace},
    };
    auto& log_opts = *cli.add_option_group("Log", "Logging options");
    log_opts.add_option("--log.verbosity", log_settings.log_verbosity, "Sets log verbosity")
        ->check(CLI::Range(log::Level::kCritical, log::Level::kTrace))
        ->transform(CLI::Transformer(level_mapping, CLI::ignore_case))
        ->default_val(log::Level::kInfo);
    log_opts.add_flag("--log.stdout", log_settings.log_std_out, "Outputs to std::out instead of std::err");
    log_opts.add_flag("--log.nocolor", log_settings.log_nocolor, "Disable colors on log lines");
    log_opts.add_flag("--log.utc", log_settings.log_utc, "Prints log timings in UTC");
    log_opts.add_flag("--log.threads", log_settings.log_threads, "Prints thread ids");
    log_opts.add_option("--log.file", log_settings.log_file, "Tee all log lines to given file name");
}

void add_option_database(CLI::App& cli, std::string& database) {
    cli.add_option("--database", database, "Database the documents belong to")
        ->capture_default_str()
        ->check(DatabaseNameValidator{});
}

void add_option_fixture(CLI::App& cli, std::filesystem::path& fixture, bool is_required) {
    cli.add_option("--fixture", fixture, "JSON file holding an array of documents to load")
        ->required(is_required)
        ->check(CLI::ExistingFile);
}

}  // namespace ember::cmd::common
