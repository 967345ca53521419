#pragma once

#include <toolhost/config/app_config.hpp>
#include <toolhost/core/result.hpp>

#include <string_view>

namespace toolhost {

// Parse a YAML config file into an AppConfig. Missing keys keep their
// defaults.
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path);

// Parse CLI arguments. --help prints usage and exits the process.
Result<CliOverrides, Error> LoadFromCli(int argc, const char* const* argv);

// Apply cli_overrides on top of yaml_base. An explicit --log-level beats
// -v/-vv, which beat log.level from the file.
AppConfig MergeConfigs(const AppConfig& yaml_base, const CliOverrides& cli_overrides);

// Validate that values are sane.
Result<void, Error> ValidateConfig(const AppConfig& config);

} // namespace toolhost
