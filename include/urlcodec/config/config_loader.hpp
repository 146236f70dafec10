#pragma once

#include <urlcodec/config/app_config.hpp>
#include <urlcodec/core/result.hpp>

#include <optional>
#include <string_view>

namespace urlcodec {

// "encode" / "decode" / "validate".
std::optional<Command> ParseCommand(std::string_view name);

// "text" / "json".
std::optional<LogFormat> ParseLogFormat(std::string_view name);

// Parse a YAML config file into an AppConfig. Only option keys are read;
// the command and its input always come from the command line.
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path);

// Parse CLI arguments into an AppConfig, including the --config path.
// --help and --version are handled by argparse, which prints and exits.
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv);

// Merge two configs: options set on the command line take precedence over
// those from the YAML file.
AppConfig MergeConfigs(const AppConfig& yaml_base, const AppConfig& cli_overrides);

// Reject contradictory option combinations.
Result<void, Error> ValidateConfig(const AppConfig& config);

} // namespace urlcodec
