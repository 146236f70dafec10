#include <urlcodec/config/config_loader.hpp>

#include <urlcodec/core/log.hpp>
#include <urlcodec/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <stdexcept>
#include <string>

namespace urlcodec {

namespace {

template <typename T>
struct YamlValueType { using type = T; };

template <typename T>
struct YamlValueType<std::optional<T>> { using type = T; };

// Assign root[key] to target when present. A present key of the wrong type
// is a config error.
template <typename Target>
std::optional<Error> ReadYamlKey(const YAML::Node& root, const char* key, Target& target) {
    if (!root[key]) {
        return std::nullopt;
    }
    try {
        target = root[key].template as<typename YamlValueType<Target>::type>();
    } catch (const YAML::Exception& e) {
        return Error::Config("Invalid value for '" + std::string(key) + "': " + e.what());
    }
    return std::nullopt;
}

} // anonymous namespace

const char* CommandName(Command command) {
    switch (command) {
        case Command::Encode:   return "encode";
        case Command::Decode:   return "decode";
        case Command::Validate: return "validate";
    }
    return "encode";
}

std::optional<Command> ParseCommand(std::string_view name) {
    if (name == "encode") return Command::Encode;
    if (name == "decode") return Command::Decode;
    if (name == "validate") return Command::Validate;
    return std::nullopt;
}

std::optional<LogFormat> ParseLogFormat(std::string_view name) {
    if (name == "text") return LogFormat::Text;
    if (name == "json") return LogFormat::Json;
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(std::string(file_path));
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            Error::Config("Failed to parse YAML file: " + std::string(e.what())));
    }
    if (root.IsNull()) {
        // An empty file carries no overrides.
        AppConfig config;
        config.config_file = std::string(file_path);
        return Result<AppConfig, Error>::Ok(std::move(config));
    }
    if (!root.IsMap()) {
        return Result<AppConfig, Error>::Err(
            Error::Config("YAML config must be a mapping of option names to values"));
    }

    AppConfig config;
    config.config_file = std::string(file_path);

    const std::optional<Error> key_errors[] = {
        // -- Output --
        ReadYamlKey(root, "json_output", config.output.json_output),
        ReadYamlKey(root, "color", config.output.color),
        ReadYamlKey(root, "trailing_newline", config.output.trailing_newline),
        // -- Input --
        ReadYamlKey(root, "strip_newline", config.input.strip_newline),
        // -- Logging --
        ReadYamlKey(root, "log_file", config.log.log_file),
        ReadYamlKey(root, "verbose", config.log.verbose),
        ReadYamlKey(root, "quiet", config.log.quiet),
    };
    for (const auto& error : key_errors) {
        if (error.has_value()) {
            return Result<AppConfig, Error>::Err(*error);
        }
    }

    std::string format_name;
    if (auto error = ReadYamlKey(root, "log_format", format_name)) {
        return Result<AppConfig, Error>::Err(*error);
    }
    if (!format_name.empty()) {
        auto format = ParseLogFormat(format_name);
        if (!format.has_value()) {
            return Result<AppConfig, Error>::Err(
                Error::Config("Invalid log_format '" + format_name + "' (expected text or json)"));
        }
        config.log.format = *format;
    }

    std::string level_name;
    if (auto error = ReadYamlKey(root, "log_level", level_name)) {
        return Result<AppConfig, Error>::Err(*error);
    }
    if (!level_name.empty()) {
        auto level = ParseLogLevel(level_name);
        if (!level.has_value()) {
            return Result<AppConfig, Error>::Err(
                Error::Config("Invalid log_level '" + level_name +
                              "' (expected debug, info, warn or error)"));
        }
        config.log.level = *level;
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv) {
    // --version is answered in main before parsing; only --help stays built in.
    argparse::ArgumentParser program("urlcodec", kVersion,
                                     argparse::default_arguments::help);
    program.add_description(
        "Percent-encode text per RFC 3986, or decode and validate percent-encoded text.");

    program.add_argument("command")
        .help("encode, decode or validate");
    program.add_argument("input")
        .help("Text to process (default: read stdin)")
        .nargs(argparse::nargs_pattern::optional);

    program.add_argument("-c", "--config")
        .help("Path to YAML config file");
    program.add_argument("--json")
        .help("JSON output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--color")
        .help("Force colored output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--no-color")
        .help("Disable colored output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--no-newline")
        .help("Do not print a newline after the result")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--keep-newline")
        .help("Keep the trailing newline of stdin input")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--log-file")
        .help("Append log messages to this file");
    program.add_argument("--log-format")
        .help("Log format: text or json");
    program.add_argument("--log-level")
        .help("Minimum log level: debug, info, warn or error");
    program.add_argument("-v", "--verbose")
        .help("Verbose output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-q", "--quiet")
        .help("Quiet output")
        .default_value(false)
        .implicit_value(true);

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        return Result<AppConfig, Error>::Err(
            Error::Config("CLI parse error: " + std::string(e.what())));
    }

    AppConfig config;

    const auto command_name = program.get<std::string>("command");
    auto command = ParseCommand(command_name);
    if (!command.has_value()) {
        return Result<AppConfig, Error>::Err(
            Error::Config("Unknown command '" + command_name +
                          "' (expected encode, decode or validate)"));
    }
    config.command = *command;

    if (auto val = program.present("input")) {
        config.input.text = *val;
    }
    if (auto val = program.present("--config")) {
        config.config_file = *val;
    }

    // Output
    if (program.get<bool>("--json")) {
        config.output.json_output = true;
    }
    const bool force_color = program.get<bool>("--color");
    const bool force_no_color = program.get<bool>("--no-color");
    if (force_color && force_no_color) {
        return Result<AppConfig, Error>::Err(
            Error::Config("Cannot use both --color and --no-color"));
    }
    if (force_color) {
        config.output.color = true;
    } else if (force_no_color) {
        config.output.color = false;
    }
    if (program.get<bool>("--no-newline")) {
        config.output.trailing_newline = false;
    }

    // Input
    if (program.get<bool>("--keep-newline")) {
        config.input.strip_newline = false;
    }

    // Logging
    if (auto val = program.present("--log-file")) {
        config.log.log_file = *val;
    }
    if (auto val = program.present("--log-format")) {
        auto format = ParseLogFormat(*val);
        if (!format.has_value()) {
            return Result<AppConfig, Error>::Err(
                Error::Config("Invalid --log-format '" + *val + "' (expected text or json)"));
        }
        config.log.format = *format;
    }
    if (auto val = program.present("--log-level")) {
        auto level = ParseLogLevel(*val);
        if (!level.has_value()) {
            return Result<AppConfig, Error>::Err(
                Error::Config("Invalid --log-level '" + *val +
                              "' (expected debug, info, warn or error)"));
        }
        config.log.level = *level;
    }
    if (program.get<bool>("--verbose")) {
        config.log.verbose = true;
    }
    if (program.get<bool>("--quiet")) {
        config.log.quiet = true;
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// MergeConfigs
// ---------------------------------------------------------------------------
AppConfig MergeConfigs(const AppConfig& yaml_base, const AppConfig& cli_overrides) {
    AppConfig merged = yaml_base;

    // The command and its input only exist on the command line.
    merged.command = cli_overrides.command;
    merged.input.text = cli_overrides.input.text;
    if (cli_overrides.config_file.has_value()) {
        merged.config_file = cli_overrides.config_file;
    }

    // Output
    if (cli_overrides.output.json_output) {
        merged.output.json_output = true;
    }
    if (cli_overrides.output.color.has_value()) {
        merged.output.color = cli_overrides.output.color;
    }
    if (!cli_overrides.output.trailing_newline) {
        merged.output.trailing_newline = false;
    }

    // Input
    if (!cli_overrides.input.strip_newline) {
        merged.input.strip_newline = false;
    }

    // Logging
    if (cli_overrides.log.log_file.has_value()) {
        merged.log.log_file = cli_overrides.log.log_file;
    }
    if (cli_overrides.log.format.has_value()) {
        merged.log.format = cli_overrides.log.format;
    }
    if (cli_overrides.log.level.has_value()) {
        merged.log.level = cli_overrides.log.level;
    }
    // -v or -q on the command line replaces the verbosity from the file.
    if (cli_overrides.log.verbose || cli_overrides.log.quiet) {
        merged.log.verbose = cli_overrides.log.verbose;
        merged.log.quiet = cli_overrides.log.quiet;
    }

    return merged;
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AppConfig& config) {
    if (config.log.verbose && config.log.quiet) {
        return Result<void, Error>::Err(
            Error::Config("Cannot use both --verbose and --quiet"));
    }
    if (config.log.log_file.has_value() && config.log.log_file->empty()) {
        return Result<void, Error>::Err(
            Error::Config("log_file must not be empty"));
    }
    return Result<void, Error>::Ok();
}

} // namespace urlcodec
