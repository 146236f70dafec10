#include <urlcodec/cli/command_executor.hpp>
#include <urlcodec/cli/output_formatter.hpp>
#include <urlcodec/config/config_loader.hpp>
#include <urlcodec/core/log.hpp>
#include <urlcodec/core/terminal.hpp>
#include <urlcodec/core/version.hpp>

#include <iostream>
#include <memory>
#include <string>
#include <string_view>

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitUsage   = 1;

// Check for --version before the first positional (command) argument.
bool HandleVersionFlag(int argc, const char* const* argv) {
    for (int i = 1; i < argc; ++i) {
        auto arg = std::string_view{argv[i]};
        if (arg == "--version") {
            std::cout << "urlcodec " << urlcodec::kVersion << "\n";
            return true;
        }
        if (!arg.empty() && arg[0] != '-') break;
    }
    return false;
}

// Check if --json appears anywhere in argv (for pre-parse error formatting).
bool HasJsonFlag(int argc, const char* const* argv) {
    for (int i = 1; i < argc; ++i) {
        if (std::string_view{argv[i]} == "--json") return true;
    }
    return false;
}

void PrintUsage(std::ostream& out) {
    out << "Usage: urlcodec <encode|decode|validate> [input] [flags]\n"
        << "Run 'urlcodec --help' for the list of flags.\n";
}

urlcodec::LogLevel LogLevelFor(const urlcodec::LogConfig& log) {
    if (log.quiet) return urlcodec::LogLevel::Error;
    if (log.verbose) return urlcodec::LogLevel::Debug;
    return log.level.value_or(urlcodec::LogLevel::Warn);
}

urlcodec::Result<std::unique_ptr<urlcodec::ILogSink>, urlcodec::Error>
MakeLogSink(const urlcodec::AppConfig& config) {
    using namespace urlcodec;
    using SinkResult = Result<std::unique_ptr<ILogSink>, Error>;

    if (config.log.log_file.has_value()) {
        auto file_sink = FileSink::Open(*config.log.log_file);
        if (file_sink.IsErr()) {
            return SinkResult::Err(std::move(file_sink).Error());
        }
        return SinkResult::Ok(std::move(file_sink).Value());
    }
    if (config.log.format.value_or(LogFormat::Text) == LogFormat::Json) {
        return SinkResult::Ok(std::make_unique<JsonSink>(std::cerr));
    }
    const bool use_color = ResolveColor(config.output.color.value_or(false),
                                        !config.output.color.value_or(true),
                                        IsStderrTty());
    return SinkResult::Ok(std::make_unique<ColorConsoleSink>(use_color));
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    using namespace urlcodec;

    if (argc == 1) {
        PrintUsage(std::cerr);
        return kExitUsage;
    }

    if (HandleVersionFlag(argc, argv)) {
        return kExitSuccess;
    }

    // Step 1: Parse CLI args (argparse handles --help and exits).
    auto cli_result = LoadFromCli(argc, argv);
    if (cli_result.IsErr()) {
        OutputFormatter fmt(HasJsonFlag(argc, argv));
        fmt.PrintError(cli_result.Error());
        if (!fmt.IsJsonMode()) {
            PrintUsage(std::cerr);
        }
        return cli_result.Error().ExitCode();
    }
    auto cli_config = std::move(cli_result).Value();

    // Step 2: Load YAML config if -c/--config was given, merge with CLI.
    AppConfig config;
    if (cli_config.config_file.has_value()) {
        auto yaml_result = LoadFromYaml(*cli_config.config_file);
        if (yaml_result.IsErr()) {
            OutputFormatter(cli_config.output.json_output).PrintError(yaml_result.Error());
            return yaml_result.Error().ExitCode();
        }
        config = MergeConfigs(std::move(yaml_result).Value(), cli_config);
    } else {
        config = std::move(cli_config);
    }

    // Step 3: Validate config.
    auto valid = ValidateConfig(config);
    if (valid.IsErr()) {
        OutputFormatter(config.output.json_output).PrintError(valid.Error());
        return valid.Error().ExitCode();
    }

    // Step 4: Logging.
    auto sink = MakeLogSink(config);
    if (sink.IsErr()) {
        OutputFormatter(config.output.json_output).PrintError(sink.Error());
        return sink.Error().ExitCode();
    }
    InitGlobalLogger(std::move(sink).Value(), LogLevelFor(config.log));
    if (config.config_file.has_value()) {
        LogDebug("config", "loaded " + *config.config_file);
    }

    const bool use_color = !config.output.json_output &&
        ResolveColor(config.output.color.value_or(false),
                     !config.output.color.value_or(true),
                     IsStdoutTty());
    OutputFormatter formatter(config.output.json_output, use_color);

    // Step 5: Resolve input: positional argument, else stdin.
    std::string input;
    if (config.input.text.has_value()) {
        input = *config.input.text;
    } else {
        if (IsStdinTty()) {
            auto error = Error::Io("ReadInput",
                                   "No input: pass it as an argument or pipe it on stdin");
            formatter.PrintError(error);
            return error.ExitCode();
        }
        auto read = ReadInput(config.input, std::cin);
        if (read.IsErr()) {
            formatter.PrintError(read.Error());
            return read.Error().ExitCode();
        }
        input = std::move(read).Value();
    }

    // Step 6: Run the command and report.
    return RunCommand(config, input, formatter);
}
