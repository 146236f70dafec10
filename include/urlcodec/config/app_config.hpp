#pragma once

#include <urlcodec/core/log.hpp>

#include <optional>
#include <string>

namespace urlcodec {

enum class Command {
    Encode,
    Decode,
    Validate,
};

enum class LogFormat {
    Text,
    Json,
};

struct OutputConfig {
    bool json_output = false;
    std::optional<bool> color;     // unset: auto-detect from the terminal
    bool trailing_newline = true;  // newline after the encoded/decoded text
};

struct InputConfig {
    std::optional<std::string> text;  // unset: read stdin
    bool strip_newline = true;        // drop one trailing \n or \r\n from stdin
};

struct LogConfig {
    std::optional<std::string> log_file;
    std::optional<LogFormat> format;  // unset: text
    std::optional<LogLevel> level;  // unset: warn; -v and -q take precedence
    bool verbose = false;
    bool quiet = false;
};

struct AppConfig {
    Command command = Command::Encode;
    std::optional<std::string> config_file;
    InputConfig input;
    OutputConfig output;
    LogConfig log;
};

const char* CommandName(Command command);

} // namespace urlcodec
