#include <urlcodec/cli/command_executor.hpp>

#include <urlcodec/codec/url.hpp>
#include <urlcodec/codec/utf8.hpp>
#include <urlcodec/core/log.hpp>

#include <istream>
#include <iterator>

namespace urlcodec {

namespace {

constexpr int kExitSuccess = 0;

std::string InvalidCharacterHint(char32_t character) {
    if (character == U'%') {
        return "'%' must be followed by two hexadecimal digits";
    }
    if (character == U' ') {
        return "spaces must be written as %20";
    }
    if (character >= 0x80) {
        return "non-ASCII characters must be percent-encoded byte by byte, "
               "e.g. with 'urlcodec encode'";
    }
    return "only A-Z a-z 0-9 - _ . ~ and %XX triplets may appear in encoded text";
}

} // anonymous namespace

Result<std::string, Error> ReadInput(const InputConfig& config, std::istream& in) {
    std::string data((std::istreambuf_iterator<char>(in)),
                     std::istreambuf_iterator<char>());
    if (in.bad()) {
        return Result<std::string, Error>::Err(
            Error::Io("ReadInput", "Failed to read input from stdin"));
    }
    if (config.strip_newline && !data.empty() && data.back() == '\n') {
        data.pop_back();
        if (!data.empty() && data.back() == '\r') {
            data.pop_back();
        }
    }
    LogDebug("input", "read " + std::to_string(data.size()) + " bytes");
    return Result<std::string, Error>::Ok(std::move(data));
}

Error ToAppError(const DecodeError& error, const std::string& operation,
                 const std::string& input) {
    Error app_error;
    app_error.operation = operation;
    app_error.message = error.ToString();
    app_error.input = input;

    if (error.IsInvalidCharacter()) {
        const auto& detail = error.AsInvalidCharacter();
        app_error.category = ErrorCategory::InvalidCharacter;
        app_error.index = detail.index;
        app_error.character = EncodeCodePoint(detail.character);
        app_error.hint = InvalidCharacterHint(detail.character);
    } else {
        app_error.category = ErrorCategory::InvalidUtf8;
        app_error.hint = "the percent-triplets are well formed but do not spell UTF-8 text";
    }
    return app_error;
}

int RunCommand(const AppConfig& config, const std::string& input,
               const OutputFormatter& formatter) {
    const std::string operation = CommandName(config.command);
    LogDebug(operation, "processing " + std::to_string(input.size()) + " bytes");

    switch (config.command) {
        case Command::Encode: {
            const auto encoded = UrlEncode(input);
            LogInfo(operation, "encoded " + std::to_string(input.size()) +
                                   " bytes into " + std::to_string(encoded.size()));
            formatter.PrintResult(config.command, input, encoded,
                                  config.output.trailing_newline);
            return kExitSuccess;
        }
        case Command::Decode: {
            auto decoded = UrlDecode(input).MapErr([&](DecodeError error) {
                LogWarn(operation, error.ToString());
                return ToAppError(error, operation, input);
            });
            if (decoded.IsErr()) {
                formatter.PrintError(decoded.Error());
                return decoded.Error().ExitCode();
            }
            LogInfo(operation, "decoded " + std::to_string(input.size()) +
                                   " bytes into " +
                                   std::to_string(decoded.Value().size()));
            formatter.PrintResult(config.command, input, decoded.Value(),
                                  config.output.trailing_newline);
            return kExitSuccess;
        }
        case Command::Validate: {
            auto valid = ValidateUrlEncoded(input);
            if (valid.IsErr()) {
                LogWarn(operation, valid.Error().ToString());
                const auto error = ToAppError(valid.Error(), operation, input);
                formatter.PrintError(error);
                return error.ExitCode();
            }
            LogInfo(operation, "input is well-formed");
            formatter.PrintValid(input);
            return kExitSuccess;
        }
    }

    Error error;
    error.operation = operation;
    error.message = "Unhandled command";
    error.category = ErrorCategory::Internal;
    formatter.PrintError(error);
    return error.ExitCode();
}

} // namespace urlcodec
