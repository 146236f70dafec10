#pragma once

#include <urlcodec/cli/output_formatter.hpp>
#include <urlcodec/codec/decode_error.hpp>
#include <urlcodec/config/app_config.hpp>
#include <urlcodec/core/result.hpp>

#include <iosfwd>
#include <string>

namespace urlcodec {

// Read all of `in` as command input. One trailing "\n" or "\r\n" is dropped
// when config.strip_newline is set, so `echo text | urlcodec decode` works.
Result<std::string, Error> ReadInput(const InputConfig& config, std::istream& in);

// Convert a codec error into a front-end Error carrying the input, the
// offending character and a hint on how to fix it.
Error ToAppError(const DecodeError& error, const std::string& operation,
                 const std::string& input);

// ---------------------------------------------------------------------------
// RunCommand: execute config.command on `input` and print the outcome.
//
// Returns 0 on success, otherwise Error::ExitCode() of the failure. Errors
// are printed through the formatter, never thrown.
// ---------------------------------------------------------------------------
int RunCommand(const AppConfig& config, const std::string& input,
               const OutputFormatter& formatter);

} // namespace urlcodec
