#pragma once

#include <urlcodec/config/app_config.hpp>
#include <urlcodec/core/result.hpp>

#include <iostream>
#include <string>
#include <string_view>

namespace urlcodec {

// ---------------------------------------------------------------------------
// OutputFormatter: human-readable and JSON output for urlcodec commands.
//
// Results go to `out`, errors to `err`. In JSON mode every call writes
// exactly one JSON object followed by a newline. Color applies only to
// human-readable output.
// ---------------------------------------------------------------------------
class OutputFormatter {
public:
    explicit OutputFormatter(bool json_mode, bool color_mode = false,
                             std::ostream& out = std::cout,
                             std::ostream& err = std::cerr)
        : json_mode_(json_mode), color_mode_(color_mode && !json_mode),
          out_(out), err_(err) {}

    [[nodiscard]] bool IsJsonMode() const noexcept { return json_mode_; }
    [[nodiscard]] bool IsColorMode() const noexcept { return color_mode_; }

    // Encoded or decoded text. In text mode the output is written verbatim,
    // followed by a newline when trailing_newline is set.
    void PrintResult(Command command, std::string_view input,
                     std::string_view output, bool trailing_newline = true) const;

    // Successful validation.
    void PrintValid(std::string_view input) const;

    // An error, with the offending character marked when its index is known.
    void PrintError(const Error& error) const;

private:
    bool json_mode_;
    bool color_mode_;
    std::ostream& out_;
    std::ostream& err_;
};

} // namespace urlcodec
