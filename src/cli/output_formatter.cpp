#include <urlcodec/cli/output_formatter.hpp>

#include <urlcodec/codec/utf8.hpp>
#include <urlcodec/core/ansi.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <utility>

namespace urlcodec {

namespace {

using namespace urlcodec::ansi;

// Inputs are arbitrary bytes; invalid UTF-8 is replaced rather than thrown on.
std::string Dump(const nlohmann::json& j) {
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

// Terminal columns taken by `cp`: 2 for East Asian wide and emoji ranges.
std::size_t ColumnWidth(char32_t cp) {
    if ((cp >= 0x1100 && cp <= 0x115F) ||
        (cp >= 0x2E80 && cp <= 0xA4CF) ||
        (cp >= 0xAC00 && cp <= 0xD7A3) ||
        (cp >= 0xF900 && cp <= 0xFAFF) ||
        (cp >= 0xFE30 && cp <= 0xFE4F) ||
        (cp >= 0xFF00 && cp <= 0xFF60) ||
        (cp >= 0xFFE0 && cp <= 0xFFE6) ||
        (cp >= 0x1F300 && cp <= 0x1F64F) ||
        (cp >= 0x1F900 && cp <= 0x1F9FF) ||
        (cp >= 0x20000 && cp <= 0x3FFFD)) {
        return 2;
    }
    return 1;
}

struct CaretLines {
    std::string text;
    std::string caret;
};

// The input on one line and a caret under code point `index`, padded by the
// column width of the characters before it. Empty when the input contains
// control characters (they would break the alignment).
std::optional<CaretLines> MakeCaretLines(std::string_view input, std::size_t index) {
    CaretLines lines;
    std::size_t offset = 0;
    std::size_t count = 0;
    std::size_t column = 0;
    while (offset < input.size()) {
        auto cp = DecodeCodePoint(input, offset);
        const char32_t value = cp.IsOk() ? cp.Value().value : kReplacementCharacter;
        offset += cp.IsOk() ? cp.Value().length : 1;
        if (value < 0x20 || value == 0x7F) {
            return std::nullopt;
        }
        lines.text += EncodeCodePoint(value);
        if (count < index) {
            column += ColumnWidth(value);
        }
        ++count;
    }
    if (index >= count) {
        return std::nullopt;
    }
    lines.caret = std::string(column, ' ') + "^";
    return lines;
}

} // anonymous namespace

void OutputFormatter::PrintResult(Command command, std::string_view input,
                                  std::string_view output,
                                  bool trailing_newline) const {
    if (json_mode_) {
        nlohmann::json j;
        j["command"] = CommandName(command);
        j["input"] = std::string(input);
        j["output"] = std::string(output);
        out_ << Dump(j) << "\n";
        return;
    }

    out_ << output;
    if (trailing_newline) {
        out_ << "\n";
    }
}

void OutputFormatter::PrintValid(std::string_view input) const {
    if (json_mode_) {
        nlohmann::json j;
        j["command"] = CommandName(Command::Validate);
        j["input"] = std::string(input);
        j["valid"] = true;
        out_ << Dump(j) << "\n";
        return;
    }

    if (color_mode_) {
        out_ << kGreen << "OK" << kReset << " valid\n";
        return;
    }
    out_ << "valid\n";
}

void OutputFormatter::PrintError(const Error& error) const {
    if (json_mode_) {
        err_ << error.ToJson() << "\n";
        return;
    }

    std::optional<CaretLines> context;
    if (error.input.has_value() && error.index.has_value()) {
        context = MakeCaretLines(*error.input, *error.index);
    }

    if (color_mode_) {
        err_ << kRed << "Error: " << kReset;
        err_ << kBold << error.operation << kReset << "\n";
        err_ << "  " << error.message << "\n";
        if (context.has_value()) {
            err_ << "  " << kDim << context->text << kReset << "\n";
            err_ << "  " << kRed << context->caret << kReset << "\n";
        }
        if (error.hint.has_value() && !error.hint->empty()) {
            err_ << "  " << kYellow << "Hint: " << kReset << *error.hint << "\n";
        }
        return;
    }

    // Plain-text multi-line layout (same structure as color path, no ANSI).
    err_ << "Error: " << error.operation << "\n";
    err_ << "  " << error.message << "\n";
    if (context.has_value()) {
        err_ << "  " << context->text << "\n";
        err_ << "  " << context->caret << "\n";
    }
    if (error.hint.has_value() && !error.hint->empty()) {
        err_ << "  Hint: " << *error.hint << "\n";
    }
}

} // namespace urlcodec
