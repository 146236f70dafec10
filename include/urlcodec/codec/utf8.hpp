#pragma once

#include <urlcodec/core/result.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace urlcodec {

// ---------------------------------------------------------------------------
// Utf8Error - where and how a byte sequence stops being valid UTF-8.
//
//   valid_up_to  Length of the longest valid UTF-8 prefix.
//   error_len    Length of the invalid sequence starting at valid_up_to, or
//                nullopt when the input ends in the middle of a sequence.
// ---------------------------------------------------------------------------
struct Utf8Error {
    std::size_t valid_up_to = 0;
    std::optional<std::size_t> error_len;

    [[nodiscard]] std::string ToString() const;

    bool operator==(const Utf8Error& other) const {
        return valid_up_to == other.valid_up_to && error_len == other.error_len;
    }
    bool operator!=(const Utf8Error& other) const { return !(*this == other); }
};

// A decoded code point and the number of bytes it occupied.
struct CodePoint {
    char32_t value = 0;
    std::size_t length = 0;
};

constexpr char32_t kReplacementCharacter = 0xFFFD;

// Decode the code point starting at bytes[offset]. Strict: rejects overlong
// forms, surrogates and values above U+10FFFF. On error, valid_up_to is
// reported relative to `offset`, i.e. always equals `offset`.
// Precondition: offset < bytes.size().
Result<CodePoint, Utf8Error> DecodeCodePoint(std::string_view bytes,
                                             std::size_t offset);

// Check an entire byte sequence.
Result<void, Utf8Error> ValidateUtf8(std::string_view bytes);

// UTF-8 encoding of a single code point. Invalid scalars yield U+FFFD.
std::string EncodeCodePoint(char32_t cp);

// "U+0074", "U+1F47E".
std::string FormatCodePoint(char32_t cp);

} // namespace urlcodec
