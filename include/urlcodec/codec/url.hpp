#pragma once

#include <urlcodec/codec/decode_error.hpp>
#include <urlcodec/core/result.hpp>

#include <string>
#include <string_view>

namespace urlcodec {

// Percent-encode a string per RFC 3986.
// Each byte that is an unreserved character (alphanumeric, '-', '_', '.', '~')
// passes through; every other byte becomes %XX (uppercase hex). Multi-byte
// UTF-8 characters therefore become one triplet per byte. Never fails.
std::string UrlEncode(std::string_view value);

// Check that `value` consists only of unreserved characters and '%' followed
// by two hex digits (either case). Reports the first offending character and
// its code-point index. A '%' without two following characters is reported
// as '%' at its own index.
Result<void, DecodeError> ValidateUrlEncoded(std::string_view value);

// Reverse UrlEncode. Runs ValidateUrlEncoded first and returns its error
// unchanged; otherwise decodes the triplets and requires the resulting bytes
// to be valid UTF-8.
Result<std::string, DecodeError> UrlDecode(std::string_view value);

} // namespace urlcodec
