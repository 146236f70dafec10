#pragma once

namespace urlcodec {

// RFC 3986 section 2.3 unreserved characters: ALPHA / DIGIT / "-" / "." / "_" / "~".
// The encoder, validator and decoder all go through this one predicate.
// Unlike std::isalnum it does not depend on the current locale.
constexpr bool IsUnreserved(char32_t c) noexcept {
    return (c >= U'A' && c <= U'Z') ||
           (c >= U'a' && c <= U'z') ||
           (c >= U'0' && c <= U'9') ||
           c == U'-' || c == U'_' || c == U'.' || c == U'~';
}

constexpr bool IsHexDigit(char32_t c) noexcept {
    return (c >= U'0' && c <= U'9') ||
           (c >= U'a' && c <= U'f') ||
           (c >= U'A' && c <= U'F');
}

} // namespace urlcodec
