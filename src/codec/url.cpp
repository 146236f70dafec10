#include <urlcodec/codec/url.hpp>
#include <urlcodec/codec/unreserved.hpp>
#include <urlcodec/codec/utf8.hpp>

#include <iomanip>
#include <sstream>

namespace urlcodec {

namespace {

// Next character of possibly ill-formed input. A byte that does not start a
// valid UTF-8 sequence counts as one U+FFFD character.
CodePoint NextCharacter(std::string_view text, std::size_t offset) {
    auto cp = DecodeCodePoint(text, offset);
    if (cp.IsErr()) {
        return CodePoint{kReplacementCharacter, 1};
    }
    return cp.Value();
}

unsigned char HexValue(char c) {
    if (c >= '0' && c <= '9') return static_cast<unsigned char>(c - '0');
    if (c >= 'a' && c <= 'f') return static_cast<unsigned char>(c - 'a' + 10);
    return static_cast<unsigned char>(c - 'A' + 10);
}

} // anonymous namespace

std::string UrlEncode(std::string_view value) {
    std::ostringstream encoded;
    encoded.fill('0');
    encoded << std::hex << std::uppercase;
    for (unsigned char c : value) {
        if (IsUnreserved(c)) {
            encoded << c;
        } else {
            encoded << '%' << std::setw(2) << static_cast<int>(c);
        }
    }
    return encoded.str();
}

Result<void, DecodeError> ValidateUrlEncoded(std::string_view value) {
    std::size_t offset = 0;
    std::size_t index = 0;
    while (offset < value.size()) {
        const auto current = NextCharacter(value, offset);
        if (IsUnreserved(current.value)) {
            offset += current.length;
            ++index;
            continue;
        }
        if (current.value != U'%') {
            return Result<void, DecodeError>::Err(
                DecodeError::MakeInvalidCharacter(current.value, index));
        }

        // '%' must be followed by exactly two hex digits. A truncated
        // triplet is anchored at the '%' itself.
        const std::size_t percent_index = index;
        offset += current.length;
        ++index;
        for (int i = 0; i < 2; ++i) {
            if (offset >= value.size()) {
                return Result<void, DecodeError>::Err(
                    DecodeError::MakeInvalidCharacter(U'%', percent_index));
            }
            const auto digit = NextCharacter(value, offset);
            if (!IsHexDigit(digit.value)) {
                return Result<void, DecodeError>::Err(
                    DecodeError::MakeInvalidCharacter(digit.value, index));
            }
            offset += digit.length;
            ++index;
        }
    }
    return Result<void, DecodeError>::Ok();
}

Result<std::string, DecodeError> UrlDecode(std::string_view value) {
    auto validation = ValidateUrlEncoded(value);
    if (validation.IsErr()) {
        return Result<std::string, DecodeError>::Err(std::move(validation).Error());
    }

    // Validation guarantees ASCII input where every '%' has two hex digits.
    std::string bytes;
    bytes.reserve(value.size());
    for (std::size_t i = 0; i < value.size(); ++i) {
        if (IsUnreserved(static_cast<unsigned char>(value[i]))) {
            bytes += value[i];
        } else {
            // '%'
            bytes += static_cast<char>((HexValue(value[i + 1]) << 4) |
                                       HexValue(value[i + 2]));
            i += 2;
        }
    }

    auto utf8 = ValidateUtf8(bytes);
    if (utf8.IsErr()) {
        auto error = std::move(utf8).Error();
        return Result<std::string, DecodeError>::Err(
            DecodeError::MakeUtf8Reconstruction(std::move(bytes), error));
    }
    return Result<std::string, DecodeError>::Ok(std::move(bytes));
}

} // namespace urlcodec
