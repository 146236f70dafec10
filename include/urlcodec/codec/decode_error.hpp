#pragma once

#include <urlcodec/codec/utf8.hpp>

#include <cstddef>
#include <ostream>
#include <string>
#include <utility>
#include <variant>

namespace urlcodec {

// A character that may not appear in a percent-encoded string, or a
// malformed percent-triplet. `index` counts code points, not bytes.
struct InvalidCharacter {
    char32_t character = 0;
    std::size_t index = 0;

    bool operator==(const InvalidCharacter& other) const {
        return character == other.character && index == other.index;
    }
    bool operator!=(const InvalidCharacter& other) const { return !(*this == other); }
};

// Well-formed triplets that decoded to bytes which are not UTF-8 text.
struct Utf8ReconstructionError {
    std::string bytes;
    Utf8Error error;

    bool operator==(const Utf8ReconstructionError& other) const {
        return bytes == other.bytes && error == other.error;
    }
    bool operator!=(const Utf8ReconstructionError& other) const { return !(*this == other); }
};

// ---------------------------------------------------------------------------
// DecodeError: the error half of UrlDecode()/ValidateUrlEncoded() results.
//
// Holds exactly one of InvalidCharacter or Utf8ReconstructionError.
// Immutable once constructed.
// ---------------------------------------------------------------------------
class DecodeError {
public:
    enum class Kind {
        InvalidCharacter,
        Utf8Reconstruction,
    };

    static DecodeError MakeInvalidCharacter(char32_t character, std::size_t index);
    static DecodeError MakeUtf8Reconstruction(std::string bytes, Utf8Error error);

    [[nodiscard]] Kind GetKind() const noexcept {
        return detail_.index() == 0 ? Kind::InvalidCharacter : Kind::Utf8Reconstruction;
    }
    [[nodiscard]] bool IsInvalidCharacter() const noexcept { return detail_.index() == 0; }
    [[nodiscard]] bool IsUtf8Reconstruction() const noexcept { return detail_.index() == 1; }

    // Precondition: IsInvalidCharacter().
    [[nodiscard]] const InvalidCharacter& AsInvalidCharacter() const;
    // Precondition: IsUtf8Reconstruction().
    [[nodiscard]] const Utf8ReconstructionError& AsUtf8Reconstruction() const;

    // "invalid character 't' (U+0074) at index 6"
    // "decoded bytes are not valid utf-8: incomplete utf-8 byte sequence from index 0"
    [[nodiscard]] std::string ToString() const;

    friend std::ostream& operator<<(std::ostream& os, const DecodeError& e) {
        return os << e.ToString();
    }

    bool operator==(const DecodeError& other) const { return detail_ == other.detail_; }
    bool operator!=(const DecodeError& other) const { return !(*this == other); }

private:
    explicit DecodeError(InvalidCharacter detail) : detail_(std::move(detail)) {}
    explicit DecodeError(Utf8ReconstructionError detail) : detail_(std::move(detail)) {}

    std::variant<InvalidCharacter, Utf8ReconstructionError> detail_;
};

} // namespace urlcodec
