#include <urlcodec/codec/decode_error.hpp>

#include <cassert>
#include <sstream>

namespace urlcodec {

DecodeError DecodeError::MakeInvalidCharacter(char32_t character, std::size_t index) {
    return DecodeError(InvalidCharacter{character, index});
}

DecodeError DecodeError::MakeUtf8Reconstruction(std::string bytes, Utf8Error error) {
    return DecodeError(Utf8ReconstructionError{std::move(bytes), error});
}

const InvalidCharacter& DecodeError::AsInvalidCharacter() const {
    assert(IsInvalidCharacter() && "AsInvalidCharacter() called on a UTF-8 error");
    return std::get<InvalidCharacter>(detail_);
}

const Utf8ReconstructionError& DecodeError::AsUtf8Reconstruction() const {
    assert(IsUtf8Reconstruction() && "AsUtf8Reconstruction() called on a character error");
    return std::get<Utf8ReconstructionError>(detail_);
}

std::string DecodeError::ToString() const {
    std::ostringstream oss;
    if (IsInvalidCharacter()) {
        const auto& detail = AsInvalidCharacter();
        oss << "invalid character '" << EncodeCodePoint(detail.character) << "' ("
            << FormatCodePoint(detail.character) << ") at index " << detail.index;
    } else {
        oss << "decoded bytes are not valid utf-8: "
            << AsUtf8Reconstruction().error.ToString();
    }
    return oss.str();
}

} // namespace urlcodec
