#include <urlcodec/codec/utf8.hpp>

#include <cstdint>
#include <iomanip>
#include <sstream>

namespace urlcodec {

namespace {

struct LeadInfo {
    std::size_t length;          // total sequence length, 0 = invalid lead
    unsigned char second_lo;     // allowed range for the second byte
    unsigned char second_hi;
    char32_t initial;            // payload bits of the lead byte
};

// Well-formed UTF-8 byte sequences, Unicode 15 table 3-7.
LeadInfo ClassifyLead(unsigned char b) {
    if (b <= 0x7F) return {1, 0x80, 0xBF, b};
    if (b >= 0xC2 && b <= 0xDF) return {2, 0x80, 0xBF, static_cast<char32_t>(b & 0x1F)};
    if (b == 0xE0) return {3, 0xA0, 0xBF, static_cast<char32_t>(b & 0x0F)};
    if (b >= 0xE1 && b <= 0xEC) return {3, 0x80, 0xBF, static_cast<char32_t>(b & 0x0F)};
    if (b == 0xED) return {3, 0x80, 0x9F, static_cast<char32_t>(b & 0x0F)};
    if (b >= 0xEE && b <= 0xEF) return {3, 0x80, 0xBF, static_cast<char32_t>(b & 0x0F)};
    if (b == 0xF0) return {4, 0x90, 0xBF, static_cast<char32_t>(b & 0x07)};
    if (b >= 0xF1 && b <= 0xF3) return {4, 0x80, 0xBF, static_cast<char32_t>(b & 0x07)};
    if (b == 0xF4) return {4, 0x80, 0x8F, static_cast<char32_t>(b & 0x07)};
    return {0, 0, 0, 0};
}

} // anonymous namespace

std::string Utf8Error::ToString() const {
    std::ostringstream oss;
    if (error_len.has_value()) {
        oss << "invalid utf-8 sequence of " << *error_len
            << " bytes from index " << valid_up_to;
    } else {
        oss << "incomplete utf-8 byte sequence from index " << valid_up_to;
    }
    return oss.str();
}

Result<CodePoint, Utf8Error> DecodeCodePoint(std::string_view bytes,
                                             std::size_t offset) {
    const auto lead = static_cast<unsigned char>(bytes[offset]);
    const auto info = ClassifyLead(lead);
    if (info.length == 0) {
        return Result<CodePoint, Utf8Error>::Err(Utf8Error{offset, 1});
    }

    char32_t value = info.initial;
    for (std::size_t i = 1; i < info.length; ++i) {
        if (offset + i >= bytes.size()) {
            return Result<CodePoint, Utf8Error>::Err(Utf8Error{offset, std::nullopt});
        }
        const auto b = static_cast<unsigned char>(bytes[offset + i]);
        const unsigned char lo = (i == 1) ? info.second_lo : 0x80;
        const unsigned char hi = (i == 1) ? info.second_hi : 0xBF;
        if (b < lo || b > hi) {
            return Result<CodePoint, Utf8Error>::Err(Utf8Error{offset, i});
        }
        value = (value << 6) | static_cast<char32_t>(b & 0x3F);
    }
    return Result<CodePoint, Utf8Error>::Ok(CodePoint{value, info.length});
}

Result<void, Utf8Error> ValidateUtf8(std::string_view bytes) {
    std::size_t offset = 0;
    while (offset < bytes.size()) {
        auto cp = DecodeCodePoint(bytes, offset);
        if (cp.IsErr()) {
            return Result<void, Utf8Error>::Err(std::move(cp).Error());
        }
        offset += cp.Value().length;
    }
    return Result<void, Utf8Error>::Ok();
}

std::string EncodeCodePoint(char32_t cp) {
    if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
        cp = kReplacementCharacter;
    }
    std::string out;
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
    return out;
}

std::string FormatCodePoint(char32_t cp) {
    std::ostringstream oss;
    oss << "U+" << std::hex << std::uppercase << std::setfill('0')
        << std::setw(4) << static_cast<std::uint32_t>(cp);
    return oss.str();
}

} // namespace urlcodec
