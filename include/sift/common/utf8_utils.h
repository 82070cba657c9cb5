#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace sift::common {

// Length of the UTF-8 sequence starting at data[i], or 0 when the sequence is malformed.
// Rejects overlong encodings, surrogates and code points above U+10FFFF.
inline std::size_t utf8SequenceLength(std::string_view input, std::size_t i) noexcept {
    const auto* data = reinterpret_cast<const unsigned char*>(input.data());
    const std::size_t n = input.size();
    const unsigned char c = data[i];
    auto cont = [&](std::size_t k) { return i + k < n && (data[i + k] & 0xC0) == 0x80; };

    if (c < 0x80)
        return 1;
    if (c >= 0xC2 && c <= 0xDF)
        return cont(1) ? 2 : 0;
    if (c >= 0xE0 && c <= 0xEF) {
        if (!cont(1) || !cont(2))
            return 0;
        unsigned char c1 = data[i + 1];
        if (c == 0xE0 && c1 < 0xA0)
            return 0; // overlong
        if (c == 0xED && c1 > 0x9F)
            return 0; // surrogate
        return 3;
    }
    if (c >= 0xF0 && c <= 0xF4) {
        if (!cont(1) || !cont(2) || !cont(3))
            return 0;
        unsigned char c1 = data[i + 1];
        if (c == 0xF0 && c1 < 0x90)
            return 0;
        if (c == 0xF4 && c1 > 0x8F)
            return 0;
        return 4;
    }
    return 0;
}

// True when the whole input is well-formed UTF-8.
inline bool isValidUtf8(std::string_view input) noexcept {
    std::size_t i = 0;
    while (i < input.size()) {
        std::size_t len = utf8SequenceLength(input, i);
        if (len == 0)
            return false;
        i += len;
    }
    return true;
}

static_assert(sizeof(wchar_t) == 4, "wide text must hold one code point per wchar_t");

inline constexpr wchar_t kReplacementChar = 0xFFFD;

// Decode UTF-8 into one wchar_t per code point. Malformed bytes become U+FFFD, so file
// names that are not valid UTF-8 can still be matched.
inline std::wstring decodeUtf8(std::string_view input) {
    const auto* data = reinterpret_cast<const unsigned char*>(input.data());
    std::wstring out;
    out.reserve(input.size());
    std::size_t i = 0;
    while (i < input.size()) {
        const std::size_t len = utf8SequenceLength(input, i);
        if (len == 0) {
            out.push_back(kReplacementChar);
            ++i;
            continue;
        }
        char32_t cp = 0;
        switch (len) {
            case 1: cp = data[i]; break;
            case 2: cp = ((data[i] & 0x1Fu) << 6) | (data[i + 1] & 0x3Fu); break;
            case 3:
                cp = ((data[i] & 0x0Fu) << 12) | ((data[i + 1] & 0x3Fu) << 6) |
                     (data[i + 2] & 0x3Fu);
                break;
            default:
                cp = ((data[i] & 0x07u) << 18) | ((data[i + 1] & 0x3Fu) << 12) |
                     ((data[i + 2] & 0x3Fu) << 6) | (data[i + 3] & 0x3Fu);
                break;
        }
        out.push_back(static_cast<wchar_t>(cp));
        i += len;
    }
    return out;
}

// Encode code points back to UTF-8. Surrogates and values above U+10FFFF become U+FFFD.
inline std::string encodeUtf8(std::wstring_view input) {
    std::string out;
    out.reserve(input.size());
    for (wchar_t wc : input) {
        auto cp = static_cast<char32_t>(wc);
        if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
            cp = static_cast<char32_t>(kReplacementChar);
        if (cp < 0x80) {
            out.push_back(static_cast<char>(cp));
        } else if (cp < 0x800) {
            out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else if (cp < 0x10000) {
            out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
    }
    return out;
}

} // namespace sift::common
