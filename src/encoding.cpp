#include "tradelog/encoding.hpp"
#include <iconv.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <memory>
#include <stdexcept>
#include <vector>

namespace tradelog {

namespace {

constexpr std::string_view kUtf8Bom = "\xEF\xBB\xBF";
constexpr const char* kReplacementChar = "\xEF\xBF\xBD";  // U+FFFD

// CP932 is the Windows superset of Shift_JIS that broker exports are written in
constexpr const char* kShiftJisCharset = "CP932";

struct IconvCloser {
    void operator()(void* cd) const {
        iconv_close(static_cast<iconv_t>(cd));
    }
};

using IconvHandle = std::unique_ptr<void, IconvCloser>;

IconvHandle open_converter(const char* from) {
    iconv_t cd = iconv_open("UTF-8", from);
    if (cd == reinterpret_cast<iconv_t>(-1)) {
        throw std::runtime_error(std::string("iconv cannot convert from ") + from +
                                 ": " + std::strerror(errno));
    }
    return IconvHandle(cd);
}

// Length of the well-formed UTF-8 sequence starting at `pos`, or 0 when the
// bytes there are invalid, truncated, overlong, a surrogate or out of range.
size_t utf8_sequence_length(std::string_view bytes, size_t pos) {
    auto c = static_cast<unsigned char>(bytes[pos]);
    size_t extra = 0;
    uint32_t code_point = 0;
    if (c < 0x80) {
        return 1;
    } else if ((c & 0xE0) == 0xC0) {
        extra = 1;
        code_point = c & 0x1F;
    } else if ((c & 0xF0) == 0xE0) {
        extra = 2;
        code_point = c & 0x0F;
    } else if ((c & 0xF8) == 0xF0) {
        extra = 3;
        code_point = c & 0x07;
    } else {
        return 0;
    }
    if (pos + extra >= bytes.size()) {
        return 0;
    }
    for (size_t k = 1; k <= extra; ++k) {
        auto cc = static_cast<unsigned char>(bytes[pos + k]);
        if ((cc & 0xC0) != 0x80) {
            return 0;
        }
        code_point = (code_point << 6) | (cc & 0x3F);
    }
    if ((extra == 1 && code_point < 0x80) || (extra == 2 && code_point < 0x800) ||
        (extra == 3 && code_point < 0x10000) || code_point > 0x10FFFF ||
        (code_point >= 0xD800 && code_point <= 0xDFFF)) {
        return 0;
    }
    return extra + 1;
}

// Copies UTF-8 text, replacing each byte that does not start a well-formed
// sequence with U+FFFD, the same resync rule as the Shift_JIS path.
std::string repair_utf8(std::string_view bytes) {
    std::string out;
    out.reserve(bytes.size());
    size_t i = 0;
    while (i < bytes.size()) {
        size_t length = utf8_sequence_length(bytes, i);
        if (length == 0) {
            out += kReplacementChar;
            ++i;
            continue;
        }
        out.append(bytes.data() + i, length);
        i += length;
    }
    return out;
}

std::string strip_bom(std::string_view bytes) {
    if (bytes.substr(0, kUtf8Bom.size()) == kUtf8Bom) {
        bytes.remove_prefix(kUtf8Bom.size());
    }
    return std::string(bytes);
}

std::string decode_shift_jis(std::string_view bytes) {
    IconvHandle handle = open_converter(kShiftJisCharset);
    iconv_t cd = static_cast<iconv_t>(handle.get());

    std::string out;
    out.reserve(bytes.size() * 3 / 2);

    std::vector<char> input(bytes.begin(), bytes.end());
    char* in_ptr = input.data();
    size_t in_left = input.size();
    std::vector<char> buffer(4096);

    while (in_left > 0) {
        char* out_ptr = buffer.data();
        size_t out_left = buffer.size();
        size_t rc = iconv(cd, &in_ptr, &in_left, &out_ptr, &out_left);
        out.append(buffer.data(), buffer.size() - out_left);

        if (rc != static_cast<size_t>(-1)) {
            continue;
        }
        if (errno == E2BIG) {
            continue;
        }
        if (errno == EILSEQ || errno == EINVAL) {
            // Invalid or truncated sequence: emit one replacement and resync
            out += kReplacementChar;
            ++in_ptr;
            --in_left;
            iconv(cd, nullptr, nullptr, nullptr, nullptr);
            continue;
        }
        throw std::runtime_error(std::string("iconv failed: ") + std::strerror(errno));
    }
    return out;
}

} // namespace

const char* to_string(TextEncoding encoding) {
    switch (encoding) {
        case TextEncoding::Auto:
            return "auto";
        case TextEncoding::ShiftJis:
            return "shift_jis";
        case TextEncoding::Utf8:
            return "utf-8";
    }
    return "auto";
}

std::optional<TextEncoding> parse_encoding(std::string_view text) {
    std::string value(text);
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (value.empty() || value == "auto") return TextEncoding::Auto;
    if (value == "shift_jis" || value == "shift-jis" || value == "sjis" || value == "cp932") {
        return TextEncoding::ShiftJis;
    }
    if (value == "utf-8" || value == "utf8") return TextEncoding::Utf8;
    return std::nullopt;
}

bool is_valid_utf8(std::string_view bytes) {
    size_t i = 0;
    while (i < bytes.size()) {
        size_t length = utf8_sequence_length(bytes, i);
        if (length == 0) {
            return false;
        }
        i += length;
    }
    return true;
}

std::string decode_text(std::string_view bytes, TextEncoding encoding) {
    switch (encoding) {
        case TextEncoding::Utf8:
            return repair_utf8(strip_bom(bytes));
        case TextEncoding::ShiftJis:
            return decode_shift_jis(bytes);
        case TextEncoding::Auto:
            break;
    }
    if (bytes.substr(0, kUtf8Bom.size()) == kUtf8Bom) {
        // A BOM settles the encoding, but stray bytes still get replaced
        return repair_utf8(strip_bom(bytes));
    }
    if (is_valid_utf8(bytes)) {
        return std::string(bytes);
    }
    return decode_shift_jis(bytes);
}

} // namespace tradelog
