#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace tradelog {

enum class TextEncoding {
    Auto,
    ShiftJis,
    Utf8
};

const char* to_string(TextEncoding encoding);
std::optional<TextEncoding> parse_encoding(std::string_view text);

bool is_valid_utf8(std::string_view bytes);

// Converts raw document bytes to UTF-8. Undecodable bytes become U+FFFD;
// this never fails on bad input.
std::string decode_text(std::string_view bytes, TextEncoding encoding = TextEncoding::Auto);

} // namespace tradelog
