#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace VTInput::Input {

constexpr char32_t kReplacementChar = 0xFFFD;

enum class Utf8Status {
    Ok,          // A complete, valid code point
    Invalid,     // Not a valid encoding; length is 1
    Incomplete,  // Valid so far but truncated by the end of the data
};

struct Utf8Result {
    Utf8Status status = Utf8Status::Invalid;
    char32_t codepoint = kReplacementChar;
    size_t length = 1;
};

// Decode the first code point in data. Rejects overlong forms,
// surrogates and values above U+10FFFF. data must not be empty.
Utf8Result DecodeUtf8(std::string_view data);

bool IsValidCodepoint(char32_t cp);

std::string EncodeUtf8(char32_t cp);
std::string EncodeUtf8(const std::u32string& runes);

} // namespace VTInput::Input
