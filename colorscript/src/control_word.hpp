#ifndef COLORSCRIPT_CONTROL_WORD_HPP
#define COLORSCRIPT_CONTROL_WORD_HPP

// Internal lexing helpers shared by the palette reader and the plain text converter.

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace colorscript {
namespace detail {

inline bool is_ascii_alpha(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

inline bool is_ascii_digit(char c) {
    return c >= '0' && c <= '9';
}

inline int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

/**
 * A control word `\name[-]digits[ ]` starting at a backslash.
 * `end` is one past the optional delimiting space.
 */
struct ControlWord {
    std::string_view name;
    bool has_param = false;
    int64_t param = 0;
    std::size_t end = 0;
};

constexpr std::size_t kMaxControlWordLength = 32;
constexpr std::size_t kMaxParamDigits = 10;

/**
 * Read the control word whose backslash is at `pos`. Returns false when
 * the backslash does not start a control word (a control symbol such as
 * `\{` or `\'` follows instead).
 */
inline bool read_control_word(std::string_view text, std::size_t pos, ControlWord& out) {
    std::size_t cursor = pos + 1;
    std::size_t name_begin = cursor;
    while (cursor < text.size() && is_ascii_alpha(text[cursor]) &&
           cursor - name_begin < kMaxControlWordLength) {
        ++cursor;
    }
    if (cursor == name_begin) {
        return false;
    }
    out.name = text.substr(name_begin, cursor - name_begin);
    out.has_param = false;
    out.param = 0;

    bool negative = false;
    if (cursor + 1 < text.size() && text[cursor] == '-' && is_ascii_digit(text[cursor + 1])) {
        negative = true;
        ++cursor;
    }
    std::size_t digits_begin = cursor;
    while (cursor < text.size() && is_ascii_digit(text[cursor]) &&
           cursor - digits_begin < kMaxParamDigits) {
        out.param = out.param * 10 + (text[cursor] - '0');
        ++cursor;
    }
    if (cursor > digits_begin) {
        out.has_param = true;
        if (negative) out.param = -out.param;
    }

    if (cursor < text.size() && text[cursor] == ' ') {
        ++cursor;
    }
    out.end = cursor;
    return true;
}

} // namespace detail
} // namespace colorscript

#endif // COLORSCRIPT_CONTROL_WORD_HPP
