#ifndef COLORSCRIPT_MARKUP_HPP
#define COLORSCRIPT_MARKUP_HPP

#include <array>
#include <cstddef>
#include <string>
#include <string_view>

namespace colorscript {

/**
 * Bytes that may stand in for the backslash of a `\cfN` control word.
 * None of them is a control escape for the plain text converter.
 */
inline constexpr std::array<char, 8> kMarkerCandidates = {
    '\x01', '\x02', '\x03', '\x04', '\x05', '\x06', '\x07', '\x08'
};

// The color-change control word, without its backslash
inline constexpr std::string_view kColorWord = "cf";

/**
 * First candidate byte absent from the body.
 * Throws NoSafeMarkerChar when every candidate already occurs.
 */
char select_marker_char(std::string_view body);

/**
 * Replace the backslash of every `\cf<digits>` control word with the
 * marker byte, leaving everything else (including `\\cf1`) untouched.
 * `protected_count`, when given, receives the number of replacements.
 */
std::string protect_color_markers(std::string_view body, char marker,
                                  std::size_t* protected_count = nullptr);

} // namespace colorscript

#endif // COLORSCRIPT_MARKUP_HPP
