#ifndef COLORSCRIPT_PLAIN_TEXT_HPP
#define COLORSCRIPT_PLAIN_TEXT_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace colorscript {

/**
 * RTF to plain text converter.
 *
 * Strips every control word and skips destination groups (`\*`, font
 * table, style sheet, info, pictures, ...). Text escapes are decoded to
 * UTF-8: `\'hh` through Windows-1252, `\uN` with the `\ucN` fallback skip.
 * `\par`, `\line` and backslash-newline become '\n', `\tab` becomes '\t'.
 * Raw CR/LF in the source are layout only and are dropped.
 *
 * Bytes that are not part of the markup grammar pass through unchanged,
 * which is what keeps protected color markers intact. A known marker byte
 * also ends a pending `\uN` fallback skip, as the control word it replaces
 * would.
 */
class PlainTextConverter {
private:
    struct GroupState {
        int uc_skip;
        bool ignorable;
    };

    std::string_view text_;
    std::optional<char> marker_;
    std::size_t pos_ = 0;
    std::string out_;
    std::vector<GroupState> stack_;
    int uc_skip_ = 1;
    int pending_skip_ = 0;
    bool ignorable_ = false;
    uint32_t high_surrogate_ = 0;

    void handle_backslash();
    void handle_control_word();
    void handle_hex_escape();
    void push_group();
    void pop_group();
    void emit_text(char c);
    void emit_codepoint(uint32_t codepoint);
    void emit_special(std::string_view utf8);
    bool skipping_fallback();

public:
    explicit PlainTextConverter(std::string_view rtf) : text_(rtf) {}
    PlainTextConverter(std::string_view rtf, char marker) : text_(rtf), marker_(marker) {}

    std::string convert();
};

// Convenience wrapper around PlainTextConverter
std::string rtf_to_plain_text(std::string_view rtf);
std::string rtf_to_plain_text(std::string_view rtf, char marker);

// Windows-1252 byte to Unicode code point (U+FFFD for the five unassigned bytes)
uint32_t cp1252_to_codepoint(uint8_t byte) noexcept;

void append_utf8(std::string& out, uint32_t codepoint);

} // namespace colorscript

#endif // COLORSCRIPT_PLAIN_TEXT_HPP
