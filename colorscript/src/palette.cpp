#include <colorscript/palette.hpp>
#include <colorscript/errors.hpp>
#include <colorscript/debug_log.hpp>
#include "control_word.hpp"
#include <stdexcept>

namespace colorscript {

namespace {

constexpr std::string_view kColorTableWord = "colortbl";

/**
 * Offset of the backslash of the first `\colortbl` control word, skipping
 * escaped backslashes so that literal text cannot match.
 */
std::size_t find_color_table_word(std::string_view document) {
    std::size_t pos = 0;
    while (pos < document.size()) {
        if (document[pos] != '\\') {
            ++pos;
            continue;
        }
        if (pos + 1 < document.size() && document[pos + 1] == '\\') {
            pos += 2;
            continue;
        }
        detail::ControlWord word;
        if (detail::read_control_word(document, pos, word) && word.name == kColorTableWord) {
            return pos;
        }
        pos += 2;
    }
    return std::string_view::npos;
}

// Position one past the `}` closing the group that starts at `open`
std::size_t find_group_end(std::string_view document, std::size_t open) {
    int depth = 0;
    for (std::size_t pos = open; pos < document.size(); ++pos) {
        char c = document[pos];
        if (c == '\\') {
            ++pos;  // escaped character, including \{ and \}
        } else if (c == '{') {
            ++depth;
        } else if (c == '}') {
            if (--depth == 0) return pos + 1;
        }
    }
    return std::string_view::npos;
}

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

// Parse `\redN\greenN\blueN` (other control words ignored) from one entry
Rgb parse_entry(std::string_view entry, std::size_t entry_offset, std::size_t slot) {
    int64_t components[3] = {-1, -1, -1};
    std::size_t pos = 0;
    while (pos < entry.size()) {
        if (entry[pos] != '\\') {
            ++pos;
            continue;
        }
        detail::ControlWord word;
        if (!detail::read_control_word(entry, pos, word)) {
            pos += 2;
            continue;
        }
        int index = word.name == "red" ? 0 : word.name == "green" ? 1 : word.name == "blue" ? 2 : -1;
        if (index >= 0) {
            if (!word.has_param || word.param < 0 || word.param > 255) {
                throw MalformedDocument("color table entry " + std::to_string(slot) +
                                        " has an invalid \\" + std::string(word.name) + " component",
                                        entry_offset + pos);
            }
            components[index] = word.param;
        }
        pos = word.end;
    }
    for (int64_t component : components) {
        if (component < 0) {
            throw MalformedDocument("color table entry " + std::to_string(slot) +
                                    " does not declare red, green and blue",
                                    entry_offset);
        }
    }
    return Rgb(static_cast<uint8_t>(components[0]),
               static_cast<uint8_t>(components[1]),
               static_cast<uint8_t>(components[2]));
}

} // namespace

const Rgb& Palette::at(std::size_t slot) const {
    if (!has_slot(slot)) {
        throw std::out_of_range("Palette slot " + std::to_string(slot) + " is not declared");
    }
    return colors_[slot - 1];
}

PaletteExtraction extract_palette(std::string_view document) {
    std::size_t word_pos = find_color_table_word(document);
    if (word_pos == std::string_view::npos) {
        throw MalformedDocument("document does not contain a color table");
    }

    // The group normally opens right before the control word: `{\colortbl;`
    std::size_t open = word_pos;
    while (open > 0 && is_space(document[open - 1])) --open;
    if (open == 0 || document[open - 1] != '{') {
        throw MalformedDocument("color table is not enclosed in a group", word_pos);
    }
    --open;

    std::size_t close = find_group_end(document, open);
    if (close == std::string_view::npos) {
        throw MalformedDocument("color table group is not terminated", open);
    }

    detail::ControlWord word;
    detail::read_control_word(document, word_pos, word);
    std::size_t content_begin = word.end;
    std::string_view content = document.substr(content_begin, (close - 1) - content_begin);

    // Entry 0 (before the first ';') is the auto color; entries after it
    // are slots 1..N. Text after the last ';' is not an entry.
    std::vector<Rgb> colors;
    std::size_t entry_begin = content.find(';');
    if (entry_begin != std::string_view::npos) {
        ++entry_begin;
        std::size_t entry_end;
        while ((entry_end = content.find(';', entry_begin)) != std::string_view::npos) {
            std::string_view entry = content.substr(entry_begin, entry_end - entry_begin);
            colors.push_back(parse_entry(entry, content_begin + entry_begin, colors.size() + 1));
            entry_begin = entry_end + 1;
        }
    }

    DEBUG_LOG("palette", "color table at [%zu, %zu) declares %zu colors", open, close, colors.size());

    PaletteExtraction extraction;
    extraction.palette = Palette(std::move(colors));
    extraction.block_begin = open;
    extraction.block_end = close;
    return extraction;
}

std::string strip_color_table(std::string_view document, const PaletteExtraction& extraction) {
    std::string stripped;
    stripped.reserve(document.size() - (extraction.block_end - extraction.block_begin));
    stripped.append(document.substr(0, extraction.block_begin));
    stripped.append(document.substr(extraction.block_end));
    return stripped;
}

} // namespace colorscript
