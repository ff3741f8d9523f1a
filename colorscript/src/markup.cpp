#include <colorscript/markup.hpp>
#include <colorscript/errors.hpp>
#include <colorscript/debug_log.hpp>
#include "control_word.hpp"

namespace colorscript {

char select_marker_char(std::string_view body) {
    for (char candidate : kMarkerCandidates) {
        if (body.find(candidate) == std::string_view::npos) {
            DEBUG_LOG("markup", "using marker byte 0x%02X", static_cast<unsigned>(candidate));
            return candidate;
        }
    }
    throw NoSafeMarkerChar("document already contains all " +
                           std::to_string(kMarkerCandidates.size()) + " candidate bytes 0x01-0x08");
}

std::string protect_color_markers(std::string_view body, char marker, std::size_t* protected_count) {
    std::string result(body);
    std::size_t count = 0;
    std::size_t pos = 0;
    while (pos < body.size()) {
        if (body[pos] != '\\') {
            ++pos;
            continue;
        }
        detail::ControlWord word;
        if (!detail::read_control_word(body, pos, word)) {
            pos += 2;  // control symbol, including an escaped backslash
            continue;
        }
        if (word.name == kColorWord && word.has_param && body[pos + 1 + kColorWord.size()] != '-') {
            result[pos] = marker;
            ++count;
        }
        pos += 1 + word.name.size();
    }
    DEBUG_LOG("markup", "protected %zu color markers", count);
    if (protected_count) *protected_count = count;
    return result;
}

} // namespace colorscript
