#include <colorscript/color_run_parser.hpp>
#include <colorscript/palette.hpp>
#include <colorscript/markup.hpp>
#include <colorscript/plain_text.hpp>
#include <colorscript/segmenter.hpp>
#include <colorscript/errors.hpp>
#include <colorscript/debug_log.hpp>
#include <fstream>
#include <sstream>

namespace colorscript {

std::string read_document(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw DocumentIOError(path.string(), "cannot open file");
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        throw DocumentIOError(path.string(), "read failed");
    }
    return buffer.str();
}

Transcript ColorRunParser::parse(std::string_view document) const {
    PaletteExtraction extraction = extract_palette(document);
    std::string body = strip_color_table(document, extraction);

    char marker = select_marker_char(body);
    std::string protected_body = protect_color_markers(body, marker);
    std::string text = rtf_to_plain_text(protected_body, marker);

    return segment_turns(text, marker, extraction.palette, labels_);
}

Transcript ColorRunParser::parse_file(const std::filesystem::path& path) const {
    DEBUG_LOG("parser", "parsing %s", path.string().c_str());
    return parse(read_document(path));
}

} // namespace colorscript
