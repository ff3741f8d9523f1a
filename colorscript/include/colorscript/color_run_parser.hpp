#ifndef COLORSCRIPT_COLOR_RUN_PARSER_HPP
#define COLORSCRIPT_COLOR_RUN_PARSER_HPP

#include <colorscript/types.hpp>
#include <colorscript/label_map.hpp>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>

namespace colorscript {

/**
 * Converts a color-coded RTF document into a speaker-attributed transcript.
 *
 *   {\colortbl;\red255\green0\blue0;\red11\green93\blue162;}
 *   \cf1 I'm looking for my glasses.\par
 *   \cf2 They are on your head.
 *
 * with the labels {RGB(255,0,0): Fred, RGB(11,93,162): Susie} yields
 *
 *   {Fred: "I'm looking for my glasses.\n"}, {Susie: "They are on your head."}
 *
 * The parser holds only its validated label map, so one instance can be
 * reused for any number of documents.
 */
class ColorRunParser {
private:
    LabelMap labels_;

public:
    explicit ColorRunParser(LabelMap labels) : labels_(std::move(labels)) {}

    const LabelMap& labels() const noexcept { return labels_; }

    /**
     * Palette extraction, color table stripping, marker protection,
     * markup removal and turn segmentation, in that order. Throws
     * MalformedDocument, NoSafeMarkerChar or UnresolvedColor.
     */
    Transcript parse(std::string_view document) const;

    // Reads the whole file, then parse(). Throws DocumentIOError if unreadable.
    Transcript parse_file(const std::filesystem::path& path) const;
};

// Whole-file read
std::string read_document(const std::filesystem::path& path);

} // namespace colorscript

#endif // COLORSCRIPT_COLOR_RUN_PARSER_HPP
