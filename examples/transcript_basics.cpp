/**
 * Basic Transcript Example
 *
 * Demonstrates the parsing pipeline step by step:
 * - Reading the color table
 * - Protecting color markers and stripping markup
 * - Segmenting the text into labeled turns
 */

#include <colorscript/color_run_parser.hpp>
#include <colorscript/palette.hpp>
#include <colorscript/markup.hpp>
#include <colorscript/plain_text.hpp>
#include <colorscript/segmenter.hpp>
#include <colorscript/transcript_json.hpp>
#include <iostream>

using namespace colorscript;

int main() {
    std::cout << "=== Basic Transcript Example ===\n\n";

    const std::string document =
        "{\\rtf1\\ansi{\\fonttbl\\f0\\fswiss Helvetica;}\n"
        "{\\colortbl;\\red255\\green0\\blue0;\\red11\\green93\\blue162;}\n"
        "\\f0\\fs24 \\cf1 I'm looking for my glasses.\\par\n"
        "\\cf2 They are on your head.\\par\n"
        "}";

    LabelMap labels = LabelMap::from_specs(std::vector<LabelMap::Entry>{
        {"RGB(255,0,0)", "Fred"},
        {"#0B5DA2", "Susie"},
    });
    std::cout << "Label map with " << labels.size() << " colors\n\n";

    // Color table
    PaletteExtraction extraction = extract_palette(document);
    std::cout << "Color table:\n";
    for (std::size_t slot = 1; slot <= extraction.palette.size(); ++slot) {
        const Rgb& color = extraction.palette.at(slot);
        std::cout << "  cf" << slot << ": " << color.to_string() << " " << color.to_hex() << "\n";
    }
    std::cout << "\n";

    // Markers and plain text
    std::string body = strip_color_table(document, extraction);
    char marker = select_marker_char(body);
    std::size_t marker_count = 0;
    std::string text = rtf_to_plain_text(protect_color_markers(body, marker, &marker_count), marker);
    std::cout << "Protected " << marker_count << " color markers with byte "
              << static_cast<int>(marker) << "\n";

    ColorRunScanner scanner(text, marker);
    while (auto run = scanner.next()) {
        std::cout << "  run at offset " << run->offset << ", length " << run->length
                  << ", slot " << run->slot << "\n";
    }
    std::cout << "\n";

    // Turns, via the one-call parser
    ColorRunParser parser(labels);
    Transcript turns = parser.parse(document);
    std::cout << "Transcript (" << turns.size() << " turns):\n";
    std::cout << to_jsonl(turns);

    std::cout << "\n=== Example completed successfully ===\n";
    return 0;
}
