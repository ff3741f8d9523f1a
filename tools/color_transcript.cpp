#include <colorscript/color_run_parser.hpp>
#include <colorscript/transcript_json.hpp>
#include <colorscript/errors.hpp>
#include <colorscript/debug_log.hpp>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

using namespace colorscript;

namespace {

enum ExitCode {
    EC_SUCCESS = 0,
    EC_INVALID_ARGS = 1,
    EC_BAD_LABELS = 2,
    EC_PARSE_FAILED = 3
};

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [COLOR LABEL]... FILE" << std::endl;
    std::cout << std::endl;
    std::cout << "Prints the colored turns of an RTF file as JSON lines, one" << std::endl;
    std::cout << "{\"<label>\": \"<text>\"} object per turn." << std::endl;
    std::cout << std::endl;
    std::cout << "COLOR is RGB(r,g,b) or #RRGGBB. Without any pairs the text is" << std::endl;
    std::cout << "still split by color, with empty labels." << std::endl;
    std::cout << std::endl;
    std::cout << "Example:" << std::endl;
    std::cout << "  " << program << " 'RGB(20,154,200)' Fred '#B3A8C4' Susie script.rtf" << std::endl;
}

void trace_to_stderr(const char* message) {
    std::cerr << message << std::endl;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return EC_INVALID_ARGS;
    }
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return EC_SUCCESS;
        }
    }

    debug::ScopedDebugCallback trace(trace_to_stderr);

    // The last argument is the file, everything before it color/label pairs
    std::filesystem::path file = argv[argc - 1];
    int pair_args = argc - 2;
    if (pair_args % 2 != 0) {
        std::cerr << "Error: the number of color-label arguments must be even, got "
                  << pair_args << std::endl;
        return EC_INVALID_ARGS;
    }
    if (!std::filesystem::exists(file)) {
        std::cerr << "File '" << file.string() << "' does not exist" << std::endl;
        return EC_INVALID_ARGS;
    }

    std::vector<LabelMap::Entry> entries;
    for (int i = 1; i + 1 < argc - 1; i += 2) {
        entries.emplace_back(argv[i], argv[i + 1]);
    }

    LabelMap labels;
    try {
        labels = LabelMap::from_specs(entries);
    } catch (const InvalidLabelMap& e) {
        std::cerr << e.what() << std::endl;
        return EC_BAD_LABELS;
    }

    try {
        ColorRunParser parser(std::move(labels));
        std::cout << to_jsonl(parser.parse_file(file));
    } catch (const ColorScriptError& e) {
        std::cerr << file.string() << ": " << e.what() << std::endl;
        return EC_PARSE_FAILED;
    }

    return EC_SUCCESS;
}
