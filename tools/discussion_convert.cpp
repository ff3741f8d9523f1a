#include <colorscript/case_aggregator.hpp>
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
    EC_BATCH_ABORTED = 3,
    EC_OUTPUT_ERROR = 4,
    EC_PARTIAL = 5
};

// Historical session colors: purple expert turns, blue AI turns
const std::vector<LabelMap::Entry> kDefaultLabels = {
    {"RGB(74,21,148)", "Expert"},
    {"RGB(11,93,162)", "AI"},
};

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " RTF_DIR OUTPUT_JSON [options]" << std::endl;
    std::cout << std::endl;
    std::cout << "Converts every RTF file of RTF_DIR into a case record and writes" << std::endl;
    std::cout << "all records as one JSON array. File names are <client><Category>.rtf." << std::endl;
    std::cout << std::endl;
    std::cout << "OPTIONS:" << std::endl;
    std::cout << "  --jsonl-dir DIR     Also write one .jsonl transcript per file into DIR" << std::endl;
    std::cout << "  --ext EXT           Source file extension (default: .rtf)" << std::endl;
    std::cout << "  --label COLOR=NAME  Label for a color; repeatable, replaces the defaults" << std::endl;
    std::cout << "                      (defaults: RGB(74,21,148)=Expert RGB(11,93,162)=AI)" << std::endl;
    std::cout << "  --abort-on-error    Stop at the first file that fails (default: skip it)" << std::endl;
    std::cout << "  --sorted            Process files in name order" << std::endl;
    std::cout << "  --verbose           Trace parsing stages to stderr" << std::endl;
}

void trace_to_stderr(const char* message) {
    std::cerr << message << std::endl;
}

void ignore_trace(const char*) {}

} // namespace

int main(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return EC_SUCCESS;
        }
    }

    std::vector<std::string> positional;
    std::vector<LabelMap::Entry> label_entries;
    AggregatorConfig config;
    bool verbose = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--jsonl-dir" && i + 1 < argc) {
            config.jsonl_dir = argv[++i];
        } else if (arg == "--ext" && i + 1 < argc) {
            config.extension = argv[++i];
        } else if (arg == "--label" && i + 1 < argc) {
            std::string value = argv[++i];
            std::size_t eq = value.rfind('=');
            if (eq == std::string::npos || eq == 0) {
                std::cerr << "Error: --label expects COLOR=NAME, got '" << value << "'" << std::endl;
                return EC_INVALID_ARGS;
            }
            label_entries.emplace_back(value.substr(0, eq), value.substr(eq + 1));
        } else if (arg == "--abort-on-error") {
            config.policy = ErrorPolicy::AbortBatch;
        } else if (arg == "--sorted") {
            config.sort_by_name = true;
        } else if (arg == "--verbose") {
            verbose = true;
        } else if (arg.size() > 1 && arg[0] == '-' && arg[1] == '-') {
            std::cerr << "Error: unknown option " << arg << std::endl;
            return EC_INVALID_ARGS;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.size() != 2) {
        print_usage(argv[0]);
        return EC_INVALID_ARGS;
    }
    std::filesystem::path rtf_dir = positional[0];
    std::filesystem::path output = positional[1];

    if (!std::filesystem::is_directory(rtf_dir)) {
        std::cerr << "Error: " << rtf_dir.string() << " is not a directory" << std::endl;
        return EC_INVALID_ARGS;
    }

    debug::ScopedDebugCallback trace(verbose ? trace_to_stderr : ignore_trace);

    // Checked once, before any document is touched
    LabelMap labels;
    try {
        labels = LabelMap::from_specs(label_entries.empty() ? kDefaultLabels : label_entries);
    } catch (const InvalidLabelMap& e) {
        std::cerr << e.what() << std::endl;
        return EC_BAD_LABELS;
    }

    CaseAggregator aggregator(ColorRunParser(std::move(labels)), config);
    AggregationResult result;
    try {
        result = aggregator.aggregate(rtf_dir);
    } catch (const DocumentError& e) {
        std::cerr << "Aborted: " << e.what() << std::endl;
        return EC_BATCH_ABORTED;
    } catch (const DocumentIOError& e) {
        std::cerr << e.what() << std::endl;
        return EC_OUTPUT_ERROR;
    }

    try {
        write_json(output, discussion_to_json(result.discussions));
    } catch (const DocumentIOError& e) {
        std::cerr << e.what() << std::endl;
        return EC_OUTPUT_ERROR;
    }

    std::cout << "Wrote " << result.discussions.size() << " case records to "
              << output.string() << std::endl;
    if (!result.complete()) {
        std::cerr << "Skipped " << result.skipped.size() << " files:" << std::endl;
        for (const auto& skipped : result.skipped) {
            std::cerr << "  " << skipped.path.string() << " [" << to_string(skipped.kind) << "] "
                      << skipped.message << std::endl;
        }
        return EC_PARTIAL;
    }
    return EC_SUCCESS;
}
