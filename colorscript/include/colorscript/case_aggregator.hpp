#ifndef COLORSCRIPT_CASE_AGGREGATOR_HPP
#define COLORSCRIPT_CASE_AGGREGATOR_HPP

#include <colorscript/types.hpp>
#include <colorscript/errors.hpp>
#include <colorscript/color_run_parser.hpp>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace colorscript {

struct CaseKey {
    std::string client_name;
    std::string category;
};

/**
 * Split a camel-cased file stem into runs of `[a-z]+` or `[A-Z][a-z]*`
 * (anything else separates runs). "marcelCharacterDefense.rtf" gives
 * client "Marcel" and category "characterdefense".
 * Throws UnparsableFilename for fewer than two runs.
 */
CaseKey parse_case_filename(const std::filesystem::path& path);

// Runs of the stem, unmodified
std::vector<std::string> split_name_runs(std::string_view stem);

struct CaseRecord {
    std::string client_name;
    std::string category;
    Transcript turns;
    std::filesystem::path source;
};

using DiscussionSet = std::vector<CaseRecord>;

enum class ErrorPolicy {
    SkipAndContinue,  // record the failure and move on
    AbortBatch        // rethrow the first failure as DocumentError
};

struct AggregatorConfig {
    std::string extension = ".rtf";
    ErrorPolicy policy = ErrorPolicy::SkipAndContinue;
    bool sort_by_name = false;              // enumeration order is platform dependent
    std::filesystem::path jsonl_dir;        // empty: no per-document .jsonl files
};

struct SkippedDocument {
    std::filesystem::path path;
    ErrorKind kind;
    std::string message;
};

struct AggregationResult {
    DiscussionSet discussions;
    std::vector<SkippedDocument> skipped;

    bool complete() const noexcept { return skipped.empty(); }
};

/**
 * Parses every document of a directory with one fixed label map and
 * groups the transcripts into case records keyed by file name.
 */
class CaseAggregator {
private:
    ColorRunParser parser_;
    AggregatorConfig config_;

    // Files with the configured extension, in enumeration or name order
    std::vector<std::filesystem::path> list_documents(const std::filesystem::path& dir) const;

    // `<jsonl_dir>/<stem>.jsonl`; throws DocumentIOError
    void write_artifact(const CaseRecord& record) const;

public:
    CaseAggregator(ColorRunParser parser, AggregatorConfig config = {})
        : parser_(std::move(parser)), config_(std::move(config)) {}

    const AggregatorConfig& config() const noexcept { return config_; }

    // Name key and transcript of one document
    CaseRecord build_record(const std::filesystem::path& path) const;

    /**
     * Throws DocumentIOError if the directory cannot be listed; per-document
     * failures follow the configured ErrorPolicy.
     */
    AggregationResult aggregate(const std::filesystem::path& dir) const;
};

} // namespace colorscript

#endif // COLORSCRIPT_CASE_AGGREGATOR_HPP
