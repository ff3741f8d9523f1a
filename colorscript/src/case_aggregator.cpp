#include <colorscript/case_aggregator.hpp>
#include <colorscript/transcript_json.hpp>
#include <colorscript/debug_log.hpp>
#include <algorithm>
#include <system_error>

namespace colorscript {

namespace {

bool is_lower(char c) { return c >= 'a' && c <= 'z'; }
bool is_upper(char c) { return c >= 'A' && c <= 'Z'; }

char to_lower(char c) { return is_upper(c) ? static_cast<char>(c - 'A' + 'a') : c; }
char to_upper(char c) { return is_lower(c) ? static_cast<char>(c - 'a' + 'A') : c; }

std::string capitalize(const std::string& word) {
    std::string result;
    result.reserve(word.size());
    for (std::size_t i = 0; i < word.size(); ++i) {
        result += i == 0 ? to_upper(word[i]) : to_lower(word[i]);
    }
    return result;
}

std::string normalized_extension(const std::string& extension) {
    if (extension.empty() || extension[0] == '.') return extension;
    return "." + extension;
}

} // namespace

std::vector<std::string> split_name_runs(std::string_view stem) {
    std::vector<std::string> runs;
    std::size_t pos = 0;
    while (pos < stem.size()) {
        std::size_t begin = pos;
        if (is_upper(stem[pos])) {
            ++pos;
        } else if (!is_lower(stem[pos])) {
            ++pos;
            continue;
        }
        while (pos < stem.size() && is_lower(stem[pos])) ++pos;
        runs.emplace_back(stem.substr(begin, pos - begin));
    }
    return runs;
}

CaseKey parse_case_filename(const std::filesystem::path& path) {
    std::string stem = path.stem().string();
    std::vector<std::string> runs = split_name_runs(stem);
    if (runs.size() < 2) {
        throw UnparsableFilename(path.filename().string());
    }

    CaseKey key;
    key.client_name = capitalize(runs.front());
    for (auto it = runs.begin() + 1; it != runs.end(); ++it) {
        for (char c : *it) key.category += to_lower(c);
    }
    return key;
}

std::vector<std::filesystem::path> CaseAggregator::list_documents(const std::filesystem::path& dir) const {
    std::error_code ec;
    std::filesystem::directory_iterator it(dir, ec);
    if (ec) {
        throw DocumentIOError(dir.string(), ec.message());
    }

    const std::string extension = normalized_extension(config_.extension);
    std::vector<std::filesystem::path> documents;
    for (; it != std::filesystem::end(it); it.increment(ec)) {
        if (ec) break;
        std::error_code type_ec;
        if (!it->is_regular_file(type_ec) || type_ec) continue;
        if (it->path().extension().string() != extension) continue;
        documents.push_back(it->path());
    }
    if (ec) {
        throw DocumentIOError(dir.string(), ec.message());
    }

    if (config_.sort_by_name) {
        std::sort(documents.begin(), documents.end(),
                  [](const auto& a, const auto& b) { return a.filename() < b.filename(); });
    }
    return documents;
}

CaseRecord CaseAggregator::build_record(const std::filesystem::path& path) const {
    CaseKey key = parse_case_filename(path);

    CaseRecord record;
    record.client_name = std::move(key.client_name);
    record.category = std::move(key.category);
    record.turns = parser_.parse_file(path);
    record.source = path;
    return record;
}

void CaseAggregator::write_artifact(const CaseRecord& record) const {
    std::filesystem::path jsonl_path = config_.jsonl_dir / record.source.stem();
    jsonl_path += ".jsonl";
    write_jsonl(jsonl_path, record.turns);
}

AggregationResult CaseAggregator::aggregate(const std::filesystem::path& dir) const {
    if (!config_.jsonl_dir.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(config_.jsonl_dir, ec);
        if (ec) {
            throw DocumentIOError(config_.jsonl_dir.string(), ec.message());
        }
    }

    AggregationResult result;
    for (const auto& path : list_documents(dir)) {
        CaseRecord record;
        try {
            record = build_record(path);
        } catch (const ColorScriptError& e) {
            if (config_.policy == ErrorPolicy::AbortBatch) {
                throw DocumentError(path.string(), e);
            }
            DEBUG_LOG("aggregate", "skipping %s: %s", path.string().c_str(), e.what());
            result.skipped.push_back({path, e.kind(), e.what()});
            continue;
        }
        // A failed artifact write ends the batch under either policy
        if (!config_.jsonl_dir.empty()) {
            write_artifact(record);
        }
        result.discussions.push_back(std::move(record));
    }

    DEBUG_LOG("aggregate", "%zu case records, %zu documents skipped",
              result.discussions.size(), result.skipped.size());
    return result;
}

} // namespace colorscript
