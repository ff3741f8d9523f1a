#ifndef COLORSCRIPT_TRANSCRIPT_JSON_HPP
#define COLORSCRIPT_TRANSCRIPT_JSON_HPP

#include <colorscript/types.hpp>
#include <colorscript/case_aggregator.hpp>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <string>

namespace colorscript {

// JSON field names of a case record
inline constexpr const char* kClientNameKey = "clientName";
inline constexpr const char* kCategoryKey = "category";
inline constexpr const char* kConversationKey = "conversation";

// {"<label>": "<text>"}
nlohmann::json turn_to_json(const Turn& turn);

// Inverse of turn_to_json; throws std::invalid_argument unless given a one-member object of a string
Turn turn_from_json(const nlohmann::json& value);

// {"clientName": ..., "category": ..., "conversation": [{label: text}, ...]}
nlohmann::json case_to_json(const CaseRecord& record);

nlohmann::json discussion_to_json(const DiscussionSet& discussions);

// One object per turn, newline-terminated
std::string to_jsonl(const Transcript& turns);

// Invalid UTF-8 in document text is replaced rather than rejected
std::string dump_json(const nlohmann::json& value, int indent = -1);

void write_jsonl(const std::filesystem::path& path, const Transcript& turns);
Transcript read_jsonl(const std::filesystem::path& path);

void write_json(const std::filesystem::path& path, const nlohmann::json& value, int indent = 2);

} // namespace colorscript

#endif // COLORSCRIPT_TRANSCRIPT_JSON_HPP
