#include <colorscript/transcript_json.hpp>
#include <colorscript/errors.hpp>
#include <fstream>
#include <stdexcept>

namespace colorscript {

nlohmann::json turn_to_json(const Turn& turn) {
    nlohmann::json object = nlohmann::json::object();
    object[turn.label] = turn.text;
    return object;
}

Turn turn_from_json(const nlohmann::json& value) {
    if (!value.is_object() || value.size() != 1) {
        throw std::invalid_argument("turn must be an object with exactly one label");
    }
    auto it = value.begin();
    if (!it.value().is_string()) {
        throw std::invalid_argument("turn text for label '" + it.key() + "' is not a string");
    }
    return Turn(it.key(), it.value().get<std::string>());
}

nlohmann::json case_to_json(const CaseRecord& record) {
    nlohmann::json conversation = nlohmann::json::array();
    for (const auto& turn : record.turns) {
        conversation.push_back(turn_to_json(turn));
    }
    nlohmann::json object;
    object[kClientNameKey] = record.client_name;
    object[kCategoryKey] = record.category;
    object[kConversationKey] = std::move(conversation);
    return object;
}

nlohmann::json discussion_to_json(const DiscussionSet& discussions) {
    nlohmann::json array = nlohmann::json::array();
    for (const auto& record : discussions) {
        array.push_back(case_to_json(record));
    }
    return array;
}

std::string dump_json(const nlohmann::json& value, int indent) {
    return value.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string to_jsonl(const Transcript& turns) {
    std::string out;
    for (const auto& turn : turns) {
        out += dump_json(turn_to_json(turn));
        out += '\n';
    }
    return out;
}

void write_jsonl(const std::filesystem::path& path, const Transcript& turns) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw DocumentIOError(path.string(), "cannot open for writing");
    }
    file << to_jsonl(turns);
    if (!file) {
        throw DocumentIOError(path.string(), "write failed");
    }
}

Transcript read_jsonl(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw DocumentIOError(path.string(), "cannot open file");
    }

    Transcript turns;
    std::string line;
    std::size_t line_number = 0;
    while (std::getline(file, line)) {
        ++line_number;
        if (line.empty()) continue;
        try {
            turns.push_back(turn_from_json(nlohmann::json::parse(line)));
        } catch (const nlohmann::json::parse_error& e) {
            throw DocumentIOError(path.string(), "line " + std::to_string(line_number) + ": " + e.what());
        } catch (const std::invalid_argument& e) {
            throw DocumentIOError(path.string(), "line " + std::to_string(line_number) + ": " + e.what());
        }
    }
    return turns;
}

void write_json(const std::filesystem::path& path, const nlohmann::json& value, int indent) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw DocumentIOError(path.string(), "cannot open for writing");
    }
    file << dump_json(value, indent) << '\n';
    if (!file) {
        throw DocumentIOError(path.string(), "write failed");
    }
}

} // namespace colorscript
