#include <colorscript/label_map.hpp>
#include <colorscript/errors.hpp>
#include <colorscript/debug_log.hpp>
#include "control_word.hpp"

namespace colorscript {

namespace {

bool is_blank(char c) {
    return c == ' ' || c == '\t';
}

class SpecCursor {
private:
    std::string_view text_;
    std::size_t pos_ = 0;

public:
    explicit SpecCursor(std::string_view text) : text_(text) {}

    void skip_blanks() {
        while (pos_ < text_.size() && is_blank(text_[pos_])) ++pos_;
    }

    bool consume(char expected) {
        if (pos_ < text_.size() && text_[pos_] == expected) {
            ++pos_;
            return true;
        }
        return false;
    }

    // Case-insensitive match of an ASCII keyword
    bool consume_keyword(std::string_view keyword) {
        if (text_.size() - pos_ < keyword.size()) return false;
        for (std::size_t i = 0; i < keyword.size(); ++i) {
            char c = text_[pos_ + i];
            if (c >= 'a' && c <= 'z') c = static_cast<char>(c - 'a' + 'A');
            if (c != keyword[i]) return false;
        }
        pos_ += keyword.size();
        return true;
    }

    // Unsigned decimal component; rejects signs, empty input and values above 255
    std::optional<uint8_t> read_component() {
        std::size_t begin = pos_;
        int value = 0;
        while (pos_ < text_.size() && detail::is_ascii_digit(text_[pos_])) {
            value = value * 10 + (text_[pos_] - '0');
            if (value > 255) return std::nullopt;
            ++pos_;
        }
        if (pos_ == begin) return std::nullopt;
        return static_cast<uint8_t>(value);
    }

    bool at_end() const { return pos_ >= text_.size(); }
};

std::string describe(const LabelMap::Entry& entry) {
    return entry.first + " -> " + entry.second;
}

} // namespace

std::optional<Rgb> parse_rgb_spec(std::string_view spec) {
    SpecCursor cursor(spec);
    if (!cursor.consume_keyword("RGB")) return std::nullopt;
    if (!cursor.consume('(')) return std::nullopt;

    uint8_t components[3];
    for (int i = 0; i < 3; ++i) {
        cursor.skip_blanks();
        auto component = cursor.read_component();
        if (!component) return std::nullopt;
        components[i] = *component;
        cursor.skip_blanks();
        if (i < 2 && !cursor.consume(',')) return std::nullopt;
    }
    if (!cursor.consume(')') || !cursor.at_end()) return std::nullopt;
    return Rgb(components[0], components[1], components[2]);
}

std::optional<Rgb> parse_hex_spec(std::string_view spec) {
    if (spec.size() != 7 || spec[0] != '#') return std::nullopt;
    uint8_t components[3];
    for (int i = 0; i < 3; ++i) {
        int high = detail::hex_value(spec[1 + 2 * i]);
        int low = detail::hex_value(spec[2 + 2 * i]);
        if (high < 0 || low < 0) return std::nullopt;
        components[i] = static_cast<uint8_t>(high * 16 + low);
    }
    return Rgb(components[0], components[1], components[2]);
}

std::optional<Rgb> parse_color_spec(std::string_view spec) {
    if (!spec.empty() && spec[0] == '#') {
        return parse_hex_spec(spec);
    }
    return parse_rgb_spec(spec);
}

LabelMap LabelMap::from_specs(const std::vector<Entry>& entries) {
    LabelMap map;
    for (const auto& entry : entries) {
        auto color = parse_color_spec(entry.first);
        if (!color) {
            throw InvalidLabelMap(describe(entry),
                                  "color must be RGB(<0-255>,<0-255>,<0-255>) or #RRGGBB");
        }
        auto [it, inserted] = map.labels_.emplace(*color, entry.second);
        if (!inserted && it->second != entry.second) {
            throw InvalidLabelMap(describe(entry),
                                  color->to_string() + " is already labeled '" + it->second + "'");
        }
    }
    DEBUG_LOG("labels", "label map validated with %zu colors", map.labels_.size());
    return map;
}

LabelMap LabelMap::from_specs(const std::map<std::string, std::string>& entries) {
    return from_specs(std::vector<Entry>(entries.begin(), entries.end()));
}

const std::string* LabelMap::find(const Rgb& color) const {
    auto it = labels_.find(color);
    return it == labels_.end() ? nullptr : &it->second;
}

} // namespace colorscript
