#ifndef COLORSCRIPT_LABEL_MAP_HPP
#define COLORSCRIPT_LABEL_MAP_HPP

#include <colorscript/types.hpp>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace colorscript {

/**
 * Parse `RGB(r,g,b)` (prefix case-insensitive, whitespace tolerated around
 * components) or `#RRGGBB`. Returns nullopt for any other form or for a
 * component outside [0, 255].
 */
std::optional<Rgb> parse_rgb_spec(std::string_view spec);
std::optional<Rgb> parse_hex_spec(std::string_view spec);

// Either of the two accepted grammars
std::optional<Rgb> parse_color_spec(std::string_view spec);

/**
 * Caller-chosen mapping from colors to speaker labels. Built only through
 * from_specs(), which validates every entry before any document is parsed.
 */
class LabelMap {
private:
    std::unordered_map<Rgb, std::string, RgbHash> labels_;

public:
    using Entry = std::pair<std::string, std::string>;  // (color spec, label)

    LabelMap() = default;

    // Throws InvalidLabelMap naming the first bad entry
    static LabelMap from_specs(const std::vector<Entry>& entries);
    static LabelMap from_specs(const std::map<std::string, std::string>& entries);

    // nullptr when the color has no label
    const std::string* find(const Rgb& color) const;

    bool empty() const noexcept { return labels_.empty(); }
    std::size_t size() const noexcept { return labels_.size(); }
};

} // namespace colorscript

#endif // COLORSCRIPT_LABEL_MAP_HPP
