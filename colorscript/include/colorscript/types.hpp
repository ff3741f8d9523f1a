#ifndef COLORSCRIPT_TYPES_HPP
#define COLORSCRIPT_TYPES_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace colorscript {

/**
 * 24-bit color as declared in a document color table or named in a label map.
 */
struct Rgb {
    uint8_t red = 0;
    uint8_t green = 0;
    uint8_t blue = 0;

    Rgb() = default;
    Rgb(uint8_t r, uint8_t g, uint8_t b) : red(r), green(g), blue(b) {}

    bool operator==(const Rgb& other) const {
        return red == other.red && green == other.green && blue == other.blue;
    }
    bool operator!=(const Rgb& other) const { return !(*this == other); }

    uint32_t packed() const {
        return (uint32_t(red) << 16) | (uint32_t(green) << 8) | uint32_t(blue);
    }

    // "RGB(74,21,148)"
    std::string to_string() const;

    // "#4A1594"
    std::string to_hex() const;
};

struct RgbHash {
    std::size_t operator()(const Rgb& c) const noexcept {
        return std::hash<uint32_t>{}(c.packed());
    }
};

/**
 * One contiguous span of same-colored text with the speaker label of that color.
 */
struct Turn {
    std::string label;
    std::string text;

    Turn() = default;
    Turn(std::string l, std::string t) : label(std::move(l)), text(std::move(t)) {}

    bool operator==(const Turn& other) const {
        return label == other.label && text == other.text;
    }
};

using Transcript = std::vector<Turn>;

} // namespace colorscript

#endif // COLORSCRIPT_TYPES_HPP
