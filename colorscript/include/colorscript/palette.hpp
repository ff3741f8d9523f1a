#ifndef COLORSCRIPT_PALETTE_HPP
#define COLORSCRIPT_PALETTE_HPP

#include <colorscript/types.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace colorscript {

/**
 * Document color table. Slots are 1-origin in declaration order; slot 0
 * is the RTF "auto" color and is never stored.
 */
class Palette {
private:
    std::vector<Rgb> colors_;

public:
    Palette() = default;
    explicit Palette(std::vector<Rgb> colors) : colors_(std::move(colors)) {}

    std::size_t size() const noexcept { return colors_.size(); }
    bool empty() const noexcept { return colors_.empty(); }

    bool has_slot(std::size_t slot) const noexcept {
        return slot >= 1 && slot <= colors_.size();
    }

    std::optional<Rgb> lookup(std::size_t slot) const {
        if (!has_slot(slot)) return std::nullopt;
        return colors_[slot - 1];
    }

    // Throws std::out_of_range for undeclared slots
    const Rgb& at(std::size_t slot) const;

    const std::vector<Rgb>& colors() const noexcept { return colors_; }
};

/**
 * Result of locating the color table: the palette plus the byte range
 * [block_begin, block_end) of the whole `{\colortbl ...}` group.
 */
struct PaletteExtraction {
    Palette palette;
    std::size_t block_begin = 0;
    std::size_t block_end = 0;
};

/**
 * Find the single color declaration group and parse its entries.
 * Throws MalformedDocument when no group exists, when it is not closed,
 * or when an entry cannot be read.
 */
PaletteExtraction extract_palette(std::string_view document);

/**
 * Copy of the document with the color table group removed. Its
 * `\red..\green..\blue..;` entries would otherwise reach the marker scan.
 */
std::string strip_color_table(std::string_view document, const PaletteExtraction& extraction);

} // namespace colorscript

#endif // COLORSCRIPT_PALETTE_HPP
