#ifndef COLORSCRIPT_SEGMENTER_HPP
#define COLORSCRIPT_SEGMENTER_HPP

#include <colorscript/types.hpp>
#include <colorscript/palette.hpp>
#include <colorscript/label_map.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace colorscript {

/**
 * One protected color-change marker in cleaned text:
 * `<marker>cf<digits>` at [offset, offset + length) selecting `slot`.
 */
struct ColorRun {
    std::size_t offset;
    std::size_t length;
    std::size_t slot;
};

/**
 * Forward-only cursor producing the ColorRuns of a cleaned text in order.
 * A marker byte not followed by `cf` and a digit is ordinary text.
 */
class ColorRunScanner {
private:
    std::string_view text_;
    char marker_;
    std::size_t pos_ = 0;

public:
    ColorRunScanner(std::string_view text, char marker) : text_(text), marker_(marker) {}

    std::optional<ColorRun> next();

    std::size_t position() const noexcept { return pos_; }
    bool at_end() const noexcept { return pos_ >= text_.size(); }
};

/**
 * Label of the color selected by a run. An empty label map yields the
 * empty label for every run; otherwise a missing palette slot or an
 * unlabeled color throws UnresolvedColor.
 */
std::string resolve_label(const ColorRun& run, const Palette& palette, const LabelMap& labels);

/**
 * Split cleaned text into turns.
 *
 * The text before the first marker carries the empty label; the label
 * resolved at a marker applies to the span that follows it. One space
 * directly after a marker is the control word delimiter and is dropped.
 * Empty spans produce no turn. The span after the last marker is always
 * flushed once the scan completes.
 */
Transcript segment_turns(std::string_view text, char marker,
                         const Palette& palette, const LabelMap& labels);

} // namespace colorscript

#endif // COLORSCRIPT_SEGMENTER_HPP
