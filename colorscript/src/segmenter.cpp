#include <colorscript/segmenter.hpp>
#include <colorscript/markup.hpp>
#include <colorscript/errors.hpp>
#include <colorscript/debug_log.hpp>
#include "control_word.hpp"

namespace colorscript {

std::optional<ColorRun> ColorRunScanner::next() {
    while (pos_ < text_.size()) {
        std::size_t found = text_.find(marker_, pos_);
        if (found == std::string_view::npos) {
            pos_ = text_.size();
            return std::nullopt;
        }

        std::size_t cursor = found + 1;
        if (text_.compare(cursor, kColorWord.size(), kColorWord) != 0) {
            pos_ = found + 1;
            continue;
        }
        cursor += kColorWord.size();

        std::size_t digits_begin = cursor;
        std::size_t slot = 0;
        // Same parameter limit as the lexer that protected the marker
        while (cursor < text_.size() && detail::is_ascii_digit(text_[cursor]) &&
               cursor - digits_begin < detail::kMaxParamDigits) {
            slot = slot * 10 + static_cast<std::size_t>(text_[cursor] - '0');
            ++cursor;
        }
        if (cursor == digits_begin) {
            pos_ = found + 1;
            continue;
        }

        pos_ = cursor;
        return ColorRun{found, cursor - found, slot};
    }
    return std::nullopt;
}

std::string resolve_label(const ColorRun& run, const Palette& palette, const LabelMap& labels) {
    if (labels.empty()) {
        return std::string();
    }
    auto color = palette.lookup(run.slot);
    if (!color) {
        throw UnresolvedColor(run.offset, run.slot, std::string());
    }
    const std::string* label = labels.find(*color);
    if (!label) {
        throw UnresolvedColor(run.offset, run.slot, color->to_string());
    }
    return *label;
}

namespace {

void emit_span(Transcript& turns, std::string_view text, std::size_t begin, std::size_t end,
               bool after_marker, const std::string& label) {
    if (after_marker && begin < end && text[begin] == ' ') {
        ++begin;
    }
    if (begin >= end) {
        return;
    }
    turns.emplace_back(label, std::string(text.substr(begin, end - begin)));
}

} // namespace

Transcript segment_turns(std::string_view text, char marker,
                         const Palette& palette, const LabelMap& labels) {
    Transcript turns;
    ColorRunScanner scanner(text, marker);

    std::string pending_label;
    std::size_t span_begin = 0;
    bool after_marker = false;
    std::size_t run_count = 0;

    while (auto run = scanner.next()) {
        emit_span(turns, text, span_begin, run->offset, after_marker, pending_label);
        pending_label = resolve_label(*run, palette, labels);
        span_begin = run->offset + run->length;
        after_marker = true;
        ++run_count;
    }
    emit_span(turns, text, span_begin, text.size(), after_marker, pending_label);

    DEBUG_LOG("segment", "%zu color runs produced %zu turns", run_count, turns.size());
    return turns;
}

} // namespace colorscript
