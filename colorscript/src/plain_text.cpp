#include <colorscript/plain_text.hpp>
#include <colorscript/debug_log.hpp>
#include "control_word.hpp"
#include <algorithm>
#include <unordered_map>
#include <unordered_set>

namespace colorscript {

namespace {

// Groups whose content is never document text
const std::unordered_set<std::string_view>& destinations() {
    static const std::unordered_set<std::string_view> words = {
        "aftncn", "aftnsep", "aftnsepc", "annotation", "atnauthor", "atndate",
        "atnicn", "atnid", "atnparent", "atnref", "atntime", "atrfend",
        "atrfstart", "author", "background", "bkmkend", "bkmkstart", "blipuid",
        "buptim", "category", "colorschememapping", "colortbl", "comment",
        "company", "creatim", "datafield", "datastore", "defchp", "defpap",
        "do", "doccomm", "docvar", "dptxbxtext", "ebcend", "ebcstart",
        "factoidname", "falt", "fchars", "ffdeftext", "ffentrymcr", "ffexitmcr",
        "ffformat", "ffhelptext", "ffl", "ffname", "ffstattext", "file",
        "filetbl", "fldinst", "fldtype", "fname", "fontemb", "fontfile",
        "fonttbl", "footer", "footerf", "footerl", "footerr", "footnote",
        "formfield", "ftncn", "ftnsep", "ftnsepc", "g", "generator", "gridtbl",
        "header", "headerf", "headerl", "headerr", "hl", "hlfr", "hlinkbase",
        "hlloc", "hlsrc", "hsv", "htmltag", "info", "keycode", "keywords",
        "latentstyles", "lchars", "levelnumbers", "leveltext", "lfolevel",
        "linkval", "list", "listlevel", "listname", "listoverride",
        "listoverridetable", "listpicture", "liststylename", "listtable",
        "listtext", "lsdlockedexcept", "macc", "mailmerge", "manager",
        "mmath", "nesttableprops", "nextfile", "nonesttables", "objalias",
        "objclass", "objdata", "object", "objname", "objsect", "objtime",
        "oldcprops", "oldpprops", "oldsprops", "oldtprops", "oleclsid",
        "operator", "panose", "password", "passwordhash", "pgp", "pgptbl",
        "picprop", "pict", "pn", "pnseclvl", "pntext", "pntxta", "pntxtb",
        "printim", "private", "propname", "protend", "protstart",
        "protusertbl", "pxe", "result", "revtbl", "revtim", "rsidtbl", "rxe",
        "shp", "shpgrp", "shpinst", "shppict", "shprslt", "shptxt", "sn", "sp",
        "staticval", "stylesheet", "subject", "sv", "svb", "tc", "template",
        "themedata", "title", "txe", "ud", "upr", "userprops",
        "wgrffmtfilter", "windowcaption", "writereservation",
        "writereservhash", "xe", "xform", "xmlattrname", "xmlattrvalue",
        "xmlclose", "xmlname", "xmlnstbl", "xmlopen",
    };
    return words;
}

// Control words that stand for text
const std::unordered_map<std::string_view, std::string_view>& special_words() {
    static const std::unordered_map<std::string_view, std::string_view> words = {
        {"par", "\n"},
        {"sect", "\n\n"},
        {"page", "\n\n"},
        {"line", "\n"},
        {"row", "\n"},
        {"tab", "\t"},
        {"cell", "|"},
        {"nestcell", "|"},
        {"emdash", "\xE2\x80\x94"},
        {"endash", "\xE2\x80\x93"},
        {"emspace", "\xE2\x80\x83"},
        {"enspace", "\xE2\x80\x82"},
        {"qmspace", "\xE2\x80\x85"},
        {"bullet", "\xE2\x80\xA2"},
        {"lquote", "\xE2\x80\x98"},
        {"rquote", "\xE2\x80\x99"},
        {"ldblquote", "\xE2\x80\x9C"},
        {"rdblquote", "\xE2\x80\x9D"},
    };
    return words;
}

constexpr uint32_t kReplacementChar = 0xFFFD;

// 0x80..0x9F; bytes 0xA0..0xFF map to the same Latin-1 code point
constexpr uint32_t kCp1252High[32] = {
    0x20AC, kReplacementChar, 0x201A, 0x0192, 0x201E, 0x2026, 0x2020, 0x2021,
    0x02C6, 0x2030, 0x0160, 0x2039, 0x0152, kReplacementChar, 0x017D, kReplacementChar,
    kReplacementChar, 0x2018, 0x2019, 0x201C, 0x201D, 0x2022, 0x2013, 0x2014,
    0x02DC, 0x2122, 0x0161, 0x203A, 0x0153, kReplacementChar, 0x017E, 0x0178,
};

} // namespace

uint32_t cp1252_to_codepoint(uint8_t byte) noexcept {
    if (byte >= 0x80 && byte <= 0x9F) {
        return kCp1252High[byte - 0x80];
    }
    return byte;
}

void append_utf8(std::string& out, uint32_t codepoint) {
    if (codepoint < 0x80) {
        out += static_cast<char>(codepoint);
    } else if (codepoint < 0x800) {
        out += static_cast<char>(0xC0 | (codepoint >> 6));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else if (codepoint < 0x10000) {
        out += static_cast<char>(0xE0 | (codepoint >> 12));
        out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (codepoint >> 18));
        out += static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    }
}

std::string PlainTextConverter::convert() {
    out_.clear();
    out_.reserve(text_.size());
    stack_.clear();
    pos_ = 0;
    uc_skip_ = 1;
    pending_skip_ = 0;
    ignorable_ = false;
    high_surrogate_ = 0;

    while (pos_ < text_.size()) {
        char c = text_[pos_];
        switch (c) {
            case '\\':
                handle_backslash();
                break;
            case '{':
                push_group();
                ++pos_;
                break;
            case '}':
                pop_group();
                ++pos_;
                break;
            case '\r':
            case '\n':
                ++pos_;
                break;
            default:
                emit_text(c);
                ++pos_;
                break;
        }
    }

    DEBUG_LOG("plaintext", "converted %zu markup bytes to %zu text bytes", text_.size(), out_.size());
    return std::move(out_);
}

void PlainTextConverter::handle_backslash() {
    if (pos_ + 1 >= text_.size()) {
        ++pos_;  // dangling backslash at end of input
        return;
    }
    char next = text_[pos_ + 1];
    if (detail::is_ascii_alpha(next)) {
        handle_control_word();
        return;
    }
    if (next == '\'') {
        handle_hex_escape();
        return;
    }

    // Control symbol
    pending_skip_ = 0;
    pos_ += 2;
    switch (next) {
        case '~':
            emit_special("\xC2\xA0");
            break;
        case '{':
        case '}':
        case '\\':
            if (!ignorable_) out_ += next;
            break;
        case '*':
            ignorable_ = true;
            break;
        case '-':
            emit_special("\xC2\xAD");
            break;
        case '_':
            emit_special("\xE2\x80\x91");
            break;
        case '\r':
            if (pos_ < text_.size() && text_[pos_] == '\n') ++pos_;
            emit_special("\n");
            break;
        case '\n':
            emit_special("\n");
            break;
        default:
            break;
    }
}

void PlainTextConverter::handle_control_word() {
    detail::ControlWord word;
    detail::read_control_word(text_, pos_, word);
    pos_ = word.end;
    pending_skip_ = 0;

    if (destinations().count(word.name)) {
        ignorable_ = true;
        return;
    }
    if (word.name == "bin" && word.has_param && word.param > 0) {
        std::size_t length = static_cast<std::size_t>(word.param);
        pos_ += std::min(length, text_.size() - pos_);
        return;
    }
    if (ignorable_) {
        return;
    }

    auto special = special_words().find(word.name);
    if (special != special_words().end()) {
        out_ += special->second;
    } else if (word.name == "uc") {
        if (word.has_param && word.param >= 0) uc_skip_ = static_cast<int>(word.param);
    } else if (word.name == "u" && word.has_param) {
        int64_t value = word.param;
        if (value < 0) value += 0x10000;
        emit_codepoint(static_cast<uint32_t>(value));
        pending_skip_ = uc_skip_;
    }
}

void PlainTextConverter::handle_hex_escape() {
    int high = pos_ + 2 < text_.size() ? detail::hex_value(text_[pos_ + 2]) : -1;
    int low = pos_ + 3 < text_.size() ? detail::hex_value(text_[pos_ + 3]) : -1;
    if (high < 0 || low < 0) {
        pos_ += 2;  // malformed escape, drop the `\'`
        return;
    }
    pos_ += 4;
    if (skipping_fallback() || ignorable_) {
        return;
    }
    emit_codepoint(cp1252_to_codepoint(static_cast<uint8_t>(high * 16 + low)));
}

void PlainTextConverter::push_group() {
    pending_skip_ = 0;
    stack_.push_back({uc_skip_, ignorable_});
}

void PlainTextConverter::pop_group() {
    pending_skip_ = 0;
    if (stack_.empty()) {
        return;  // unbalanced close brace
    }
    uc_skip_ = stack_.back().uc_skip;
    ignorable_ = stack_.back().ignorable;
    stack_.pop_back();
}

bool PlainTextConverter::skipping_fallback() {
    if (pending_skip_ > 0) {
        --pending_skip_;
        return true;
    }
    return false;
}

void PlainTextConverter::emit_text(char c) {
    if (marker_ && c == *marker_) {
        pending_skip_ = 0;
        if (!ignorable_) out_ += c;
        return;
    }
    if (skipping_fallback() || ignorable_) {
        return;
    }
    out_ += c;
}

void PlainTextConverter::emit_special(std::string_view utf8) {
    if (!ignorable_) {
        out_ += utf8;
    }
}

void PlainTextConverter::emit_codepoint(uint32_t codepoint) {
    if (codepoint >= 0xD800 && codepoint <= 0xDBFF) {
        high_surrogate_ = codepoint;
        return;
    }
    if (codepoint >= 0xDC00 && codepoint <= 0xDFFF) {
        if (high_surrogate_ == 0) return;
        codepoint = 0x10000 + ((high_surrogate_ - 0xD800) << 10) + (codepoint - 0xDC00);
    }
    high_surrogate_ = 0;

    // Escaped C0 controls could forge a color marker
    if (codepoint < 0x20 && codepoint != '\t' && codepoint != '\n' && codepoint != '\r') {
        return;
    }
    append_utf8(out_, codepoint);
}

std::string rtf_to_plain_text(std::string_view rtf) {
    PlainTextConverter converter(rtf);
    return converter.convert();
}

std::string rtf_to_plain_text(std::string_view rtf, char marker) {
    PlainTextConverter converter(rtf, marker);
    return converter.convert();
}

} // namespace colorscript
