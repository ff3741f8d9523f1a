#include <gtest/gtest.h>
#include <colorscript/markup.hpp>
#include <colorscript/errors.hpp>
#include "test_helpers.hpp"

using namespace colorscript;

// === MARKER SELECTION ===

TEST(MarkupTest, FirstCandidateWhenBodyIsClean) {
    EXPECT_EQ(select_marker_char("{\\rtf1 plain text}"), '\x01');
    EXPECT_EQ(select_marker_char(""), '\x01');
}

TEST(MarkupTest, SkipsCandidatesAlreadyPresent) {
    std::string body = "text \x01 more";
    EXPECT_EQ(select_marker_char(body), '\x02');

    body += "\x02\x03";
    EXPECT_EQ(select_marker_char(body), '\x04');
}

TEST(MarkupTest, MarkerNeverOccursInBody) {
    std::string body = "{\\rtf1 \x01\x03\x05\x07}";
    char marker = select_marker_char(body);
    EXPECT_EQ(body.find(marker), std::string::npos);
    EXPECT_EQ(marker, '\x02');
}

TEST(MarkupTest, AllCandidatesPresent) {
    std::string body = "{\\rtf1 ";
    for (char candidate : kMarkerCandidates) body += candidate;
    body += "}";

    try {
        select_marker_char(body);
        FAIL() << "expected NoSafeMarkerChar";
    } catch (const NoSafeMarkerChar& e) {
        EXPECT_EQ(e.kind(), ErrorKind::NoSafeMarkerChar);
    }
}

// === PROTECTION ===

TEST(MarkupTest, ProtectsEveryColorWord) {
    std::size_t count = 0;
    std::string protected_body = protect_color_markers("\\cf1 Hi \\cf22 there", '\x01', &count);

    EXPECT_EQ(protected_body, "\x01" "cf1 Hi " "\x01" "cf22 there");
    EXPECT_EQ(count, 2);
}

TEST(MarkupTest, LengthIsUnchanged) {
    std::string body = test_utils::session_document();
    std::string protected_body = protect_color_markers(body, '\x01');
    EXPECT_EQ(protected_body.size(), body.size());
}

TEST(MarkupTest, LeavesEscapedBackslashAlone) {
    std::size_t count = 7;
    EXPECT_EQ(protect_color_markers("see \\\\cf1 literally", '\x01', &count), "see \\\\cf1 literally");
    EXPECT_EQ(count, 0);

    // Escaped backslash followed by a real color word
    EXPECT_EQ(protect_color_markers("\\\\\\cf1 x", '\x01'), "\\\\" "\x01" "cf1 x");
}

TEST(MarkupTest, LeavesOtherControlWordsAlone) {
    EXPECT_EQ(protect_color_markers("\\cb3\\cf2 x", '\x02'), "\\cb3" "\x02" "cf2 x");
    EXPECT_EQ(protect_color_markers("\\cfnothing \\cf \\cf-1 \\cfs2", '\x01'),
              "\\cfnothing \\cf \\cf-1 \\cfs2");
    EXPECT_EQ(protect_color_markers("\\'92\\{\\cf3", '\x01'), "\\'92\\{" "\x01" "cf3");
}

TEST(MarkupTest, SessionDocumentColorWordsCount) {
    std::size_t count = 0;
    protect_color_markers(test_utils::session_document(), '\x01', &count);
    EXPECT_EQ(count, 4);
}
