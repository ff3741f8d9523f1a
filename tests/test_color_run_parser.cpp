#include <gtest/gtest.h>
#include <colorscript/color_run_parser.hpp>
#include <colorscript/errors.hpp>
#include "test_helpers.hpp"

using namespace colorscript;

class ColorRunParserTest : public ::testing::Test {
protected:
    ColorRunParser parser{test_utils::expert_ai_labels()};
};

// === END TO END ===

TEST_F(ColorRunParserTest, GlassesExample) {
    ColorRunParser fred_and_susie(LabelMap::from_specs(std::vector<LabelMap::Entry>{
        {"RGB(255,0,0)", "Fred"},
        {"RGB(11,93,162)", "Susie"},
    }));
    std::string document =
        "{\\rtf1{\\colortbl;\\red255\\green0\\blue0;\\red11\\green93\\blue162;}\n"
        "\\cf1 I'm looking for my glasses.\\par\n"
        "\\cf2 They are on your head.}";

    Transcript turns = fred_and_susie.parse(document);
    ASSERT_EQ(turns.size(), 2);
    EXPECT_EQ(turns[0], Turn("Fred", "I'm looking for my glasses.\n"));
    EXPECT_EQ(turns[1], Turn("Susie", "They are on your head."));
}

TEST_F(ColorRunParserTest, SessionDocument) {
    Transcript turns = parser.parse(test_utils::session_document());

    ASSERT_EQ(turns.size(), 4);
    EXPECT_EQ(turns[0], Turn("Expert", "What risks do you run?\n"));
    EXPECT_EQ(turns[1], Turn("AI", "In ISTDP, we want to ensure will.\n\n"));
    EXPECT_EQ(turns[2], Turn("AI", "That's a thoughtful approach."));
    EXPECT_EQ(turns[3], Turn("Expert", "I want that too."));
}

TEST_F(ColorRunParserTest, SessionDocumentWithoutLabels) {
    ColorRunParser unlabeled{LabelMap()};
    Transcript turns = unlabeled.parse(test_utils::session_document());

    ASSERT_EQ(turns.size(), 4);
    EXPECT_EQ(test_utils::labels_of(turns), std::vector<std::string>({"", "", "", ""}));
    EXPECT_EQ(turns[1].text, "In ISTDP, we want to ensure will.\n\n");
}

TEST_F(ColorRunParserTest, DecodesSmartQuotesAndNonBreakingSpace) {
    Transcript turns = parser.parse(test_utils::megan_denial_document());

    ASSERT_EQ(turns.size(), 3);
    EXPECT_EQ(turns[0], Turn("Expert", "You believe this would be confrontational.\n"));
    EXPECT_EQ(turns[1], Turn("AI", "I appreciate your perspective, and it\xE2\x80\x99s great that "
                                   "you\xE2\x80\x99re thinking critically."));
    EXPECT_EQ(turns[2], Turn("Expert", "\xC2\xA0I think you may be misunderstanding my intervention."));
}

TEST_F(ColorRunParserTest, EscapedColorWordIsText) {
    ColorRunParser single(LabelMap::from_specs(std::vector<LabelMap::Entry>{{"RGB(1,1,1)", "X"}}));
    Transcript turns = single.parse("{\\rtf1{\\colortbl;\\red1\\green1\\blue1;}\\cf1 type \\\\cf1 to color}");

    ASSERT_EQ(turns.size(), 1);
    EXPECT_EQ(turns[0], Turn("X", "type \\cf1 to color"));
}

TEST_F(ColorRunParserTest, RawMarkerBytesInDocumentStayText) {
    ColorRunParser single(LabelMap::from_specs(std::vector<LabelMap::Entry>{{"RGB(1,1,1)", "X"}}));
    Transcript turns = single.parse("{\\rtf1{\\colortbl;\\red1\\green1\\blue1;}\\cf1 odd " "\x01" "cf1 bytes}");

    ASSERT_EQ(turns.size(), 1);
    EXPECT_EQ(turns[0], Turn("X", "odd " "\x01" "cf1 bytes"));
}

TEST_F(ColorRunParserTest, ColorChangeRightAfterUnicodeEscape) {
    ColorRunParser pair(LabelMap::from_specs(std::vector<LabelMap::Entry>{
        {"RGB(255,0,0)", "A"},
        {"RGB(0,0,255)", "B"},
    }));
    Transcript turns = pair.parse(
        "{\\rtf1{\\colortbl;\\red255\\green0\\blue0;\\red0\\green0\\blue255;}"
        "\\cf1 hi \\u8220\\cf2 there}");

    ASSERT_EQ(turns.size(), 2);
    EXPECT_EQ(turns[0], Turn("A", "hi \xE2\x80\x9C"));
    EXPECT_EQ(turns[1], Turn("B", "there"));
}

// === FAILURES ===

TEST_F(ColorRunParserTest, MissingColorTable) {
    EXPECT_THROW(parser.parse("{\\rtf1\\ansi \\cf1 Hello}"), MalformedDocument);
}

TEST_F(ColorRunParserTest, NoSafeMarker) {
    std::string document = "{\\rtf1{\\colortbl;\\red74\\green21\\blue148;}\\cf1 ";
    for (char candidate = '\x01'; candidate <= '\x08'; ++candidate) document += candidate;
    document += "}";

    EXPECT_THROW(parser.parse(document), NoSafeMarkerChar);
}

TEST_F(ColorRunParserTest, UnlabeledColor) {
    std::string document =
        "{\\rtf1{\\colortbl;\\red74\\green21\\blue148;\\red1\\green2\\blue3;}\\cf1 hi\\cf2 who?}";
    try {
        parser.parse(document);
        FAIL() << "expected UnresolvedColor";
    } catch (const UnresolvedColor& e) {
        EXPECT_EQ(e.slot(), 2);
        EXPECT_EQ(e.rgb(), "RGB(1,2,3)");
    }
}

TEST_F(ColorRunParserTest, OverlongColorNumberIsUnresolved) {
    ColorRunParser single(LabelMap::from_specs(std::vector<LabelMap::Entry>{
        {"RGB(255,0,0)", "A"},
        {"RGB(0,0,255)", "B"},
    }));
    EXPECT_THROW(single.parse("{\\rtf1{\\colortbl;\\red255\\green0\\blue0;\\red0\\green0\\blue255;}"
                              "\\cf2 hi \\cf18446744073709551617 x}"),
                 UnresolvedColor);
}

TEST_F(ColorRunParserTest, ParseFile) {
    test_utils::TempDir dir;
    test_utils::write_file(dir / "session.rtf", test_utils::session_document());

    EXPECT_EQ(parser.parse_file(dir / "session.rtf"), parser.parse(test_utils::session_document()));
    EXPECT_THROW(parser.parse_file(dir / "absent.rtf"), DocumentIOError);
}

TEST_F(ColorRunParserTest, ParserIsReusable) {
    Transcript first = parser.parse(test_utils::megan_denial_document());
    Transcript second = parser.parse(test_utils::tamara_denial_document());
    Transcript again = parser.parse(test_utils::megan_denial_document());

    EXPECT_EQ(first, again);
    EXPECT_EQ(second.size(), 5);
}
