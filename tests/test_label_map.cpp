#include <gtest/gtest.h>
#include <colorscript/label_map.hpp>
#include <colorscript/errors.hpp>
#include "test_helpers.hpp"

using namespace colorscript;

class LabelMapTest : public ::testing::Test {
protected:
    using Entries = std::vector<LabelMap::Entry>;
};

// === RGB(...) GRAMMAR ===

TEST_F(LabelMapTest, AcceptsEveryComponentInRange) {
    for (int value = 0; value <= 255; ++value) {
        std::string spec = "RGB(" + std::to_string(value) + "," + std::to_string(255 - value) +
                           "," + std::to_string(value) + ")";
        auto color = parse_rgb_spec(spec);
        ASSERT_TRUE(color.has_value()) << spec;
        EXPECT_EQ(*color, Rgb(static_cast<uint8_t>(value), static_cast<uint8_t>(255 - value),
                              static_cast<uint8_t>(value)));
    }
}

TEST_F(LabelMapTest, ToleratesWhitespaceAndLowerCasePrefix) {
    EXPECT_EQ(parse_rgb_spec("RGB(74, 21, 148)"), Rgb(74, 21, 148));
    EXPECT_EQ(parse_rgb_spec("RGB( 74 ,21 ,  148 )"), Rgb(74, 21, 148));
    EXPECT_EQ(parse_rgb_spec("rgb(30,53,24)"), Rgb(30, 53, 24));
}

TEST_F(LabelMapTest, RejectsOutOfRangeComponents) {
    EXPECT_FALSE(parse_rgb_spec("RGB(256,0,0)").has_value());
    EXPECT_FALSE(parse_rgb_spec("RGB(0,1000,0)").has_value());
    EXPECT_FALSE(parse_rgb_spec("RGB(-1,0,0)").has_value());
    EXPECT_FALSE(parse_rgb_spec("RGB(0,0,-255)").has_value());
}

TEST_F(LabelMapTest, RejectsMalformedRgb) {
    for (const char* spec : {"", "RGB", "RGB()", "RGB(1,2)", "RGB(1,2,3,4)", "RGBA(1,2,3)",
                             "RGB(1,2,3)x", "RGB 1,2,3", "RGB(a,b,c)", "Red", "RGB(1.5,2,3)"}) {
        EXPECT_FALSE(parse_rgb_spec(spec).has_value()) << spec;
    }
}

// === #RRGGBB GRAMMAR ===

TEST_F(LabelMapTest, AcceptsSixHexDigits) {
    EXPECT_EQ(parse_hex_spec("#4A1594"), Rgb(74, 21, 148));
    EXPECT_EQ(parse_hex_spec("#4a1594"), Rgb(74, 21, 148));
    EXPECT_EQ(parse_hex_spec("#000000"), Rgb(0, 0, 0));
    EXPECT_EQ(parse_hex_spec("#FFFFFF"), Rgb(255, 255, 255));
    EXPECT_EQ(parse_color_spec("#B3a8C4"), Rgb(0xB3, 0xA8, 0xC4));
}

TEST_F(LabelMapTest, RejectsOtherHexForms) {
    for (const char* spec : {"#FFF", "#1234567", "4A1594", "0x4A1594", "#GG0000", "##4A159",
                             "#4A159", " #4A1594"}) {
        EXPECT_FALSE(parse_color_spec(spec).has_value()) << spec;
    }
}

// === VALIDATION ===

TEST_F(LabelMapTest, BuildsFromMixedSpecs) {
    LabelMap labels = LabelMap::from_specs(Entries{
        {"RGB(74,21,148)", "Expert"},
        {"#0B5DA2", "AI"},
    });

    EXPECT_EQ(labels.size(), 2);
    ASSERT_NE(labels.find(Rgb(74, 21, 148)), nullptr);
    EXPECT_EQ(*labels.find(Rgb(74, 21, 148)), "Expert");
    ASSERT_NE(labels.find(Rgb(11, 93, 162)), nullptr);
    EXPECT_EQ(*labels.find(Rgb(11, 93, 162)), "AI");
    EXPECT_EQ(labels.find(Rgb(1, 2, 3)), nullptr);
}

TEST_F(LabelMapTest, EmptyMapIsLegal) {
    LabelMap labels = LabelMap::from_specs(Entries{});
    EXPECT_TRUE(labels.empty());
    EXPECT_EQ(labels.find(Rgb(0, 0, 0)), nullptr);
}

TEST_F(LabelMapTest, InvalidEntryNamesTheOffender) {
    try {
        LabelMap::from_specs(Entries{{"RGB(74,21,148)", "Expert"}, {"RGB(300,0,0)", "AI"}});
        FAIL() << "expected InvalidLabelMap";
    } catch (const InvalidLabelMap& e) {
        EXPECT_NE(e.entry().find("RGB(300,0,0)"), std::string::npos);
        EXPECT_NE(std::string(e.what()).find("AI"), std::string::npos);
        EXPECT_EQ(e.kind(), ErrorKind::InvalidLabelMap);
    }
}

TEST_F(LabelMapTest, ConflictingLabelsForOneColorAreRejected) {
    EXPECT_THROW(LabelMap::from_specs(Entries{{"RGB(74,21,148)", "Expert"}, {"#4A1594", "AI"}}),
                 InvalidLabelMap);
}

TEST_F(LabelMapTest, RepeatedIdenticalEntryIsAccepted) {
    LabelMap labels = LabelMap::from_specs(Entries{{"RGB(74,21,148)", "Expert"}, {"#4a1594", "Expert"}});
    EXPECT_EQ(labels.size(), 1);
}

TEST_F(LabelMapTest, OrderedMapOverload) {
    std::map<std::string, std::string> entries = {{"RGB(11,93,162)", "AI"}, {"#4A1594", "Expert"}};
    LabelMap labels = LabelMap::from_specs(entries);
    EXPECT_EQ(labels.size(), 2);
    EXPECT_THROW(LabelMap::from_specs(std::map<std::string, std::string>{{"blue", "AI"}}),
                 InvalidLabelMap);
}

TEST_F(LabelMapTest, ColorFormatting) {
    Rgb purple(74, 21, 148);
    EXPECT_EQ(purple.to_string(), "RGB(74,21,148)");
    EXPECT_EQ(purple.to_hex(), "#4A1594");
    EXPECT_EQ(parse_color_spec(purple.to_hex()), purple);
}
