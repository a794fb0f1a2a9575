#include <gtest/gtest.h>
#include <ocr_layout/fragment_parser.h>

using ocr_layout::FragmentParser;
using ocr_layout::ParseReport;

TEST(BoundingBoxTest, DerivedProperties) {
    ocr_layout::BoundingBox box{0.1, 0.2, 0.9, 0.8};
    EXPECT_NEAR(box.width(), 0.8, 1e-9);
    EXPECT_NEAR(box.height(), 0.6, 1e-9);
    EXPECT_NEAR(box.center_x(), 0.5, 1e-9);
    EXPECT_NEAR(box.center_y(), 0.5, 1e-9);
}

TEST(BoundingBoxTest, InvertedBoxHasNegativeExtent) {
    ocr_layout::BoundingBox box{0.8, 0.6, 0.2, 0.4};
    EXPECT_LT(box.width(), 0.0);
    EXPECT_LT(box.height(), 0.0);
    EXPECT_NEAR(box.center_x(), 0.5, 1e-9);
}

TEST(FragmentParserTest, ParsesCompleteRecord) {
    auto records = nlohmann::json::parse(R"([
        {"text": "Hello World",
         "grounding": {"page": 2, "box": {"left": 0.1, "top": 0.1, "right": 0.5, "bottom": 0.2}}}
    ])");

    auto fragments = FragmentParser::parse(records);
    ASSERT_EQ(fragments.size(), 1u);
    EXPECT_EQ(fragments[0].text, "Hello World");
    EXPECT_EQ(fragments[0].page, 2);
    EXPECT_DOUBLE_EQ(fragments[0].box.left, 0.1);
    EXPECT_DOUBLE_EQ(fragments[0].box.bottom, 0.2);
}

TEST(FragmentParserTest, MissingGroundingUsesFullPageDefaults) {
    auto records = nlohmann::json::parse(R"([{"text": "No grounding"}, {"text": "Empty", "grounding": {}}])");

    ParseReport report;
    auto fragments = FragmentParser::parse(records, &report);
    ASSERT_EQ(fragments.size(), 2u);
    for (const auto& fragment : fragments) {
        EXPECT_EQ(fragment.page, 0);
        EXPECT_EQ(fragment.box, (ocr_layout::BoundingBox{0.0, 0.0, 1.0, 1.0}));
    }
    EXPECT_EQ(report.missing_grounding, 2u);
}

TEST(FragmentParserTest, PartialBoxFilledPerField) {
    auto records = nlohmann::json::parse(R"([
        {"text": "Partial", "grounding": {"page": 1, "box": {"left": 0.2, "bottom": 0.6}}},
        {"text": "No box", "grounding": {"page": 3}}
    ])");

    auto fragments = FragmentParser::parse(records);
    ASSERT_EQ(fragments.size(), 2u);
    EXPECT_EQ(fragments[0].page, 1);
    EXPECT_DOUBLE_EQ(fragments[0].box.left, 0.2);
    EXPECT_DOUBLE_EQ(fragments[0].box.top, 0.0);
    EXPECT_DOUBLE_EQ(fragments[0].box.right, 1.0);
    EXPECT_DOUBLE_EQ(fragments[0].box.bottom, 0.6);

    EXPECT_EQ(fragments[1].page, 3);
    EXPECT_EQ(fragments[1].box, (ocr_layout::BoundingBox{0.0, 0.0, 1.0, 1.0}));
}

TEST(FragmentParserTest, DropsEmptyAndWhitespaceText) {
    auto records = nlohmann::json::parse(R"([
        {"text": "", "grounding": {"page": 0}},
        {"text": "   \n\t", "grounding": {"page": 5}},
        {"grounding": {"page": 1}},
        {"text": "  Valid  ", "grounding": {"page": 0}}
    ])");

    ParseReport report;
    auto fragments = FragmentParser::parse(records, &report);
    ASSERT_EQ(fragments.size(), 1u);
    EXPECT_EQ(fragments[0].text, "Valid");
    EXPECT_EQ(report.total_records, 4u);
    EXPECT_EQ(report.dropped_empty, 3u);
}

TEST(FragmentParserTest, MalformedValuesResolveToDefaults) {
    auto records = nlohmann::json::parse(R"([
        42,
        {"text": 17},
        {"text": "Bad geometry",
         "grounding": {"page": "two", "box": {"left": "x", "top": null, "right": 0.7, "bottom": [1]}}},
        {"text": "Negative page", "grounding": {"page": -4}},
        {"text": "Float page", "grounding": {"page": 2.0}}
    ])");

    std::vector<ocr_layout::TextFragment> fragments;
    ASSERT_NO_THROW(fragments = FragmentParser::parse(records));
    ASSERT_EQ(fragments.size(), 3u);

    EXPECT_EQ(fragments[0].page, 0);
    EXPECT_DOUBLE_EQ(fragments[0].box.left, 0.0);
    EXPECT_DOUBLE_EQ(fragments[0].box.top, 0.0);
    EXPECT_DOUBLE_EQ(fragments[0].box.right, 0.7);
    EXPECT_DOUBLE_EQ(fragments[0].box.bottom, 1.0);

    EXPECT_EQ(fragments[1].page, 0);
    EXPECT_EQ(fragments[2].page, 2);
}

TEST(FragmentParserTest, NonArrayInputYieldsNothing) {
    EXPECT_TRUE(FragmentParser::parse(nlohmann::json::object()).empty());
    EXPECT_TRUE(FragmentParser::parse(nlohmann::json()).empty());
    EXPECT_TRUE(FragmentParser::parse(nlohmann::json::array()).empty());
}

TEST(FragmentParserTest, KeepsInputOrder) {
    auto records = nlohmann::json::parse(R"([
        {"text": "b", "grounding": {"page": 1}},
        {"text": "a", "grounding": {"page": 0}},
        {"text": "c", "grounding": {"page": 1}}
    ])");

    auto fragments = FragmentParser::parse(records);
    ASSERT_EQ(fragments.size(), 3u);
    EXPECT_EQ(fragments[0].text, "b");
    EXPECT_EQ(fragments[1].text, "a");
    EXPECT_EQ(fragments[2].text, "c");
}

TEST(FragmentParserTest, Trim) {
    EXPECT_EQ(FragmentParser::trim("  a b \r\n"), "a b");
    EXPECT_EQ(FragmentParser::trim(" \t "), "");
    EXPECT_EQ(FragmentParser::trim("x"), "x");
}
