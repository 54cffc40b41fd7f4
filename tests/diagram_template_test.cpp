// diagram_template_test.cpp — tests for six-way Venn template substitution
//
// Tests probability formatting, per-line substitution of region labels,
// pass-through of other lines, whole-stream rendering, and the surfaced
// ResourceNotFound error for a missing template file.

#include <gtest/gtest.h>

#include "errors.hpp"
#include "test_helpers.hpp"
#include "venn/diagram_template.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

using test_helpers::make_pattern_tally;
using test_helpers::sample_template;

// ===========================================================================
// 1. Formatting
// ===========================================================================

TEST(FormatProbabilityTest, PlainDecimal) {
    EXPECT_EQ(venn::format_probability(0.25), "0.25");
    EXPECT_EQ(venn::format_probability(0.5), "0.5");
    EXPECT_EQ(venn::format_probability(0.123456), "0.123456");
}

TEST(FormatProbabilityTest, WholeNumbersKeepDecimalPoint) {
    EXPECT_EQ(venn::format_probability(1.0), "1.0");
    EXPECT_EQ(venn::format_probability(0.0), "0.0");
}

TEST(FormatProbabilityTest, SmallValuesNotScientific) {
    std::string s = venn::format_probability(0.000001);
    EXPECT_EQ(s, "0.000001");
    EXPECT_EQ(s.find('e'), std::string::npos);
}

// ===========================================================================
// 2. Single line
// ===========================================================================

class RenderLineTest : public ::testing::Test {
protected:
    AgreementTally tally = make_pattern_tally(1000);
};

TEST_F(RenderLineTest, LabelReplacedWithProbability) {
    std::string line = "  <text x=\"262.5\" y=\"301.25\">abcdef</text>";
    std::string expected = "  <text x=\"262.5\" y=\"301.25\">" +
                           venn::format_probability(tally.probability(FULL_SUBSET)) +
                           "</text>";
    EXPECT_EQ(venn::render_line(line, tally), expected);
}

TEST_F(RenderLineTest, SingleLetterLabel) {
    std::string line = "<text x=\"1.0\" y=\"80.5\">a</text>";
    // mask 32 → count 968
    EXPECT_EQ(venn::render_line(line, tally), "<text x=\"1.0\" y=\"80.5\">0.968</text>");
}

TEST_F(RenderLineTest, LineWithoutLabelUnchanged) {
    std::string line = "  <path d=\"M 0 0 L 10 10\"/>";
    EXPECT_EQ(venn::render_line(line, tally), line);
}

TEST_F(RenderLineTest, IntegerCoordinateDoesNotMatch) {
    std::string line = "<text x=\"1\" y=\"80\">abc</text>";
    EXPECT_EQ(venn::render_line(line, tally), line);
}

TEST_F(RenderLineTest, UppercaseOrOutOfRangeLettersDoNotMatch) {
    std::string upper = "<text y=\"80.5\">ABC</text>";
    std::string other = "<text y=\"80.5\">xyz</text>";
    EXPECT_EQ(venn::render_line(upper, tally), upper);
    EXPECT_EQ(venn::render_line(other, tally), other);
}

// ===========================================================================
// 3. Whole template
// ===========================================================================

TEST(RenderDiagramTest, SubstitutesEveryLabelAndKeepsOtherLines) {
    auto tally = make_pattern_tally(1000);
    std::istringstream in(sample_template());
    std::ostringstream out;
    int substituted = venn::render_diagram(in, out, tally);
    EXPECT_EQ(substituted, 3);

    std::string rendered = out.str();
    EXPECT_NE(rendered.find("<svg xmlns=\"http://www.w3.org/2000/svg\">"), std::string::npos);
    EXPECT_NE(rendered.find("<path d=\"M 0 0 L 10 10\"/>"), std::string::npos);
    EXPECT_NE(rendered.find(">0.968</text>"), std::string::npos);
    EXPECT_EQ(rendered.find(">abcdef<"), std::string::npos);
    EXPECT_EQ(rendered.find(">ce<"), std::string::npos);
}

TEST(RenderDiagramTest, LineCountPreserved) {
    auto tally = make_pattern_tally(1000);
    std::istringstream in(sample_template());
    std::ostringstream out;
    venn::render_diagram(in, out, tally);
    auto count_lines = [](const std::string& s) {
        return std::count(s.begin(), s.end(), '\n');
    };
    EXPECT_EQ(count_lines(out.str()), count_lines(sample_template()));
}

TEST(RenderDiagramTest, MissingTemplateFileThrowsResourceNotFound) {
    auto tally = make_pattern_tally(1000);
    std::ostringstream out;
    std::string missing = test_helpers::temp_path("no_such_6waydiagram.svg");
    std::filesystem::remove(missing);
    try {
        venn::render_diagram_file(missing, out, tally);
        FAIL() << "expected ResourceNotFound";
    } catch (const ResourceNotFound& e) {
        EXPECT_EQ(e.path(), missing);
    }
    EXPECT_TRUE(out.str().empty());
}

TEST(RenderDiagramTest, RendersTemplateFile) {
    auto tally = make_pattern_tally(1000);
    std::string path = test_helpers::temp_path("diagram_template_test.svg");
    {
        std::ofstream f(path);
        f << sample_template();
    }
    std::ostringstream out;
    EXPECT_EQ(venn::render_diagram_file(path, out, tally), 3);
    EXPECT_NE(out.str().find(">0.968</text>"), std::string::npos);
    std::filesystem::remove(path);
}
