// Text measurement and content-driven element sizing tests.

#include "gsn_test_helpers.hpp"
#include <gsn_placement/element_sizing.hpp>
#include <gsn_placement/layout_constants.hpp>
#include <gsn_placement/text_metrics.hpp>
#include <gtest/gtest.h>
#include <string>

using gsn_model::ElementKind;
using namespace gsn_placement;
using namespace gsn_test;

TEST(TextMetricsTest, StripsTagsAndKeepsLineBreaks) {
    EXPECT_EQ(strip_markup("<p>Hello <b>world</b></p>"), "Hello world");
    EXPECT_EQ(strip_markup("first<br>second<BR/>third"), "first\nsecond\nthird");
    EXPECT_EQ(strip_markup("<ul><li>one</li><li>two</li></ul>"), "one\ntwo");
}

TEST(TextMetricsTest, DecodesEntities) {
    EXPECT_EQ(strip_markup("a &amp; b &lt;c&gt;"), "a & b <c>");
    EXPECT_EQ(strip_markup("&#65;&#x42;&quot;"), "AB\"");
    EXPECT_EQ(strip_markup("x&nbsp;&nbsp;y"), "x y");
    // unknown entities stay literal
    EXPECT_EQ(strip_markup("&bogus; &"), "&bogus; &");
}

TEST(TextMetricsTest, NormalizesWhitespace) {
    EXPECT_EQ(strip_markup("  lots   of \t space  "), "lots of space");
    EXPECT_EQ(strip_markup("<p></p><p>  </p>"), "");
    EXPECT_EQ(strip_markup("a\n\n\nb"), "a\nb");
}

TEST(TextMetricsTest, UnclosedTagIsText) {
    EXPECT_EQ(strip_markup("x < y"), "x < y");
}

TEST(TextMetricsTest, WideGlyphsMeasureWider) {
    EXPECT_DOUBLE_EQ(estimate_text_width("abcd"), 4 * layout::ascii_glyph_width);
    // two CJK ideographs
    EXPECT_DOUBLE_EQ(estimate_text_width("\xE5\xAE\x89\xE5\x85\xA8"), 2 * layout::wide_glyph_width);
    // e with acute accent
    EXPECT_DOUBLE_EQ(estimate_text_width("\xC3\xA9"), layout::other_glyph_width);
    EXPECT_DOUBLE_EQ(estimate_text_width(""), 0.0);
    EXPECT_TRUE(is_wide_code_point(U'あ'));
    EXPECT_FALSE(is_wide_code_point(U'A'));
}

TEST(TextMetricsTest, SplitLinesKeepsEmptySegments) {
    const auto lines = split_lines("a\n\nb");
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0], "a");
    EXPECT_EQ(lines[1], "");
    EXPECT_EQ(lines[2], "b");
}

TEST(ElementSizingTest, EmptyContentApproachesGoldenRatio) {
    for (ElementKind kind : { ElementKind::Goal, ElementKind::Strategy, ElementKind::Evidence,
             ElementKind::Context, ElementKind::Assumption, ElementKind::Justification, ElementKind::Module }) {
        const auto size = compute_element_size(element("E", kind));
        const auto b = layout::bounds_for(kind);
        EXPECT_NEAR(size.width / size.height, layout::golden_ratio, 0.01) << gsn_model::kind_name(kind);
        EXPECT_GE(size.width, b.min_width);
        EXPECT_LE(size.width, b.max_width);
        EXPECT_GE(size.height, b.min_height);
        EXPECT_LE(size.height, b.max_height);
    }
}

TEST(ElementSizingTest, UndevelopedIsSquare) {
    const auto empty = compute_element_size(element("U", ElementKind::Undeveloped));
    EXPECT_DOUBLE_EQ(empty.width, empty.height);
    EXPECT_DOUBLE_EQ(empty.width, layout::undeveloped_bounds.min_width);

    const auto labelled = compute_element_size(element("U", ElementKind::Undeveloped, "to be developed later"));
    EXPECT_DOUBLE_EQ(labelled.width, labelled.height);
    EXPECT_GT(labelled.width, empty.width);
}

TEST(ElementSizingTest, LongerContentGrowsTheBox) {
    const auto short_size = compute_element_size(element("G", ElementKind::Goal, "System is safe"));
    const std::string long_text =
        "The braking system is acceptably safe to operate in all intended operating conditions, "
        "including degraded modes, sensor failures and adverse weather on public roads";
    const auto long_size = compute_element_size(element("G", ElementKind::Goal, long_text));
    EXPECT_GT(long_size.width * long_size.height, short_size.width * short_size.height);
}

TEST(ElementSizingTest, HugeContentIsClampedToBounds) {
    std::string text;
    for (int i = 0; i < 200; ++i) text += "very long claim text ";
    for (ElementKind kind : { ElementKind::Goal, ElementKind::Context, ElementKind::Evidence }) {
        const auto size = compute_element_size(element("E", kind, text));
        const auto b = layout::bounds_for(kind);
        EXPECT_DOUBLE_EQ(size.width, b.max_width);
        EXPECT_DOUBLE_EQ(size.height, b.max_height);
    }
}

TEST(ElementSizingTest, MarkupDoesNotCountAsText) {
    const auto plain = compute_element_size(element("G", ElementKind::Goal, "Hazards are mitigated"));
    const auto marked = compute_element_size(element("G", ElementKind::Goal,
        "<p><span style=\"font-weight: bold\">Hazards</span> are mitigated</p>"));
    EXPECT_DOUBLE_EQ(plain.width, marked.width);
    EXPECT_DOUBLE_EQ(plain.height, marked.height);
}

TEST(ElementSizingTest, ModuleIsSizedFromNestedTopGoal) {
    gsn_model::Diagram nested;
    nested.elements = {
        element("N-G1", ElementKind::Goal,
            "The nested software argument demonstrates that every safety requirement allocated to "
            "the brake controller is implemented and verified"),
        element("N-G2", ElementKind::Goal, "short"),
    };
    nested.relations = { supported_by("N-G1", "N-G2") };
    gsn_model::ModuleLookup modules{ { "mod-1", nested } };

    auto module = element("M1", ElementKind::Module, "");
    module.module_ref = "mod-1";

    EXPECT_EQ(measured_text(module, &modules), nested.elements[0].content);
    const auto with_lookup = compute_element_size(module, &modules);
    const auto without_lookup = compute_element_size(module);
    EXPECT_GT(with_lookup.width * with_lookup.height, without_lookup.width * without_lookup.height);

    // unknown reference falls back to the element's own content
    module.module_ref = "mod-unknown";
    module.content = "own text";
    EXPECT_EQ(measured_text(module, &modules), "own text");
}

TEST(ElementSizingTest, ModuleChromeAddsTabHeight) {
    const std::string text = "Subsystem argument for the hydraulic circuit";
    const auto goal = compute_element_size(element("G", ElementKind::Goal, text));
    const auto module = compute_element_size(element("M", ElementKind::Module, text));
    EXPECT_GE(module.height, goal.height);
}

TEST(ElementSizingTest, TopLevelGoalPrefersRoot) {
    gsn_model::Diagram d;
    d.elements = { element("G2", ElementKind::Goal), element("G1", ElementKind::Goal) };
    d.relations = { supported_by("G1", "G2") };
    const auto* top = find_top_level_goal(d);
    ASSERT_NE(top, nullptr);
    EXPECT_EQ(top->id, "G1");

    gsn_model::Diagram no_goal;
    no_goal.elements = { element("Sn1", ElementKind::Evidence) };
    EXPECT_EQ(find_top_level_goal(no_goal), nullptr);
}
