// Structural validator tests.

#include "gsn_test_helpers.hpp"
#include <gsn_analysis/validator.hpp>
#include <gtest/gtest.h>
#include <algorithm>
#include <random>

using gsn_analysis::DiagnosticCode;
using gsn_analysis::Severity;
using gsn_analysis::ValidationResult;
using gsn_model::ElementKind;
using namespace gsn_test;

namespace {

const gsn_analysis::Diagnostic* find_code(const std::vector<gsn_analysis::Diagnostic>& list, DiagnosticCode code) {
    auto it = std::find_if(list.begin(), list.end(),
        [code](const gsn_analysis::Diagnostic& d) { return d.code == code; });
    return it == list.end() ? nullptr : &*it;
}

bool contains_id(const gsn_analysis::Diagnostic& d, const std::string& id) {
    return std::find(d.element_ids.begin(), d.element_ids.end(), id) != d.element_ids.end();
}

} // namespace

TEST(ValidatorTest, SingleEmptyGoalIsUndevelopedButValid) {
    const ValidationResult r = gsn_analysis::validate({ element("G1", ElementKind::Goal) }, {});
    EXPECT_TRUE(r.is_valid);
    EXPECT_TRUE(r.errors.empty());
    const auto* undeveloped = find_code(r.warnings, DiagnosticCode::UndevelopedGoals);
    ASSERT_NE(undeveloped, nullptr);
    EXPECT_EQ(undeveloped->severity, Severity::Warning);
    EXPECT_TRUE(contains_id(*undeveloped, "G1"));
    // a single element is never an orphan
    EXPECT_EQ(find_code(r.warnings, DiagnosticCode::OrphanNodes), nullptr);
}

TEST(ValidatorTest, TwoDisconnectedRootsReportMultipleRootGoals) {
    const ValidationResult r = gsn_analysis::validate(
        { element("G1", ElementKind::Goal), element("G2", ElementKind::Goal) }, {});
    EXPECT_TRUE(r.is_valid);
    const auto* multiple = find_code(r.warnings, DiagnosticCode::MultipleRootGoals);
    ASSERT_NE(multiple, nullptr);
    EXPECT_EQ(multiple->element_ids, (std::vector<std::string>{ "G1", "G2" }));
    const auto* orphans = find_code(r.warnings, DiagnosticCode::OrphanNodes);
    ASSERT_NE(orphans, nullptr);
    EXPECT_EQ(orphans->element_ids.size(), 2u);
}

TEST(ValidatorTest, NoGoalAtAllIsAnError) {
    const ValidationResult r = gsn_analysis::validate({ element("Sn1", ElementKind::Evidence) }, {});
    EXPECT_FALSE(r.is_valid);
    EXPECT_NE(find_code(r.errors, DiagnosticCode::NoRootGoal), nullptr);
}

TEST(ValidatorTest, EmptyDiagramHasNoRootGoal) {
    const ValidationResult r = gsn_analysis::validate(gsn_model::Diagram{});
    EXPECT_FALSE(r.is_valid);
    ASSERT_EQ(r.errors.size(), 1u);
    EXPECT_EQ(r.errors[0].code, DiagnosticCode::NoRootGoal);
}

TEST(ValidatorTest, ThreeCycleIsReported) {
    const ValidationResult r = gsn_analysis::validate(
        { element("A", ElementKind::Goal), element("B", ElementKind::Goal), element("C", ElementKind::Goal) },
        { supported_by("A", "B"), supported_by("B", "C"), supported_by("C", "A") });
    EXPECT_FALSE(r.is_valid);
    const auto* cycle = find_code(r.errors, DiagnosticCode::CyclicReference);
    ASSERT_NE(cycle, nullptr);
    EXPECT_EQ(cycle->severity, Severity::Error);
    EXPECT_TRUE(contains_id(*cycle, "A"));
    EXPECT_TRUE(contains_id(*cycle, "B"));
    EXPECT_TRUE(contains_id(*cycle, "C"));
    // every goal has a parent, so there is no root either
    EXPECT_NE(find_code(r.errors, DiagnosticCode::NoRootGoal), nullptr);
}

TEST(ValidatorTest, OnlyOneCycleDiagnosticPerCall) {
    const ValidationResult r = gsn_analysis::validate(
        { element("G0", ElementKind::Goal), element("A", ElementKind::Goal), element("B", ElementKind::Goal),
          element("C", ElementKind::Goal), element("D", ElementKind::Goal) },
        { supported_by("G0", "A"), supported_by("G0", "C"), supported_by("A", "B"), supported_by("B", "A"),
          supported_by("C", "D"), supported_by("D", "C") });
    const auto count = std::count_if(r.errors.begin(), r.errors.end(),
        [](const gsn_analysis::Diagnostic& d) { return d.code == DiagnosticCode::CyclicReference; });
    EXPECT_EQ(count, 1);
}

TEST(ValidatorTest, SelfLoopIsACycle) {
    const ValidationResult r = gsn_analysis::validate(
        { element("G1", ElementKind::Goal), element("G2", ElementKind::Goal) },
        { supported_by("G1", "G2"), supported_by("G2", "G2") });
    const auto* cycle = find_code(r.errors, DiagnosticCode::CyclicReference);
    ASSERT_NE(cycle, nullptr);
    EXPECT_EQ(cycle->element_ids, std::vector<std::string>{ "G2" });
}

TEST(ValidatorTest, StrategyEndingInContextHasNoEvidencePath) {
    const ValidationResult r = gsn_analysis::validate(
        { element("G1", ElementKind::Goal), element("S1", ElementKind::Strategy), element("C1", ElementKind::Context) },
        { supported_by("G1", "S1"), supported_by("S1", "C1") });
    const auto* no_path = find_code(r.warnings, DiagnosticCode::NoEvidencePath);
    ASSERT_NE(no_path, nullptr);
    EXPECT_TRUE(contains_id(*no_path, "G1"));
    // a context is not a development of the strategy
    const auto* undeveloped = find_code(r.warnings, DiagnosticCode::UndevelopedGoals);
    ASSERT_NE(undeveloped, nullptr);
    EXPECT_TRUE(contains_id(*undeveloped, "S1"));
}

TEST(ValidatorTest, WellFormedArgumentIsClean) {
    const ValidationResult r = gsn_analysis::validate(
        { element("G1", ElementKind::Goal), element("C1", ElementKind::Context),
          element("S1", ElementKind::Strategy), element("G2", ElementKind::Goal),
          element("G3", ElementKind::Goal), element("Sn1", ElementKind::Evidence),
          element("M1", ElementKind::Module) },
        { in_context_of("G1", "C1"), supported_by("G1", "S1"), supported_by("S1", "G2"),
          supported_by("S1", "G3"), supported_by("G2", "Sn1"), supported_by("G3", "M1") });
    EXPECT_TRUE(r.is_valid);
    EXPECT_TRUE(r.errors.empty());
    EXPECT_TRUE(r.warnings.empty());
}

TEST(ValidatorTest, UndevelopedMarkerSatisfiesGoal) {
    const ValidationResult r = gsn_analysis::validate(
        { element("G1", ElementKind::Goal), element("U1", ElementKind::Undeveloped) },
        { supported_by("G1", "U1") });
    EXPECT_EQ(find_code(r.warnings, DiagnosticCode::UndevelopedGoals), nullptr);
    EXPECT_EQ(find_code(r.warnings, DiagnosticCode::NoEvidencePath), nullptr);
}

TEST(ValidatorTest, OneDeadBranchFailsReachability) {
    const ValidationResult r = gsn_analysis::validate(
        { element("G1", ElementKind::Goal), element("S1", ElementKind::Strategy),
          element("G2", ElementKind::Goal), element("G3", ElementKind::Goal), element("Sn1", ElementKind::Evidence) },
        { supported_by("G1", "S1"), supported_by("S1", "G2"), supported_by("S1", "G3"), supported_by("G2", "Sn1") });
    const auto* no_path = find_code(r.warnings, DiagnosticCode::NoEvidencePath);
    ASSERT_NE(no_path, nullptr);
    EXPECT_TRUE(contains_id(*no_path, "G1"));
    EXPECT_TRUE(contains_id(*no_path, "G3"));
    EXPECT_FALSE(contains_id(*no_path, "G2"));
}

TEST(ValidatorTest, OrphanAmongConnectedElements) {
    const ValidationResult r = gsn_analysis::validate(
        { element("G1", ElementKind::Goal), element("Sn1", ElementKind::Evidence), element("J1", ElementKind::Justification) },
        { supported_by("G1", "Sn1") });
    const auto* orphans = find_code(r.warnings, DiagnosticCode::OrphanNodes);
    ASSERT_NE(orphans, nullptr);
    EXPECT_EQ(orphans->element_ids, std::vector<std::string>{ "J1" });
}

TEST(ValidatorTest, SingleChildStrategyWarns) {
    const ValidationResult r = gsn_analysis::validate(
        { element("G1", ElementKind::Goal), element("S1", ElementKind::Strategy),
          element("G2", ElementKind::Goal), element("Sn1", ElementKind::Evidence) },
        { supported_by("G1", "S1"), supported_by("S1", "G2"), supported_by("G2", "Sn1") });
    const auto* single = find_code(r.warnings, DiagnosticCode::SingleChildStrategy);
    ASSERT_NE(single, nullptr);
    EXPECT_EQ(single->element_ids, std::vector<std::string>{ "S1" });
}

TEST(ValidatorTest, DanglingRelationsAreIgnored) {
    const ValidationResult r = gsn_analysis::validate(
        { element("G1", ElementKind::Goal), element("Sn1", ElementKind::Evidence) },
        { supported_by("G1", "Sn1"), supported_by("ghost", "G1"), supported_by("G1", "missing") });
    EXPECT_TRUE(r.is_valid);
    EXPECT_TRUE(r.warnings.empty());
}

TEST(ValidatorTest, CodeNamesAreFixedVocabulary) {
    EXPECT_EQ(gsn_analysis::code_name(DiagnosticCode::NoRootGoal), "NO_ROOT_GOAL");
    EXPECT_EQ(gsn_analysis::code_name(DiagnosticCode::MultipleRootGoals), "MULTIPLE_ROOT_GOALS");
    EXPECT_EQ(gsn_analysis::code_name(DiagnosticCode::CyclicReference), "CYCLIC_REFERENCE");
    EXPECT_EQ(gsn_analysis::code_name(DiagnosticCode::OrphanNodes), "ORPHAN_NODES");
    EXPECT_EQ(gsn_analysis::code_name(DiagnosticCode::UndevelopedGoals), "UNDEVELOPED_GOALS");
    EXPECT_EQ(gsn_analysis::code_name(DiagnosticCode::NoEvidencePath), "NO_EVIDENCE_PATH");
    EXPECT_EQ(gsn_analysis::code_name(DiagnosticCode::SingleChildStrategy), "SINGLE_CHILD_STRATEGY");
    EXPECT_EQ(gsn_analysis::severity_name(Severity::Error), "error");
    EXPECT_EQ(gsn_analysis::severity_name(Severity::Warning), "warning");
}

// is_valid must mirror the error list on arbitrary graphs, cycles and dangling links included.
TEST(ValidatorTest, ValidityMatchesErrorListOnRandomGraphs) {
    const ElementKind kinds[] = { ElementKind::Goal, ElementKind::Strategy, ElementKind::Context,
        ElementKind::Evidence, ElementKind::Assumption, ElementKind::Justification,
        ElementKind::Undeveloped, ElementKind::Module };
    for (unsigned seed = 0; seed < 200; ++seed) {
        std::mt19937 rng(seed);
        const int n = std::uniform_int_distribution<int>(0, 12)(rng);
        std::vector<gsn_model::Element> elements;
        for (int i = 0; i < n; ++i)
            elements.push_back(element("E" + std::to_string(i), kinds[rng() % 8]));
        std::vector<gsn_model::Relation> relations;
        const int m = std::uniform_int_distribution<int>(0, 2 * n + 1)(rng);
        for (int i = 0; i < m; ++i) {
            const std::string a = "E" + std::to_string(rng() % (n + 2));
            const std::string b = "E" + std::to_string(rng() % (n + 2));
            relations.push_back(rng() % 3 ? supported_by(a, b) : in_context_of(a, b));
        }
        const ValidationResult r = gsn_analysis::validate(elements, relations);
        EXPECT_EQ(r.is_valid, r.errors.empty()) << "seed " << seed;
        for (const auto& d : r.errors) EXPECT_EQ(d.severity, Severity::Error);
        for (const auto& d : r.warnings) EXPECT_EQ(d.severity, Severity::Warning);
    }
}
