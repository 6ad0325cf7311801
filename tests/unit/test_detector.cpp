#include <string>
#include <gtest/gtest.h>
#include "core/errors/guard_errors.hpp"
#include "policy/detector.hpp"

namespace {

using prompt_guard::core::errors::get_error;
using prompt_guard::core::errors::get_value;
using prompt_guard::core::errors::is_error;
using prompt_guard::policy::CaseMode;
using prompt_guard::policy::CompiledRule;
using prompt_guard::policy::Detector;
using prompt_guard::policy::DetectorSpec;
using prompt_guard::policy::PatternSpec;
using prompt_guard::policy::RuleKind;
using prompt_guard::policy::PatternRule;

CompiledRule compile_rule(const PatternRule& spec) {
    auto result = CompiledRule::compile(spec);
    EXPECT_FALSE(is_error(result));
    return get_value(result);
}

TEST(DetectorTest, SingleRuleRespectsCaseMode) {
    const auto sensitive = compile_rule(
        PatternRule{RuleKind::Single, PatternSpec{"AKIA", CaseMode::Sensitive}, std::nullopt});
    const auto insensitive = compile_rule(
        PatternRule{RuleKind::Single, PatternSpec{"akia", CaseMode::Insensitive}, std::nullopt});

    EXPECT_TRUE(sensitive.matches("xxAKIAxx"));
    EXPECT_FALSE(sensitive.matches("xxakiaxx"));
    EXPECT_TRUE(insensitive.matches("xxAkIaxx"));
}

TEST(DetectorTest, OrderedRuleRequiresFollowAfterLead) {
    const auto rule = compile_rule(PatternRule{RuleKind::Ordered,
                                               PatternSpec{"user=", CaseMode::Sensitive},
                                               PatternSpec{"pass=", CaseMode::Sensitive}});

    EXPECT_TRUE(rule.matches("user=a\n\n\npass=b"));
    EXPECT_FALSE(rule.matches("pass=b user=a"));
    EXPECT_FALSE(rule.matches("user=a only"));
}

TEST(DetectorTest, OrderedRuleDoesNotReuseLeadText) {
    // "a=" must begin after the end of the first lead match.
    const auto rule = compile_rule(PatternRule{RuleKind::Ordered,
                                               PatternSpec{"xa=", CaseMode::Sensitive},
                                               PatternSpec{"a=", CaseMode::Sensitive}});

    EXPECT_FALSE(rule.matches("xa="));
    EXPECT_TRUE(rule.matches("xa=a="));
}

TEST(DetectorTest, CoOccurringRuleIgnoresOrder) {
    const auto rule = compile_rule(PatternRule{RuleKind::CoOccurring,
                                               PatternSpec{"alpha", CaseMode::Sensitive},
                                               PatternSpec{"beta", CaseMode::Sensitive}});

    EXPECT_TRUE(rule.matches("beta then alpha"));
    EXPECT_TRUE(rule.matches("alpha then beta"));
    EXPECT_FALSE(rule.matches("alpha alone"));
}

TEST(DetectorTest, RejectsInvalidPattern) {
    auto result = CompiledRule::compile(
        PatternRule{RuleKind::Single, PatternSpec{"([a-z", CaseMode::Sensitive}, std::nullopt});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "pattern_compile_failed");
}

TEST(DetectorTest, RejectsPairRuleWithoutSecondPattern) {
    auto result = CompiledRule::compile(
        PatternRule{RuleKind::Ordered, PatternSpec{"a", CaseMode::Sensitive}, std::nullopt});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "incomplete_rule");
}

TEST(DetectorTest, MatchesWhenAnyRuleMatches) {
    DetectorSpec spec{"sample",
                      {PatternRule{RuleKind::Single, PatternSpec{"foo", CaseMode::Sensitive}, std::nullopt},
                       PatternRule{RuleKind::Single, PatternSpec{"bar", CaseMode::Sensitive}, std::nullopt}},
                      "sample warning"};
    auto result = Detector::compile(spec);
    ASSERT_FALSE(is_error(result));

    const auto& detector = get_value(result);
    EXPECT_EQ(detector.id(), "sample");
    EXPECT_EQ(detector.warning(), "sample warning");
    EXPECT_EQ(detector.rule_count(), 2u);
    EXPECT_TRUE(detector.matches("xxbarxx"));
    EXPECT_TRUE(detector.matches("foo"));
    EXPECT_FALSE(detector.matches("baz"));
}

TEST(DetectorTest, RejectsDetectorWithoutRules) {
    auto result = Detector::compile(DetectorSpec{"empty", {}, "warning"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_detector");
}

TEST(DetectorTest, CompileErrorNamesDetector) {
    auto result = Detector::compile(DetectorSpec{
        "broken",
        {PatternRule{RuleKind::Single, PatternSpec{"[", CaseMode::Sensitive}, std::nullopt}},
        "warning"});
    ASSERT_TRUE(is_error(result));
    EXPECT_NE(get_error(result).message.find("broken"), std::string::npos);
}

}  // namespace
