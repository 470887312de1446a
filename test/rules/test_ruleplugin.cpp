#include <gtest/gtest.h>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "rules/ConventionalCommitsRule.hpp"
#include "rules/CustomizeRule.hpp"
#include "rules/JiraSmartRule.hpp"

using namespace czcheck;

class RulePluginTest : public ::testing::Test {
protected:
    ValidationOutcome validate(const std::string& msg,
                               const std::optional<std::string>& pattern,
                               bool allowAbort = false,
                               const std::vector<std::string>& prefixes = {"Merge", "Revert", "fixup!", "amend!"},
                               int maxLength = 0) {
        return rule.validateCommitMessage(msg, pattern, allowAbort, prefixes, maxLength);
    }

    std::optional<std::string> pattern() const { return rule.schemaPattern(); }

    Settings settings;
    ConventionalCommitsRule rule{settings};
};

// Test: Without a pattern every non-empty message passes, whatever its length
TEST_F(RulePluginTest, NoPatternAlwaysPasses) {
    for (const std::string msg : {"anything", "   ", "Merge x", "feat: ok", "x\ny"}) {
        auto out = validate(msg, std::nullopt, false, {}, 1);
        EXPECT_TRUE(out.passed) << msg;
        EXPECT_TRUE(out.reasons.empty());
    }
    EXPECT_TRUE(validate("", std::nullopt, true).passed);
}

// Test: Empty messages follow allowAbort, before any other check
TEST_F(RulePluginTest, EmptyMessageFollowsAllowAbort) {
    auto allowed = validate("", pattern(), true);
    EXPECT_TRUE(allowed.passed);
    EXPECT_TRUE(allowed.reasons.empty());

    auto rejected = validate("", pattern(), false);
    EXPECT_FALSE(rejected.passed);
    EXPECT_TRUE(rejected.reasons.empty());

    // Empty message never reaches the no-pattern shortcut
    EXPECT_FALSE(validate("", std::nullopt, false).passed);
}

// Test: Allowed prefixes win over both length and pattern
TEST_F(RulePluginTest, AllowedPrefixBeatsLengthAndPattern) {
    std::string longMerge = "Merge branch 'feature/a-very-long-branch-name-that-exceeds-the-limit' into main";
    auto out = validate(longMerge, pattern(), false, {"Merge"}, 10);
    EXPECT_TRUE(out.passed);
    EXPECT_TRUE(out.reasons.empty());

    EXPECT_TRUE(validate("fixup! feat: x", pattern()).passed);
    EXPECT_TRUE(validate("amend! whatever", pattern()).passed);
    EXPECT_TRUE(validate("Revert \"feat: x\"", pattern()).passed);
}

// Test: Prefix match is literal and case-sensitive
TEST_F(RulePluginTest, PrefixIsLiteral) {
    EXPECT_FALSE(validate("merge branch x", pattern(), false, {"Merge"}).passed);
    EXPECT_FALSE(validate(" Merge branch x", pattern(), false, {"Merge"}).passed);
}

// Test: Empty prefix list means no exemptions
TEST_F(RulePluginTest, NoPrefixesNoExemption) {
    EXPECT_FALSE(validate("Merge branch 'x'", pattern(), false, {}).passed);
}

// Test: Over-long first line fails even when the pattern matches
TEST_F(RulePluginTest, LengthLimitBeatsPattern) {
    std::string msg = "feat: this subject line is definitely longer than twenty characters";
    EXPECT_TRUE(validate(msg, pattern()).passed);
    auto out = validate(msg, pattern(), false, {}, 20);
    EXPECT_FALSE(out.passed);
    EXPECT_TRUE(out.reasons.empty());
}

// Test: Length counts only the trimmed first line
TEST_F(RulePluginTest, LengthUsesTrimmedFirstLine) {
    std::string msg = "feat: short   \n\nA body that is much longer than the configured limit of sixteen.";
    EXPECT_TRUE(validate(msg, pattern(), false, {}, 16).passed);
    EXPECT_FALSE(validate(msg, pattern(), false, {}, 10).passed);
}

// Test: Zero limit means unlimited
TEST_F(RulePluginTest, ZeroLengthIsUnlimited) {
    std::string msg = "feat: " + std::string(500, 'x');
    EXPECT_TRUE(validate(msg, pattern(), false, {}, 0).passed);
}

// Test: Length counts characters, not UTF-8 bytes
TEST_F(RulePluginTest, LengthCountsCharacters) {
    std::string subject = "feat: ";
    for (int i = 0; i < 10; ++i) subject += "\xC3\xA9";  // U+00E9
    ASSERT_EQ(subject.size(), 26u);
    EXPECT_TRUE(validate(subject, pattern(), false, {}, 16).passed);
    EXPECT_TRUE(validate(subject, pattern(), false, {}, 20).passed);
    EXPECT_FALSE(validate(subject, pattern(), false, {}, 15).passed);
}

// Test: A body of several hundred kilobytes is validated
TEST_F(RulePluginTest, VeryLongBody) {
    std::string msg = "feat: add x\n\n" + std::string(400000, 'a');
    auto out = validate(msg, pattern(), false, {});
    EXPECT_TRUE(out.passed);
    EXPECT_TRUE(out.reasons.empty());

    EXPECT_FALSE(validate("feat: add x\nbody" + std::string(400000, 'a'), pattern(), false, {}).passed);
}

// Test: An invalid pattern fails with a reason, and is reported by preparePattern
TEST_F(RulePluginTest, InvalidPattern) {
    auto prepared = rule.preparePattern(std::string("(feat"));
    ASSERT_FALSE(prepared.has_value());
    EXPECT_EQ(prepared.error().code, ErrorCode::InvalidConfiguration);

    auto out = validate("feat: x", std::string("(feat"), false, {});
    EXPECT_FALSE(out.passed);
    ASSERT_EQ(out.reasons.size(), 1u);
    EXPECT_NE(out.reasons[0].find("(feat"), std::string::npos);

    EXPECT_TRUE(rule.preparePattern(std::nullopt).has_value());
    EXPECT_TRUE(rule.preparePattern(pattern()).has_value());
}

// Test: Switching patterns on one rule recompiles
TEST_F(RulePluginTest, PatternChangeRecompiles) {
    EXPECT_TRUE(validate("feat: x", pattern(), false, {}).passed);
    EXPECT_FALSE(validate("feat: x", std::string("fix: .*"), false, {}).passed);
    EXPECT_TRUE(validate("fix: y", std::string("fix: .*"), false, {}).passed);
    EXPECT_TRUE(validate("feat: x", pattern(), false, {}).passed);
}

// Test: Conventional commits grammar
TEST_F(RulePluginTest, ConventionalCommitsPattern) {
    const char* valid[] = {
        "feat: add x",
        "fix(parser): handle empty input",
        "refactor!: drop python 2",
        "feat(api)!: remove v1 endpoints\n\nBREAKING CHANGE: v1 is gone",
        "docs: update readme\n\nLonger text\nover lines",
        "bump: version 1.0.0 → 1.1.0",
        "chore: tidy\n",
    };
    for (const char* msg : valid) {
        EXPECT_TRUE(validate(msg, pattern(), false, {}).passed) << msg;
    }
    const char* invalid[] = {
        "bad message",
        "feat:missing space",
        "Feat: capitalised type",
        "feature: unknown type",
        "feat(): empty scope",
        "feat: subject\nbody without blank line",
        "random text",
    };
    for (const char* msg : invalid) {
        EXPECT_FALSE(validate(msg, pattern(), false, {}).passed) << msg;
    }
}

// Test: Failure report lists revision, message and pattern
TEST_F(RulePluginTest, FailureReportFormat) {
    std::vector<FailedCommit> failures{
        {CommitRecord("abc1234", "bad message", ""), {}},
        {CommitRecord("", "", "random text"), {"commit message does not match pattern"}},
    };
    std::string report = rule.formatFailureReport(failures);
    EXPECT_EQ(report.rfind("commit validation: failed!\n", 0), 0u);
    EXPECT_NE(report.find("commit \"abc1234\": \"bad message\"\n"), std::string::npos);
    EXPECT_NE(report.find("commit \"\": \"random text\"\nerrors:\n- commit message does not match pattern\n"),
              std::string::npos);
    EXPECT_NE(report.find("pattern: " + *pattern()), std::string::npos);
}

// Test: Jira smart commits
TEST(JiraSmartRuleTest, Pattern) {
    Settings settings;
    JiraSmartRule rule{settings};
    auto p = rule.schemaPattern();
    ASSERT_TRUE(p.has_value());
    EXPECT_TRUE(rule.validateCommitMessage("JRA-34 #comment corrected indent issue", p, false, {}, 0).passed);
    EXPECT_TRUE(rule.validateCommitMessage("Fixed it for ABC-123 #time 1h", p, false, {}, 0).passed);
    EXPECT_FALSE(rule.validateCommitMessage("JRA-34 corrected indent issue", p, false, {}, 0).passed);
    EXPECT_FALSE(rule.validateCommitMessage("fix: no issue key #comment", p, false, {}, 0).passed);
    EXPECT_TRUE(rule.example().has_value());
}

// Test: cz_customize needs its config table
TEST(CustomizeRuleTest, RequiresCustomizeTable) {
    Settings settings;
    auto res = CustomizeRule::create(settings);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::MissingCustomizeConfig);
}

// Test: cz_customize uses the configured Python-style pattern
TEST(CustomizeRuleTest, UsesConfiguredPattern) {
    Settings settings;
    CustomizeSettings custom;
    custom.schemaPattern = "(?P<issue>[A-Z]{3}-\\d+): (?P<subject>.*)$";
    custom.example = "ABC-123: fix login";
    settings.customize = custom;

    auto res = CustomizeRule::create(settings);
    ASSERT_TRUE(res.has_value()) << res.error().message;
    const RulePlugin& rule = *res.value();
    EXPECT_STREQ(rule.name(), "cz_customize");
    auto p = rule.schemaPattern();
    EXPECT_TRUE(rule.validateCommitMessage("ABC-123: fix login", p, false, {}, 0).passed);
    EXPECT_FALSE(rule.validateCommitMessage("fix login", p, false, {}, 0).passed);
    EXPECT_EQ(rule.example().value_or(""), "ABC-123: fix login");
    EXPECT_FALSE(rule.schema().has_value());
}

// Test: cz_customize without a pattern only rejects empty messages
TEST(CustomizeRuleTest, NoPatternOnlyRejectsEmpty) {
    Settings settings;
    settings.customize = CustomizeSettings{};
    auto res = CustomizeRule::create(settings);
    ASSERT_TRUE(res.has_value());
    const RulePlugin& rule = *res.value();
    auto p = rule.schemaPattern();
    EXPECT_FALSE(p.has_value());
    EXPECT_TRUE(rule.validateCommitMessage("whatever you like", p, false, {}, 0).passed);
    EXPECT_FALSE(rule.validateCommitMessage("", p, false, {}, 0).passed);
    EXPECT_TRUE(rule.validateCommitMessage("", p, true, {}, 0).passed);
}

namespace {

std::unique_ptr<RulePlugin> customizeWith(const std::string& schemaPattern) {
    Settings settings;
    CustomizeSettings custom;
    custom.schemaPattern = schemaPattern;
    settings.customize = custom;
    auto res = CustomizeRule::create(settings);
    EXPECT_TRUE(res.has_value());
    return res ? std::move(res.value()) : nullptr;
}

}

// Test: Inline flags in a configured pattern
TEST(CustomizeRuleTest, InlineFlags) {
    auto caseless = customizeWith("(?i)(feat|fix): \\w+");
    ASSERT_NE(caseless, nullptr);
    auto p = caseless->schemaPattern();
    EXPECT_TRUE(caseless->validateCommitMessage("FEAT: Add", p, false, {}, 0).passed);
    EXPECT_TRUE(caseless->validateCommitMessage("Fix: typo", p, false, {}, 0).passed);

    auto dotAll = customizeWith("[A-Z]+-\\d+ (?s).*done$");
    ASSERT_NE(dotAll, nullptr);
    p = dotAll->schemaPattern();
    EXPECT_TRUE(dotAll->validateCommitMessage("AB-1 work\n\nnow done", p, false, {}, 0).passed);
    EXPECT_FALSE(dotAll->validateCommitMessage("AB-1 work\n\nnot yet", p, false, {}, 0).passed);

    auto multiline = customizeWith("(?m)^Refs: \\d+$");
    ASSERT_NE(multiline, nullptr);
    p = multiline->schemaPattern();
    EXPECT_TRUE(multiline->validateCommitMessage("Refs: 12\nextra", p, false, {}, 0).passed);
}
