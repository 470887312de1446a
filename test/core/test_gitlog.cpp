#include <gtest/gtest.h>
#include <string>

#include "core/CommitRecord.hpp"
#include "core/GitLog.hpp"

using namespace czcheck;

namespace {
const std::string DELIM = "----------commit-delimiter----------";
}

// Test: Records carry hash, subject and body
TEST(GitLogParseTest, ParsesCommits) {
    std::string out =
        "1111111111111111111111111111111111111111\n"
        "feat: add login\n"
        "Adds the login form.\n"
        "\n"
        "Refs: #3\n" + DELIM + "\n"
        "2222222222222222222222222222222222222222\n"
        "fix: typo\n" + DELIM + "\n";

    auto commits = GitCliLog::parseLog(out);
    ASSERT_EQ(commits.size(), 2u);

    EXPECT_EQ(commits[0].revision(), "1111111111111111111111111111111111111111");
    EXPECT_EQ(commits[0].title(), "feat: add login");
    EXPECT_EQ(commits[0].body(), "Adds the login form.\n\nRefs: #3");
    EXPECT_EQ(commits[0].message(), "feat: add login\n\nAdds the login form.\n\nRefs: #3");

    EXPECT_EQ(commits[1].revision(), "2222222222222222222222222222222222222222");
    EXPECT_EQ(commits[1].title(), "fix: typo");
    EXPECT_EQ(commits[1].body(), "");
    EXPECT_EQ(commits[1].message(), "fix: typo");
}

// Test: Empty output yields no commits
TEST(GitLogParseTest, EmptyOutput) {
    EXPECT_TRUE(GitCliLog::parseLog("").empty());
    EXPECT_TRUE(GitCliLog::parseLog("\n").empty());
}

// Test: The short revision is the first seven characters
TEST(GitLogParseTest, ShortRevision) {
    CommitRecord c("abcdef0123456789", "feat: x", "");
    EXPECT_EQ(c.shortRevision(), "abcdef0");
    CommitRecord synthetic("", "", "feat: x");
    EXPECT_EQ(synthetic.shortRevision(), "");
    EXPECT_EQ(synthetic.message(), "feat: x");
}
