#include <gtest/gtest.h>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "test_utils.hpp"
#include "cli/CommandFactory.hpp"
#include "cli/CommandInvoker.hpp"
#include "cli/ExitCode.hpp"
#include "core/GitLog.hpp"

namespace fs = std::filesystem;

namespace czcheck::test {

using namespace czcheck::test::utils;

/**
 * @brief End-to-end checks against a real git repository
 *
 * Commands are created through the factory and run through the invoker
 * the same way main.cpp runs them, with only stdin and output faked.
 */
class CheckWorkflowTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (!gitAvailable()) {
            GTEST_SKIP() << "git is not installed";
        }
        repo = createTempDir();
        initGitRepo(repo);

        output = std::make_shared<RecordingOutput>();
        ctx.cwd = repo;
        ctx.gitLog = std::make_shared<GitCliLog>(repo);
        ctx.input = std::make_shared<FakeInput>(true);
        ctx.output = output;
    }

    void TearDown() override {
        if (!repo.empty()) removeDir(repo);
    }

    Expected<void> run(const std::string& name, const std::vector<std::string>& args) {
        auto cmd = CommandFactory::instance().create(name);
        if (!cmd) return Error{ErrorCode::InternalError, "command not registered: " + name};
        CommandInvoker invoker;
        return invoker.invoke(*cmd, ctx, args);
    }

    int exitStatus(const Expected<void>& res) {
        return res ? ExitCode::SUCCESS : ExitCode::forError(res.error().code);
    }

    fs::path repo;
    AppContext ctx;
    std::shared_ptr<RecordingOutput> output;
};

// Test: Every commit in a clean history passes
TEST_F(CheckWorkflowTest, CleanHistoryPasses) {
    commitFile(repo, "a.txt", "feat: first feature");
    commitFile(repo, "b.txt", "fix(core): repair the second thing");
    commitFile(repo, "c.txt", "Merge branch 'topic'");

    auto res = run("check", {"--rev-range", "HEAD~2..HEAD"});
    ASSERT_TRUE(res.has_value()) << res.error().message;
    ASSERT_EQ(output->messages.size(), 1u);
    EXPECT_EQ(output->messages[0], "Commit validation: successful!");
}

// Test: Only the bad commit of a range is reported, by full hash
TEST_F(CheckWorkflowTest, BadCommitInRange) {
    commitFile(repo, "a.txt", "chore: initial");
    commitFile(repo, "b.txt", "feat: good one");
    commitFile(repo, "c.txt", "did some stuff");
    std::string badHash = runGit(repo, {"rev-parse", "HEAD"});
    badHash = badHash.substr(0, badHash.find('\n'));

    auto res = run("check", {"--rev-range=HEAD~2..HEAD"});
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(exitStatus(res), ExitCode::INVALID_COMMIT_MSG);
    const std::string& report = res.error().message;
    EXPECT_NE(report.find("commit \"" + badHash + "\": \"did some stuff\""), std::string::npos);
    EXPECT_EQ(report.find("feat: good one"), std::string::npos);
    EXPECT_TRUE(output->messages.empty());
    ASSERT_EQ(output->failures.size(), 1u);
    EXPECT_EQ(output->failures[0], report);
}

// Test: Bodies pass through and only subjects are length-limited
TEST_F(CheckWorkflowTest, RangeWithBodies) {
    commitFile(repo, "a.txt", "feat: subject\n\nA proper body.");
    EXPECT_TRUE(run("check", {"--rev-range", "HEAD"}).has_value());

    commitFile(repo, "b.txt", "feat: " + std::string(60, 'x') + "\n\nshort body");
    EXPECT_TRUE(run("check", {"--rev-range", "HEAD~1..HEAD"}).has_value());
    // Only the subject line counts towards the limit
    EXPECT_FALSE(run("check", {"--rev-range", "HEAD~1..HEAD", "-l", "50"}).has_value());
    EXPECT_TRUE(run("check", {"--rev-range", "HEAD~1", "-l", "50"}).has_value());
}

// Test: A range with no commits exits with NoCommitsFound
TEST_F(CheckWorkflowTest, EmptyRange) {
    commitFile(repo, "a.txt", "feat: only");
    auto res = run("check", {"--rev-range", "HEAD..HEAD"});
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(exitStatus(res), ExitCode::NO_COMMITS_FOUND);
    EXPECT_NE(res.error().message.find("'HEAD..HEAD'"), std::string::npos);
}

// Test: An unknown revision is a git error
TEST_F(CheckWorkflowTest, UnknownRevision) {
    commitFile(repo, "a.txt", "feat: only");
    auto res = run("check", {"--rev-range", "no-such-branch..HEAD"});
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(exitStatus(res), ExitCode::GIT_COMMAND_ERROR);
}

// Test: Listing a repository without commits yields no commits
TEST_F(CheckWorkflowTest, RepositoryWithoutCommits) {
    GitCliLog log(repo);
    auto res = log.getCommits(std::nullopt);
    ASSERT_TRUE(res.has_value()) << res.error().message;
    EXPECT_TRUE(res.value().empty());
}

// Test: The commit-msg hook flow with a verbose editor file
TEST_F(CheckWorkflowTest, CommitMsgHookFile) {
    fs::path msg = createFile(repo, ".git/COMMIT_EDITMSG",
                              "docs: explain the hook\n"
                              "\n"
                              "# Please enter the commit message for your changes. Lines starting\n"
                              "# with '#' will be ignored.\n"
                              "# ------------------------ >8 ------------------------\n"
                              "# Do not modify or remove the line above.\n"
                              "diff --git a/README b/README\n"
                              "+random text\n");
    EXPECT_TRUE(run("check", {"--commit-msg-file", msg.string()}).has_value());

    auto missing = run("check", {"--commit-msg-file", (repo / "nope").string()});
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(exitStatus(missing), ExitCode::IO_ERROR);
}

// Test: A config file in the repository selects the rule set
TEST_F(CheckWorkflowTest, RepositoryConfigSelectsRuleSet) {
    createFile(repo, "pyproject.toml", "[tool.commitizen]\nname = \"cz_jira\"\n");
    commitFile(repo, "a.txt", "PROJ-7 #close fixed the thing");
    EXPECT_TRUE(run("check", {"--rev-range", "HEAD"}).has_value());

    auto res = run("check", {"-m", "feat: conventional but not jira"});
    ASSERT_FALSE(res.has_value());
    EXPECT_NE(res.error().message.find("cz_jira"), std::string::npos);
}

// Test: Exit statuses for every failure kind
TEST(ExitCodeTest, ForError) {
    EXPECT_EQ(ExitCode::forError(ErrorCode::NoRuleSetFound), 1);
    EXPECT_EQ(ExitCode::forError(ErrorCode::NoCommitsFound), 3);
    EXPECT_EQ(ExitCode::forError(ErrorCode::InvalidCommitMessage), 14);
    EXPECT_EQ(ExitCode::forError(ErrorCode::MissingCustomizeConfig), 15);
    EXPECT_EQ(ExitCode::forError(ErrorCode::InvalidCommandArgument), 18);
    EXPECT_EQ(ExitCode::forError(ErrorCode::InvalidConfiguration), 19);
    EXPECT_EQ(ExitCode::forError(ErrorCode::UnrecognizedEncoding), 22);
    EXPECT_EQ(ExitCode::forError(ErrorCode::GitCommandError), 23);
    EXPECT_EQ(ExitCode::forError(ErrorCode::ConfigFileNotFound), 30);
    EXPECT_EQ(ExitCode::forError(ErrorCode::IoError), 31);
}

}  // namespace czcheck::test
