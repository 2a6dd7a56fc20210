#include "vcs/GitDriver.hpp"
#include "TestEnv.hpp"

#include <gtest/gtest.h>

using lnk::error::Kind;
using lnk::test::git;
using lnk::test::writeFile;
using lnk::vcs::GitDriver;

class GitDriverTest : public lnk::test::LnkTest {
protected:
    [[nodiscard]] std::string headBranch() const {
        auto out = git({"symbolic-ref", "--short", "HEAD"}, repo).output;
        while (!out.empty() && out.back() == '\n') out.pop_back();
        return out;
    }

    [[nodiscard]] bool tracked(const std::string& rel) const {
        return git({"ls-files", "--error-unmatch", "--", rel}, repo).ok();
    }
};

TEST_F(GitDriverTest, InitUsesDefaultBranch) {
    EXPECT_FALSE(git_->isRepository());
    git_->init();
    EXPECT_TRUE(git_->isRepository());
    EXPECT_EQ(headBranch(), "main");
    EXPECT_TRUE(git_->getCommits().empty());
    EXPECT_FALSE(git_->hasChanges());
}

TEST_F(GitDriverTest, CommitsAreListedNewestFirst) {
    git_->init();
    writeFile(repo / "a", "a");
    git_->add("a");
    git_->commit("lnk: first");
    writeFile(repo / "b", "b");
    git_->add(repo / "b");
    git_->commit("lnk: second");

    EXPECT_EQ(git_->getCommits(), (std::vector<std::string>{"lnk: second", "lnk: first"}));
    EXPECT_TRUE(git_->isManagedRepository());
}

TEST_F(GitDriverTest, ForeignCommitMakesRepositoryUnmanaged) {
    git_->init();
    EXPECT_TRUE(git_->isManagedRepository());

    writeFile(repo / "a", "a");
    git_->add("a");
    git_->commit("initial import");
    EXPECT_FALSE(git_->isManagedRepository());
}

TEST_F(GitDriverTest, RmOnlyUnstages) {
    git_->init();
    writeFile(repo / "dir" / "x", "x");
    writeFile(repo / "f", "f");
    git_->add("dir");
    git_->add("f");
    git_->commit("lnk: add");

    git_->rm("f");
    git_->rm("dir");

    EXPECT_FALSE(tracked("f"));
    EXPECT_FALSE(tracked("dir/x"));
    EXPECT_TRUE(std::filesystem::exists(repo / "f"));
    EXPECT_TRUE(std::filesystem::exists(repo / "dir" / "x"));
}

TEST_F(GitDriverTest, HasChangesSeesUntrackedFiles) {
    git_->init();
    writeFile(repo / "new", "n");
    EXPECT_TRUE(git_->hasChanges());
    git_->addAll();
    git_->commit("lnk: all");
    EXPECT_FALSE(git_->hasChanges());
}

TEST_F(GitDriverTest, AddRemoteIsIdempotentForSameUrl) {
    git_->init();
    EXPECT_EQ(git_->getRemoteUrl("origin"), std::nullopt);

    git_->addRemote("origin", "https://example.invalid/dotfiles.git");
    EXPECT_NO_THROW(git_->addRemote("origin", "https://example.invalid/dotfiles.git"));
    EXPECT_EQ(git_->getRemoteUrl("origin"), std::optional<std::string>("https://example.invalid/dotfiles.git"));

    EXPECT_LNK_ERROR(git_->addRemote("origin", "https://example.invalid/other.git"), Kind::Vcs);
}

TEST_F(GitDriverTest, FailuresCarryOperationAndOutput) {
    git_->init();
    try {
        git_->commit("lnk: nothing staged");
        FAIL() << "commit without changes should fail";
    } catch (const lnk::Error& e) {
        EXPECT_EQ(e.kind(), Kind::Vcs);
        EXPECT_EQ(e.operation(), "commit");
        EXPECT_FALSE(e.output().empty());
    }
}

TEST_F(GitDriverTest, PushWithoutRemoteFails) {
    git_->init();
    EXPECT_LNK_ERROR(git_->push(), Kind::Vcs);
    EXPECT_LNK_ERROR(git_->pull(), Kind::Vcs);
}

TEST_F(GitDriverTest, MissingBinaryIsReported) {
    lnk::config::GitConfig cfg;
    cfg.binary = "/nonexistent/git-binary";
    GitDriver broken(repo, cfg);
    std::filesystem::create_directories(repo);
    EXPECT_LNK_ERROR(broken.addAll(), Kind::Vcs);
}

TEST_F(GitDriverTest, MissingRepositoryDirectoryIsNotReportedAsMissingGit) {
    GitDriver absent(root / "absent");
    try {
        absent.addAll();
        FAIL() << "git in a missing directory should fail";
    } catch (const lnk::Error& e) {
        EXPECT_EQ(e.kind(), Kind::Vcs);
        EXPECT_NE(e.output().find("cannot change directory"), std::string::npos) << e.output();
        EXPECT_EQ(e.suggestion().find("installed"), std::string::npos);
    }
}

TEST_F(GitDriverTest, CloneReplacesDirectory) {
    const auto source = root / "source";
    GitDriver upstream(source);
    upstream.init();
    writeFile(source / ".lnk", ".bashrc\n");
    writeFile(source / ".bashrc", "X");
    upstream.addAll();
    upstream.commit("lnk: seed");

    writeFile(repo / "stale", "s");
    git_->clone(source.string());

    EXPECT_FALSE(std::filesystem::exists(repo / "stale"));
    EXPECT_TRUE(std::filesystem::exists(repo / ".bashrc"));
    EXPECT_EQ(git_->getCommits(), std::vector<std::string>{"lnk: seed"});
    EXPECT_EQ(git_->getRemoteUrl("origin"), std::optional<std::string>(source.string()));

    const auto st = git_->status();
    EXPECT_EQ(st.remote, "origin/main");
    EXPECT_EQ(st.ahead, 0);
    EXPECT_EQ(st.behind, 0);
}
