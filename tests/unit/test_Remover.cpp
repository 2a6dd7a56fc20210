#include "core/Remover.hpp"
#include "TestEnv.hpp"

#include <gtest/gtest.h>

using lnk::error::Kind;
using lnk::test::FailingDriver;
using lnk::test::LnkTest;
using lnk::test::readFile;

class RemoverTest : public LnkTest {};

TEST_F(RemoverTest, AddThenRemoveRestoresRegularFile) {
    const auto lnk = initLnk();
    const auto bashrc = homeFile(".bashrc", "X");

    lnk.add(bashrc);
    ASSERT_TRUE(std::filesystem::is_symlink(bashrc));
    EXPECT_EQ(tracking(), ".bashrc\n");

    lnk.remove(bashrc);

    EXPECT_FALSE(std::filesystem::is_symlink(bashrc));
    EXPECT_TRUE(std::filesystem::is_regular_file(bashrc));
    EXPECT_EQ(readFile(bashrc), "X");
    EXPECT_FALSE(std::filesystem::exists(repo / ".bashrc"));
    EXPECT_EQ(tracking(), "");

    const auto log = commits();
    ASSERT_EQ(log.size(), 2u);
    EXPECT_EQ(log[0], "lnk: removed .bashrc");
    EXPECT_EQ(log[1], "lnk: added .bashrc");
    EXPECT_FALSE(git_->hasChanges());
}

TEST_F(RemoverTest, RoundTripKeepsMode) {
    const auto lnk = initLnk();
    const auto script = homeFile("bin/tool", "#!/bin/sh\n");
    const auto mode = std::filesystem::perms::owner_all | std::filesystem::perms::group_read;
    std::filesystem::permissions(script, mode);

    lnk.add(script);
    lnk.remove(script);

    EXPECT_EQ(std::filesystem::symlink_status(script).permissions() & std::filesystem::perms::all, mode);
    EXPECT_EQ(readFile(script), "#!/bin/sh\n");
}

TEST_F(RemoverTest, RemoveDirectoryEntry) {
    const auto lnk = initLnk();
    homeFile(".config/fish/config.fish", "set -x A 1\n");
    homeFile(".config/fish/functions/f.fish", "function f; end\n");
    const auto dir = home / ".config" / "fish";

    lnk.add(dir);
    lnk.remove(dir);

    EXPECT_TRUE(std::filesystem::is_directory(std::filesystem::symlink_status(dir)));
    EXPECT_EQ(readFile(dir / "functions" / "f.fish"), "function f; end\n");
    EXPECT_EQ(commits().front(), "lnk: removed fish");
    EXPECT_FALSE(git_->hasChanges());
}

TEST_F(RemoverTest, RejectsPathsNotManaged) {
    const auto lnk = initLnk();

    EXPECT_LNK_ERROR(lnk.remove(homeFile(".plain", "x")), Kind::NotManaged);

    std::filesystem::create_symlink(home / ".plain", home / ".elsewhere");
    EXPECT_LNK_ERROR(lnk.remove(home / ".elsewhere"), Kind::NotManaged);

    // points into the repository but was never tracked
    lnk::test::writeFile(repo / "stray", "s");
    std::filesystem::create_symlink(repo / "stray", home / "stray");
    EXPECT_LNK_ERROR(lnk.remove(home / "stray"), Kind::NotManaged);

    EXPECT_TRUE(commits().empty());
}

TEST_F(RemoverTest, FileOutsideHomeReturnsToOriginalLocation) {
    const auto lnk = initLnk();
    const auto outside = root / "etc" / "foo";
    lnk::test::writeFile(outside, "foo=1\n");

    lnk.add(outside);
    ASSERT_TRUE(std::filesystem::is_symlink(outside));
    lnk.remove(outside);

    EXPECT_TRUE(std::filesystem::is_regular_file(std::filesystem::symlink_status(outside)));
    EXPECT_EQ(readFile(outside), "foo=1\n");
    EXPECT_EQ(tracking(), "");
}

TEST_F(RemoverTest, ForceRemoveAfterLinkDeleted) {
    const auto lnk = initLnk();
    const auto bashrc = homeFile(".bashrc", "X");
    lnk.add(bashrc);

    std::filesystem::remove(bashrc);
    EXPECT_LNK_ERROR(lnk.remove(bashrc), Kind::NotManaged);

    lnk.removeForce(bashrc);

    EXPECT_FALSE(std::filesystem::exists(std::filesystem::symlink_status(bashrc)));
    EXPECT_FALSE(std::filesystem::exists(repo / ".bashrc"));
    EXPECT_EQ(tracking(), "");
    EXPECT_EQ(commits().front(), "lnk: force removed .bashrc");
    EXPECT_FALSE(git_->hasChanges());
}

TEST_F(RemoverTest, ForceRemoveHostEntryDeletesHostStorage) {
    initLnk();
    const auto work = makeLnk("work");
    const auto gitconfig = homeFile(".gitconfig", "Y");
    work.add(gitconfig);

    work.removeForce(gitconfig);

    EXPECT_FALSE(std::filesystem::exists(std::filesystem::symlink_status(gitconfig)));
    EXPECT_FALSE(std::filesystem::exists(repo / "work.lnk" / ".gitconfig"));
    EXPECT_EQ(tracking(".lnk.work"), "");
}

TEST_F(RemoverTest, ForceRemoveRequiresTrackedEntry) {
    const auto lnk = initLnk();
    EXPECT_LNK_ERROR(lnk.removeForce(home / ".never"), Kind::NotManaged);
}

TEST_F(RemoverTest, CommitFailureLeavesEntryManaged) {
    const auto lnk = initLnk();
    const auto bashrc = homeFile(".bashrc", "X");
    lnk.add(bashrc);
    const auto before = commits();

    const auto failing = makeLnk({}, std::make_shared<FailingDriver>(git_, "commit"));
    EXPECT_LNK_ERROR(failing.remove(bashrc), Kind::Vcs);

    EXPECT_TRUE(std::filesystem::is_symlink(bashrc));
    EXPECT_EQ(readFile(bashrc), "X");
    EXPECT_EQ(tracking(), ".bashrc\n");
    EXPECT_EQ(commits(), before);
    EXPECT_FALSE(git_->hasChanges());

    lnk.remove(bashrc);
    EXPECT_EQ(commits().front(), "lnk: removed .bashrc");
}
