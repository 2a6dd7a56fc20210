#include "core/Restorer.hpp"
#include "TestEnv.hpp"

#include <gtest/gtest.h>

using lnk::test::LnkTest;
using lnk::test::canonical;
using lnk::test::readFile;
using lnk::test::writeFile;

class RestorerTest : public LnkTest {};

TEST_F(RestorerTest, LinksEntriesPopulatedByPull) {
    const auto lnk = initLnk();
    writeFile(repo / ".bashrc", "X");
    writeFile(repo / ".lnk", ".bashrc\n");

    EXPECT_EQ(lnk.restoreSymlinks(), std::vector<std::string>{".bashrc"});

    const auto link = home / ".bashrc";
    ASSERT_TRUE(std::filesystem::is_symlink(link));
    EXPECT_TRUE(std::filesystem::read_symlink(link).is_relative());
    EXPECT_EQ(lnk::test::canonical(link), lnk::test::canonical(repo / ".bashrc"));
    EXPECT_EQ(readFile(link), "X");

    EXPECT_TRUE(lnk.restoreSymlinks().empty());
}

TEST_F(RestorerTest, CreatesParentsAndReplacesWrongItems) {
    const auto lnk = initLnk();
    writeFile(repo / ".config" / "git" / "config", "[core]\n");
    writeFile(repo / ".local" / "share" / "app" / "state", "s");
    writeFile(repo / ".vimrc", "set nu\n");
    writeFile(repo / ".lnk", ".config/git/config\n.local/share/app/state\n.vimrc\n");

    // a local copy and a stale link stand where the links belong
    homeFile(".vimrc", "local");
    writeFile(root / "old", "old");
    std::filesystem::create_directories(home / ".config" / "git");
    std::filesystem::create_symlink(root / "old", home / ".config" / "git" / "config");

    const auto restored = lnk.restoreSymlinks();

    EXPECT_EQ(restored, (std::vector<std::string>{".config/git/config", ".local/share/app/state", ".vimrc"}));
    EXPECT_TRUE(std::filesystem::is_symlink(home / ".vimrc"));
    EXPECT_EQ(readFile(home / ".vimrc"), "set nu\n");
    EXPECT_EQ(readFile(home / ".config" / "git" / "config"), "[core]\n");
    EXPECT_TRUE(std::filesystem::is_directory(std::filesystem::symlink_status(home / ".local" / "share" / "app")));
    EXPECT_TRUE(std::filesystem::is_symlink(home / ".local" / "share" / "app" / "state"));
    // the stale link target itself is untouched
    EXPECT_EQ(readFile(root / "old"), "old");
}

TEST_F(RestorerTest, SkipsMissingAndMalformedEntries) {
    const auto lnk = initLnk();
    writeFile(repo / ".lnk", "../../etc/passwd\n.missing\n");

    EXPECT_TRUE(lnk.restoreSymlinks().empty());
    EXPECT_FALSE(std::filesystem::exists(std::filesystem::symlink_status(home / ".missing")));
}

TEST_F(RestorerTest, StorageRootEntryLeavesHomeIntact) {
    const auto lnk = initLnk();
    writeFile(home / "precious" / "thesis.txt", "T");
    writeFile(repo / ".bashrc", "X");
    writeFile(repo / ".lnk", ".\nfoo/..\n.bashrc\n");

    EXPECT_EQ(lnk.restoreSymlinks(), std::vector<std::string>{".bashrc"});
    EXPECT_EQ(readFile(home / "precious" / "thesis.txt"), "T");
    EXPECT_TRUE(std::filesystem::is_directory(repo / ".git"));
}

TEST_F(RestorerTest, RefusesToReplaceRepositoryAncestor) {
    const auto lnk = initLnk();
    writeFile(repo / ".config" / "x", "x");
    writeFile(repo / ".lnk", ".config\n");

    EXPECT_TRUE(lnk.restoreSymlinks().empty());
    EXPECT_FALSE(std::filesystem::is_symlink(home / ".config"));
    EXPECT_TRUE(std::filesystem::is_directory(repo / ".git"));
}

TEST_F(RestorerTest, HostProfileLinksFromHostStorage) {
    initLnk();
    const auto work = makeLnk("work");
    writeFile(repo / "work.lnk" / ".gitconfig", "Y");
    writeFile(repo / ".lnk.work", ".gitconfig\n");

    EXPECT_EQ(work.restoreSymlinks(), std::vector<std::string>{".gitconfig"});
    EXPECT_EQ(lnk::test::canonical(home / ".gitconfig"), lnk::test::canonical(repo / "work.lnk" / ".gitconfig"));
    EXPECT_TRUE(makeLnk().restoreSymlinks().empty());
}

TEST_F(RestorerTest, RequiresInitializedRepository) {
    EXPECT_LNK_ERROR(makeLnk().restoreSymlinks(), lnk::error::Kind::NotInitialized);
}
