#include "core/Lnk.hpp"
#include "TestEnv.hpp"

#include <gtest/gtest.h>

using lnk::error::Kind;
using lnk::test::LnkTest;
using lnk::test::canonical;
using lnk::test::git;
using lnk::test::readFile;
using lnk::test::writeFile;

class LnkFacadeTest : public LnkTest {
protected:
    std::filesystem::path remote;

    // bare repository standing in for the user's remote
    void makeRemote() {
        remote = root / "remote.git";
        ASSERT_TRUE(git({"init", "--bare", "-b", "main", remote.string()}, root).ok());
    }

    // second machine sharing the same remote
    struct Machine {
        std::filesystem::path home, repo;
        std::shared_ptr<lnk::vcs::GitDriver> driver;
        [[nodiscard]] lnk::core::Lnk lnk(const std::string& profile = {}) const { return {repo, profile, home, driver}; }
    };

    Machine otherMachine() const {
        Machine m;
        m.home = root / "home2";
        m.repo = m.home / ".config" / "lnk";
        std::filesystem::create_directories(m.home);
        m.driver = std::make_shared<lnk::vcs::GitDriver>(m.repo);
        return m;
    }
};

TEST_F(LnkFacadeTest, InitCreatesRepositoryAndIsIdempotent) {
    const auto lnk = makeLnk();
    EXPECT_FALSE(git_->isRepository());

    lnk.init();
    EXPECT_TRUE(git_->isRepository());
    EXPECT_TRUE(lnk.list().empty());
    EXPECT_TRUE(lnk.getCommits().empty());

    lnk.add(homeFile(".bashrc", "X"));
    EXPECT_NO_THROW(lnk.init());
    EXPECT_EQ(lnk.list(), std::vector<std::string>{".bashrc"});
}

TEST_F(LnkFacadeTest, InitRefusesForeignRepository) {
    std::filesystem::create_directories(repo);
    ASSERT_TRUE(git({"init"}, repo).ok());
    writeFile(repo / "README", "mine");
    ASSERT_TRUE(git({"add", "README"}, repo).ok());
    ASSERT_TRUE(git({"-c", "user.name=t", "-c", "user.email=t@t", "commit", "-m", "initial"}, repo).ok());

    EXPECT_LNK_ERROR(makeLnk().init(), Kind::ExistingForeignRepo);
    EXPECT_EQ(readFile(repo / "README"), "mine");
}

TEST_F(LnkFacadeTest, OperationsRequireInit) {
    const auto lnk = makeLnk();
    EXPECT_LNK_ERROR(static_cast<void>(lnk.list()), Kind::NotInitialized);
    EXPECT_LNK_ERROR(static_cast<void>(lnk.status()), Kind::NotInitialized);
    EXPECT_LNK_ERROR(lnk.push(""), Kind::NotInitialized);
    EXPECT_LNK_ERROR(static_cast<void>(lnk.previewDoctor()), Kind::NotInitialized);
}

TEST_F(LnkFacadeTest, HasUserContentAndListHosts) {
    const auto lnk = initLnk();
    EXPECT_FALSE(lnk.hasUserContent());
    EXPECT_TRUE(lnk.listHosts().empty());

    makeLnk("work").add(homeFile(".gitconfig", "Y"));
    makeLnk("laptop").add(homeFile(".xinitrc", "X"));

    EXPECT_TRUE(lnk.hasUserContent());
    EXPECT_EQ(lnk.listHosts(), (std::vector<std::string>{"laptop", "work"}));
    EXPECT_FALSE(std::filesystem::exists(repo / ".lnk"));
}

TEST_F(LnkFacadeTest, InitWithRemoteRefusesToReplaceContent) {
    makeRemote();
    const auto lnk = initLnk();
    lnk.add(homeFile(".bashrc", "X"));

    EXPECT_LNK_ERROR(lnk.init(remote.string()), Kind::ManagedFilesExist);
    EXPECT_EQ(lnk.list(), std::vector<std::string>{".bashrc"});
}

TEST_F(LnkFacadeTest, PushThenCloneAndPullOnAnotherMachine) {
    makeRemote();
    const auto lnk = initLnk();
    git_->addRemote("origin", remote.string());
    lnk.add(homeFile(".bashrc", "X"));
    lnk.push("");

    const auto st = lnk.status();
    EXPECT_EQ(st.ahead, 0);
    EXPECT_EQ(st.behind, 0);
    EXPECT_FALSE(st.dirty);

    const auto other = otherMachine();
    other.lnk().init(remote.string());
    EXPECT_EQ(other.lnk().list(), std::vector<std::string>{".bashrc"});

    EXPECT_EQ(other.lnk().pull(), std::vector<std::string>{".bashrc"});
    EXPECT_EQ(lnk::test::canonical(other.home / ".bashrc"), lnk::test::canonical(other.repo / ".bashrc"));
    EXPECT_EQ(readFile(other.home / ".bashrc"), "X");

    // edits travel back through the remote
    writeFile(home / ".bashrc", "X2");
    lnk.push("tweak bashrc");
    EXPECT_EQ(lnk.getCommits().front(), "tweak bashrc");
    other.lnk().pull();
    EXPECT_EQ(readFile(other.home / ".bashrc"), "X2");
}

TEST_F(LnkFacadeTest, PushUsesDefaultMessageWhenEmpty) {
    makeRemote();
    const auto lnk = initLnk();
    git_->addRemote("origin", remote.string());
    lnk.add(homeFile(".vimrc", "set nu\n"));
    writeFile(home / ".vimrc", "set nonu\n");

    EXPECT_FALSE(lnk.diff(false).empty());
    lnk.push("");

    EXPECT_EQ(lnk.getCommits().front(), "lnk: sync configuration files");
    EXPECT_TRUE(lnk.diff(false).empty());
}

TEST_F(LnkFacadeTest, StatusWithoutRemoteFails) {
    const auto lnk = initLnk();
    EXPECT_LNK_ERROR(static_cast<void>(lnk.status()), Kind::Vcs);
}

TEST_F(LnkFacadeTest, CloneReplacesContentWhenForced) {
    makeRemote();
    const auto other = otherMachine();
    other.lnk().init();
    other.driver->addRemote("origin", remote.string());
    const auto zshrc = other.home / ".zshrc";
    writeFile(zshrc, "Z");
    other.lnk().add(zshrc);
    other.lnk().push("");

    const auto lnk = initLnk();
    lnk.add(homeFile(".bashrc", "X"));
    lnk.init(remote.string(), true);

    EXPECT_EQ(lnk.list(), std::vector<std::string>{".zshrc"});
    EXPECT_TRUE(lnk.context().vcs->isManagedRepository());
}

TEST_F(LnkFacadeTest, BootstrapScript) {
    const auto lnk = initLnk();
    EXPECT_EQ(lnk.findBootstrapScript(), "");
    EXPECT_LNK_ERROR(lnk.runBootstrapScript("bootstrap.sh"), Kind::BootstrapNotFound);

    writeFile(repo / "bootstrap.sh", "echo ran > marker\n");
    EXPECT_EQ(lnk.findBootstrapScript(), "bootstrap.sh");
    lnk.runBootstrapScript("bootstrap.sh");
    EXPECT_EQ(readFile(repo / "marker"), "ran\n");

    writeFile(repo / "bootstrap.sh", "exit 3\n");
    EXPECT_LNK_ERROR(lnk.runBootstrapScript("bootstrap.sh"), Kind::BootstrapFailed);
}

TEST_F(LnkFacadeTest, InvalidProfileRejected) {
    EXPECT_LNK_ERROR(static_cast<void>(makeLnk("../evil")), Kind::InvalidProfile);
}
