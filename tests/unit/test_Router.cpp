#include "cli/Output.hpp"
#include "cli/Router.hpp"
#include "cli/commands/all.hpp"
#include "version.hpp"
#include "TestEnv.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using lnk::cli::CommandResult;
using lnk::cli::Router;
using lnk::test::readFile;

class RouterTest : public lnk::test::LnkTest {
protected:
    std::unique_ptr<Router> router;

    void SetUp() override {
        LnkTest::SetUp();
        router = std::make_unique<Router>();
        lnk::cli::commands::registerAllCommands(*router, [this](const std::string& profile) { return makeLnk(profile); });
    }

    CommandResult run(std::vector<std::string> args) const {
        args.insert(args.begin(), {"--colors=never", "--no-emoji"});
        return router->execute(args);
    }

    nlohmann::json runJson(std::vector<std::string> args) const {
        args.emplace_back("--json");
        const auto res = run(std::move(args));
        EXPECT_EQ(res.exit_code, 0) << res.stderr_text;
        return nlohmann::json::parse(res.stdout_text);
    }
};

TEST_F(RouterTest, OverviewWithoutCommand) {
    const auto res = run({});
    EXPECT_EQ(res.exit_code, 0);
    EXPECT_NE(res.stdout_text.find("Commands:"), std::string::npos);
    for (const auto* cmd : {"init", "add", "rm", "list", "status", "push", "pull", "doctor", "bootstrap"})
        EXPECT_NE(res.stdout_text.find(cmd), std::string::npos) << cmd;
    EXPECT_EQ(res.stdout_text.find("\033["), std::string::npos);
}

TEST_F(RouterTest, HelpForCommandAndAlias) {
    const auto add = run({"help", "add"});
    EXPECT_EQ(add.exit_code, 0);
    EXPECT_NE(add.stdout_text.find("Usage:"), std::string::npos);
    EXPECT_NE(add.stdout_text.find("--recursive"), std::string::npos);

    EXPECT_EQ(run({"help", "remove"}).stdout_text, run({"rm", "--help"}).stdout_text);
    EXPECT_EQ(run({"help", "frobnicate"}).exit_code, 2);
}

TEST_F(RouterTest, Version) {
    const auto res = run({"--version"});
    EXPECT_EQ(res.exit_code, 0);
    EXPECT_EQ(res.stdout_text, std::string("lnk ") + lnk::VERSION + "\n");
}

TEST_F(RouterTest, UsageErrorsExitWithTwo) {
    const auto unknown = run({"frobnicate"});
    EXPECT_EQ(unknown.exit_code, 2);
    EXPECT_NE(unknown.stderr_text.find("Unknown command 'frobnicate'"), std::string::npos);

    const auto badOpt = run({"list", "--bogus"});
    EXPECT_EQ(badOpt.exit_code, 2);
    EXPECT_NE(badOpt.stderr_text.find("--bogus"), std::string::npos);

    const auto noValue = run({"add", "--host"});
    EXPECT_EQ(noValue.exit_code, 2);
    EXPECT_NE(noValue.stderr_text.find("requires a value"), std::string::npos);

    EXPECT_EQ(run({"add"}).exit_code, 2);
    EXPECT_EQ(run({"rm", "a", "b"}).exit_code, 2);
    EXPECT_EQ(run({"--colors", "rainbow", "list"}).exit_code, 2);
}

TEST_F(RouterTest, EngineErrorsExitWithOne) {
    const auto res = run({"list"});
    EXPECT_EQ(res.exit_code, 1);
    EXPECT_NE(res.stderr_text.find("Error:"), std::string::npos);
    EXPECT_TRUE(res.stdout_text.empty());
}

TEST_F(RouterTest, InitAddListRemove) {
    ASSERT_EQ(run({"init"}).exit_code, 0);
    const auto bashrc = homeFile(".bashrc", "X");

    const auto added = run({"add", bashrc.string()});
    ASSERT_EQ(added.exit_code, 0) << added.stderr_text;
    EXPECT_NE(added.stdout_text.find("Added .bashrc"), std::string::npos);
    EXPECT_TRUE(std::filesystem::is_symlink(bashrc));

    const auto listed = runJson({"ls"});
    EXPECT_EQ(listed["profile"], "");
    EXPECT_EQ(listed["entries"], nlohmann::json::array({".bashrc"}));

    const auto again = run({"add", bashrc.string()});
    EXPECT_EQ(again.exit_code, 1);

    const auto removed = run({"remove", bashrc.string()});
    ASSERT_EQ(removed.exit_code, 0) << removed.stderr_text;
    EXPECT_FALSE(std::filesystem::is_symlink(bashrc));
    EXPECT_EQ(readFile(bashrc), "X");
    EXPECT_TRUE(runJson({"list"})["entries"].empty());
}

TEST_F(RouterTest, HostFlagAndListAll) {
    ASSERT_EQ(run({"init"}).exit_code, 0);
    ASSERT_EQ(run({"add", homeFile(".bashrc", "X").string()}).exit_code, 0);
    ASSERT_EQ(run({"add", "-H", "work", homeFile(".gitconfig", "Y").string()}).exit_code, 0);

    const auto all = runJson({"list", "--all"});
    EXPECT_EQ(all["common"], nlohmann::json::array({".bashrc"}));
    EXPECT_EQ(all["hosts"]["work"], nlohmann::json::array({".gitconfig"}));

    const auto work = run({"list", "--host=work"});
    EXPECT_NE(work.stdout_text.find("host: work"), std::string::npos);
}

TEST_F(RouterTest, RecursiveAddAndDryRun) {
    ASSERT_EQ(run({"init"}).exit_code, 0);
    homeFile(".config/app/a", "a");
    homeFile(".config/app/b", "b");
    const auto dir = (home / ".config" / "app").string();

    const auto preview = runJson({"add", "-rn", dir});
    EXPECT_EQ(preview["would_add"].size(), 2u);
    EXPECT_FALSE(std::filesystem::is_symlink(home / ".config" / "app" / "a"));

    const auto added = runJson({"add", "--recursive", dir});
    EXPECT_EQ(added["added"].size(), 2u);
    EXPECT_TRUE(std::filesystem::is_symlink(home / ".config" / "app" / "b"));
}

TEST_F(RouterTest, DoctorDryRunReportsWithoutFixing) {
    ASSERT_EQ(run({"init"}).exit_code, 0);
    const auto vimrc = homeFile(".vimrc", "V");
    ASSERT_EQ(run({"add", vimrc.string()}).exit_code, 0);
    std::filesystem::remove(vimrc);

    const auto preview = runJson({"doctor", "--dry-run"});
    EXPECT_EQ(preview["broken_symlinks"], nlohmann::json::array({".vimrc"}));
    EXPECT_EQ(preview["fixed"], false);
    EXPECT_FALSE(std::filesystem::exists(std::filesystem::symlink_status(vimrc)));

    const auto fixed = runJson({"doctor"});
    EXPECT_EQ(fixed["fixed"], true);
    EXPECT_TRUE(std::filesystem::is_symlink(vimrc));
}

TEST(OutputTest, ColorModesControlEscapes) {
    const lnk::cli::Output always(lnk::config::ColorMode::Always, false);
    EXPECT_EQ(always.success("done"), "\033[1;32mdone\033[0m\n");
    EXPECT_EQ(always.warning("careful"), "\033[33mcareful\033[0m\n");

    const lnk::cli::Output never(lnk::config::ColorMode::Never, true);
    EXPECT_FALSE(never.colors());
    EXPECT_EQ(never.dim("quiet"), "quiet");
    EXPECT_EQ(never.success("done"), "✨ done\n");
}
