#include "cli/usages.hpp"

namespace lnk::cli::usage {

static const Option hostOpt{{"host", "Use the host-specific profile for this machine name"}, {"H", "host"}, "name"};
static const Flag dryRunFlag{{"dry-run", "Show what would happen without changing anything"}, {"n", "dry-run"}};

static std::shared_ptr<CommandUsage> buildBaseUsage(std::vector<std::string> aliases, std::string description) {
    const auto cmd = std::make_shared<CommandUsage>();
    cmd->aliases = std::move(aliases);
    cmd->description = std::move(description);
    return cmd;
}

std::shared_ptr<CommandUsage> init() {
    const auto cmd = buildBaseUsage({"init"}, "Create the lnk repository, or clone it from a remote.");
    cmd->options = {
        {{"remote", "Clone this repository instead of starting an empty one"}, {"r", "remote"}, "url"},
    };
    cmd->flags = {
        {{"force", "Replace a repository that already tracks files with the remote clone"}, {"force"}},
        {{"no-bootstrap", "Do not run bootstrap.sh after cloning"}, {"no-bootstrap"}},
    };
    cmd->examples = {
        {"lnk init", "Start an empty repository in ~/.config/lnk."},
        {"lnk init -r git@github.com:me/dotfiles.git", "Clone existing dotfiles and run their bootstrap script."},
    };
    return cmd;
}

std::shared_ptr<CommandUsage> add() {
    const auto cmd = buildBaseUsage({"add"}, "Move files or directories into the repository and leave symlinks behind.");
    cmd->positionals = {{{"path", "File or directory to manage"}, false, true}};
    cmd->options = { hostOpt };
    cmd->flags = {
        {{"recursive", "Add every file inside the given directories individually"}, {"r", "recursive"}},
        dryRunFlag,
    };
    cmd->examples = {
        {"lnk add ~/.bashrc ~/.vimrc", "Manage two files in one commit."},
        {"lnk add -r ~/.config/nvim", "Manage each file below ~/.config/nvim."},
        {"lnk add -H work ~/.gitconfig", "Manage a file only for the 'work' host."},
    };
    return cmd;
}

std::shared_ptr<CommandUsage> rm() {
    const auto cmd = buildBaseUsage({"rm", "remove"}, "Stop managing a file and move it back in place of its symlink.");
    cmd->positionals = {{{"path", "Symlink created by 'lnk add'"}}};
    cmd->options = { hostOpt };
    cmd->flags = {
        {{"force", "Drop the entry even if the symlink is already gone; deletes the stored copy"}, {"f", "force"}},
    };
    cmd->examples = {
        {"lnk rm ~/.bashrc", "Restore ~/.bashrc as a regular file."},
        {"lnk rm -f ~/.old-tool.conf", "Forget an entry whose symlink was deleted by hand."},
    };
    return cmd;
}

std::shared_ptr<CommandUsage> list() {
    const auto cmd = buildBaseUsage({"list", "ls"}, "List managed files.");
    cmd->options = { hostOpt };
    cmd->flags = {
        {{"all", "List the common profile and every host profile"}, {"a", "all"}},
    };
    return cmd;
}

std::shared_ptr<CommandUsage> status() {
    return buildBaseUsage({"status", "st"}, "Show how the repository compares to its remote.");
}

std::shared_ptr<CommandUsage> diff() {
    return buildBaseUsage({"diff"}, "Show uncommitted changes in the repository.");
}

std::shared_ptr<CommandUsage> push() {
    const auto cmd = buildBaseUsage({"push"}, "Commit pending changes and push them to the remote.");
    cmd->positionals = {{{"message", "Commit message"}, true, true}};
    cmd->examples = {
        {"lnk push", "Commit with the default message and push."},
        {"lnk push \"tweak prompt\"", "Commit with a custom message."},
    };
    return cmd;
}

std::shared_ptr<CommandUsage> pull() {
    const auto cmd = buildBaseUsage({"pull"}, "Pull from the remote and recreate missing symlinks.");
    cmd->options = { hostOpt };
    return cmd;
}

std::shared_ptr<CommandUsage> doctor() {
    const auto cmd = buildBaseUsage({"doctor"}, "Find and repair tracked entries that are missing or no longer linked.");
    cmd->options = { hostOpt };
    cmd->flags = { dryRunFlag };
    cmd->examples = {
        {"lnk doctor -n", "Report problems only."},
        {"lnk doctor", "Relink broken symlinks and drop entries whose files are gone."},
    };
    return cmd;
}

std::shared_ptr<CommandUsage> bootstrap() {
    return buildBaseUsage({"bootstrap"}, "Run bootstrap.sh from the repository root.");
}

std::shared_ptr<CommandUsage> help() {
    const auto cmd = buildBaseUsage({"help"}, "Show help about a command.");
    cmd->positionals = {{{"command", "Command to describe"}, true}};
    return cmd;
}

const std::vector<Flag>& globalFlags() {
    static const std::vector<Flag> flags = {
        {{"no-emoji", "Plain output without emoji"}, {"no-emoji"}},
        {{"verbose", "Log debug output to stderr"}, {"verbose"}},
        {{"json", "Machine-readable output where supported"}, {"json"}},
        {{"help", "Show help"}, {"h", "help"}},
        {{"version", "Show the version"}, {"version"}},
    };
    return flags;
}

const std::vector<Option>& globalOptions() {
    static const std::vector<Option> options = {
        {{"colors", "When to use ANSI colors"}, {"colors"}, "auto|always|never"},
    };
    return options;
}

}
