#pragma once

#include <filesystem>
#include <string>
#include <variant>
#include <vector>

namespace lnk::core {

struct Context;

namespace rollback {

// Undo a move: rename from -> to
struct MoveBack { std::filesystem::path from, to; };
// Undo a symlink creation
struct RemoveLink { std::filesystem::path link; };
// Undo a symlink removal
struct RestoreLink { std::filesystem::path target, link; };
// Undo tracker.add / tracker.remove
struct Untrack { std::string rel; };
struct Retrack { std::string rel; };
// Undo vcs add / vcs rm of a repository path
struct Unstage { std::filesystem::path vcsPath; };
struct Restage { std::filesystem::path vcsPath; };

using Action = std::variant<MoveBack, RemoveLink, RestoreLink, Untrack, Retrack, Unstage, Restage>;

[[nodiscard]] std::string describe(const Action& action);

}

// LIFO of compensating actions. unwind() runs them newest first and keeps
// going when one fails; each failure is logged.
class RollbackStack {
public:
    explicit RollbackStack(const Context& ctx) : ctx_(ctx) {}

    void push(rollback::Action action) { actions_.push_back(std::move(action)); }

    // Returns the number of actions that failed to apply.
    std::size_t unwind();

    // Transaction committed: nothing to undo any more.
    void discard() { actions_.clear(); }

    [[nodiscard]] const std::vector<rollback::Action>& actions() const { return actions_; }
    [[nodiscard]] bool empty() const { return actions_.empty(); }

private:
    const Context& ctx_;
    std::vector<rollback::Action> actions_;

    void apply(const rollback::Action& action) const;
};

}
