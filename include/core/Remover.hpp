#pragma once

#include "core/Context.hpp"

#include <filesystem>

namespace lnk::core {

class Remover {
public:
    explicit Remover(const Context& ctx);

    // Unlink, untrack, commit, then move the stored item back in place of the link.
    void remove(const std::filesystem::path& path) const;

    // For entries whose symlink is already gone. Best-effort, no rollback;
    // the stored copy is deleted.
    void removeForce(const std::filesystem::path& path) const;

private:
    const Context& ctx_;
};

}
