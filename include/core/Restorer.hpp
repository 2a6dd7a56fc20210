#pragma once

#include "core/Context.hpp"

#include <string>
#include <vector>

namespace lnk::core {

class Restorer {
public:
    explicit Restorer(const Context& ctx);

    // Recreates missing or wrong home-side links for every tracked entry whose
    // stored item exists. Returns the entries that were (re)linked. No VCS activity.
    std::vector<std::string> restoreSymlinks() const;

private:
    const Context& ctx_;
};

}
