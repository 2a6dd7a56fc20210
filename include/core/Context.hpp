#pragma once

#include "types/Layout.hpp"
#include "core/Tracker.hpp"

#include <filesystem>
#include <memory>
#include <string>

namespace lnk::vcs {
class Driver;
}

namespace lnk::core {

// Everything an engine component needs for one command: where the profile
// lives, whose home it links into, and the repository driver.
struct Context {
    types::Layout layout;
    std::filesystem::path home;
    std::shared_ptr<vcs::Driver> vcs;
    unsigned int progressThreshold;

    Context(types::Layout layout, std::filesystem::path home, std::shared_ptr<vcs::Driver> vcs,
            unsigned int progressThreshold = 10);

    [[nodiscard]] Tracker tracker() const { return Tracker(layout.trackingPath); }

    // Throws Kind::NotInitialized when the repository does not exist yet.
    void requireRepository() const;

    // rel from an absolute input path: relative to home, or the absolute
    // path with its leading separator stripped
    [[nodiscard]] std::string relativeToHome(const std::filesystem::path& absPath) const;

    // Where the entry was originally located, inverse of relativeToHome()
    [[nodiscard]] std::filesystem::path homeLink(const std::string& rel) const { return home / rel; }

    [[nodiscard]] static std::string commitMessage(const std::string& text);
};

}
