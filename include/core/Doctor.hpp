#pragma once

#include "core/Context.hpp"

#include <string>
#include <vector>

namespace lnk::core {

struct DoctorResult {
    // storage item missing, or the path escapes the storage root
    std::vector<std::string> invalidEntries;
    // storage item present, home-side link absent or wrong
    std::vector<std::string> brokenSymlinks;

    [[nodiscard]] bool hasIssues() const { return !invalidEntries.empty() || !brokenSymlinks.empty(); }
    [[nodiscard]] std::size_t totalIssues() const { return invalidEntries.size() + brokenSymlinks.size(); }
};

class Doctor {
public:
    explicit Doctor(const Context& ctx);

    [[nodiscard]] DoctorResult preview() const;

    // Relinks broken entries, then drops invalid ones from tracking and commits.
    // Not rolled back on failure.
    DoctorResult fix() const;

private:
    const Context& ctx_;
};

}
