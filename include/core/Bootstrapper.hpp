#pragma once

#include <filesystem>
#include <string>

namespace lnk::core {

inline constexpr const char* BOOTSTRAP_SCRIPT = "bootstrap.sh";

class Bootstrapper {
public:
    explicit Bootstrapper(std::filesystem::path repoRoot);

    // "bootstrap.sh" when present at the repository root, empty otherwise
    [[nodiscard]] std::string find() const;

    // Runs `bash <script>` from the repository root with inherited stdio.
    void run(const std::string& script) const;

private:
    std::filesystem::path repoRoot_;
};

}
