#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace lnk::util {

struct ProcessOptions {
    std::vector<std::string> argv;
    std::filesystem::path cwd{};
    std::chrono::seconds timeout{0}; // 0 waits forever
    bool captureOutput = true;       // false inherits stdio
    std::vector<std::pair<std::string, std::string>> env{};
};

struct ProcessResult {
    int exitCode = -1;
    std::string output; // stdout and stderr interleaved
    bool timedOut = false;

    [[nodiscard]] bool ok() const { return exitCode == 0 && !timedOut; }
};

// fork/exec with an optional deadline; the child is SIGKILLed when it
// outlives the timeout. Exit code 127 means exec failed.
ProcessResult runProcess(const ProcessOptions& opts);

}
