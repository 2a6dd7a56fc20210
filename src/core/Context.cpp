#include "core/Context.hpp"
#include "vcs/Driver.hpp"
#include "error/Error.hpp"
#include "util/fsPath.hpp"

using namespace lnk::core;

Context::Context(types::Layout layout, std::filesystem::path home, std::shared_ptr<vcs::Driver> vcs,
                 const unsigned int progressThreshold)
    : layout(std::move(layout)),
      home(util::absolutize(home)),
      vcs(std::move(vcs)),
      progressThreshold(progressThreshold) {
    if (!this->vcs) throw std::invalid_argument("Context: vcs driver is required");
}

void Context::requireRepository() const {
    if (!vcs->isRepository()) throw error::notInitialized();
}

std::string Context::relativeToHome(const std::filesystem::path& absPath) const {
    return util::homeRelative(absPath, home);
}

std::string Context::commitMessage(const std::string& text) {
    return std::string(vcs::COMMIT_PREFIX) + text;
}
