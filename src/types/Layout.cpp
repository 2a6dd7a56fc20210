#include "types/Layout.hpp"
#include "error/Error.hpp"

#include <fmt/core.h>

using namespace lnk::types;

static std::string validatedProfile(const std::string& profile) {
    if (profile.find('/') != std::string::npos || profile.find('\\') != std::string::npos)
        throw lnk::error::Error(lnk::error::Kind::InvalidProfile,
                                "Profile name must not contain a path separator", profile,
                                "use a plain host name such as 'work'");
    return profile;
}

Layout::Layout(const std::filesystem::path& repoRoot, const std::string& profile)
    : repoRoot(repoRoot.lexically_normal()),
      profile(validatedProfile(profile)),
      trackingPath(this->repoRoot / trackingFileNameFor(this->profile)),
      storageRoot(this->profile.empty() ? this->repoRoot
                                        : this->repoRoot / (this->profile + HOST_STORAGE_SUFFIX)) {}

std::string Layout::trackingFileName() const { return trackingFileNameFor(profile); }

std::string Layout::trackingFileNameFor(const std::string& profile) {
    if (profile.empty()) return TRACKING_FILE_NAME;
    return fmt::format("{}.{}", TRACKING_FILE_NAME, profile);
}

std::filesystem::path Layout::storagePath(const std::filesystem::path& rel) const { return storageRoot / rel; }

std::filesystem::path Layout::vcsPath(const std::filesystem::path& rel) const {
    if (isCommon()) return rel;
    return std::filesystem::path(profile + HOST_STORAGE_SUFFIX) / rel;
}
