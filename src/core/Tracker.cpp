#include "core/Tracker.hpp"
#include "error/Error.hpp"
#include "log/Registry.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <unistd.h>

using namespace lnk::core;

namespace {

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n\v\f");
    if (first == std::string::npos) return {};
    const auto last = s.find_last_not_of(" \t\r\n\v\f");
    return s.substr(first, last - first + 1);
}

}

Tracker::Tracker(std::filesystem::path trackingPath) : path_(std::move(trackingPath)) {}

Tracker::Entries Tracker::load() const {
    Entries entries;

    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        if (ec) throw lnk::error::io("read tracking file", path_, ec.message());
        return entries;
    }

    std::ifstream in(path_);
    if (!in) throw lnk::error::io("read tracking file", path_, std::strerror(errno));

    std::string line;
    while (std::getline(in, line))
        if (auto t = trim(line); !t.empty()) entries.insert(std::move(t));

    if (in.bad()) throw lnk::error::io("read tracking file", path_);

    log::Registry::tracker()->trace("[Tracker::load] {} entries from {}", entries.size(), path_.string());
    return entries;
}

bool Tracker::contains(const std::string& rel) const { return load().contains(rel); }

void Tracker::add(const std::string& rel) const {
    auto entries = load();
    if (!entries.insert(rel).second) {
        log::Registry::tracker()->debug("[Tracker::add] {} already tracked in {}", rel, path_.filename().string());
        return;
    }
    overwrite(entries);
}

void Tracker::remove(const std::string& rel) const {
    auto entries = load();
    if (entries.erase(rel) == 0) return;
    overwrite(entries);
}

void Tracker::overwrite(const Entries& entries) const {
    // must not look like a tracking file itself (".lnk.*")
    const auto tmp = path_.parent_path() / (".tracking-" + path_.filename().string() + "." + std::to_string(::getpid()) + ".tmp");

    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) throw lnk::error::io("write tracking file", tmp, std::strerror(errno));
        // std::set iterates in byte order
        for (const auto& e : entries) out << e << '\n';
        out.flush();
        if (!out) {
            std::error_code ignored;
            std::filesystem::remove(tmp, ignored);
            throw lnk::error::io("write tracking file", tmp);
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp, path_, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(tmp, ignored);
        throw lnk::error::io("replace tracking file", path_, ec.message());
    }

    log::Registry::tracker()->debug("[Tracker::overwrite] Wrote {} entries to {}", entries.size(), path_.string());
}
