#include "core/DirectoryWalker.hpp"
#include "error/Error.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <type_traits>
#include <variant>

namespace lnk::core {

DirectoryWalker::DirectoryWalker(const bool recursive) : recursive(recursive) {}

std::vector<std::filesystem::path> DirectoryWalker::walk(const std::filesystem::path& root,
                                                         std::function<bool(const std::filesystem::directory_entry&)> filter) const {
    using Iterator = std::variant<std::filesystem::directory_iterator, std::filesystem::recursive_directory_iterator>;

    std::error_code ec;
    Iterator it = recursive
        ? Iterator{std::filesystem::recursive_directory_iterator(root, ec)}
        : Iterator{std::filesystem::directory_iterator(root, ec)};
    if (ec) throw error::io("read directory", root, ec.message());

    std::vector<std::filesystem::path> result;

    std::visit([&](auto& iter) {
        for (auto end = std::remove_cvref_t<decltype(iter)>{}; iter != end;) {
            const auto& entry = *iter;

            std::error_code tec;
            if ((!filter || filter(entry)) && (entry.is_symlink(tec) || entry.is_regular_file(tec)))
                result.push_back(entry.path());

            iter.increment(ec);
            if (ec) throw error::io("read directory", root, ec.message());
        }
    }, it);

    std::ranges::sort(result);
    log::Registry::core()->debug("[DirectoryWalker] {} candidates under {}", result.size(), root.string());
    return result;
}

}
