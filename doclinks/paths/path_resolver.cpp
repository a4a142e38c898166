#include "path_resolver.h"

#include <filesystem>
#include <system_error>
#include <utility>

namespace DocLinks {

PathResolver::PathResolver(std::string docs_root, std::string area_root)
    : docs_root_(std::move(docs_root)),
      area_root_(std::move(area_root)) {
}

auto PathResolver::resolve(const std::string& source_document, std::string_view link_path) const -> std::string {
    namespace fs = std::filesystem;

    fs::path joined;
    if (!link_path.empty() && link_path.front() == '/') {
        // String concatenation, so "/a.md" lands below the docs root
        joined = fs::path(docs_root_ + std::string(link_path));
    } else {
        joined = fs::path(source_document).parent_path() / fs::path(std::string(link_path));
    }

    std::error_code ec;
    fs::path canonical = fs::weakly_canonical(joined, ec);
    if (ec) {
        canonical = joined.lexically_normal();
    }
    return canonical.string();
}

auto PathResolver::isInternal(std::string_view target) const noexcept -> bool {
    return target.compare(0, area_root_.size(), area_root_) == 0;
}

auto PathResolver::countDepth(std::string_view link) noexcept -> uint32_t {
    uint32_t depth = 0;
    size_t pos = link.find("../");
    while (pos != std::string_view::npos) {
        ++depth;
        pos = link.find("../", pos + 3);
    }
    return depth;
}

} // namespace DocLinks
