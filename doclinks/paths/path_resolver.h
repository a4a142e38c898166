#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace DocLinks {

/// Turns the file part of a link into a canonical target path and
/// classifies it against the area root.
class PathResolver {
public:
    PathResolver(std::string docs_root, std::string area_root);

    /// "/x" resolves under the docs root, anything else against the
    /// directory of source_document. Symlinks and dot segments are
    /// resolved as far as the path exists.
    [[nodiscard]] auto resolve(const std::string& source_document, std::string_view link_path) const -> std::string;

    /// Plain string prefix test against the area root
    [[nodiscard]] auto isInternal(std::string_view target) const noexcept -> bool;

    /// Number of "../" segments anywhere in link
    [[nodiscard]] static auto countDepth(std::string_view link) noexcept -> uint32_t;

    [[nodiscard]] auto docsRoot() const noexcept -> const std::string& { return docs_root_; }
    [[nodiscard]] auto areaRoot() const noexcept -> const std::string& { return area_root_; }

private:
    std::string docs_root_;
    std::string area_root_;
};

} // namespace DocLinks
