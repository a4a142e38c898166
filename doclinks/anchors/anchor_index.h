#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace DocLinks {

/// Lazily built cache of the anchors each document defines, keyed by
/// absolute path. An entry is built once and never changes for the rest
/// of the run. Not thread-safe: every scanning worker owns its own index.
class AnchorIndex {
public:
    struct Entry {
        std::vector<std::string> ordered;          // document order, duplicates kept
        std::unordered_set<std::string> lookup;
        bool readable = false;
    };

    AnchorIndex() = default;
    AnchorIndex(const AnchorIndex&) = delete;
    AnchorIndex& operator=(const AnchorIndex&) = delete;

    /// Reads and indexes document on first use. An unreadable document gets
    /// an empty entry; that is not an error for the caller.
    auto ensureBuilt(const std::string& document) -> const Entry&;

    auto anchors(const std::string& document) -> const std::vector<std::string>& {
        return ensureBuilt(document).ordered;
    }

    [[nodiscard]] auto isCached(const std::string& document) const noexcept -> bool {
        return cache_.find(document) != cache_.end();
    }

    [[nodiscard]] auto size() const noexcept -> size_t { return cache_.size(); }

    /// Header lines ("#+<space>text") contribute their normalized text;
    /// every id="VALUE" attribute contributes VALUE verbatim.
    static auto extractAnchors(std::string_view content, Entry* entry) -> void;

private:
    static auto addAnchor(Entry* entry, std::string anchor) -> void;

    std::unordered_map<std::string, Entry> cache_;
};

} // namespace DocLinks
