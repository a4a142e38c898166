#include "anchor_index.h"
#include "anchor_normalizer.h"
#include "common/logging.h"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <sstream>

namespace DocLinks {

namespace {

inline bool isSpace(char c) noexcept {
    return c == ' ' || c == '\t' || c == '\f' || c == '\v';
}

constexpr std::string_view ID_ATTRIBUTE = "id=\"";

} // namespace

auto AnchorIndex::ensureBuilt(const std::string& document) -> const Entry& {
    auto it = cache_.find(document);
    if (it != cache_.end()) {
        return it->second;
    }

    Entry entry;
    std::ifstream in(document, std::ios::in | std::ios::binary);
    if (!in) {
        LOG_WARN("Cannot read %s for anchors: %s", document.c_str(), std::strerror(errno));
    } else {
        std::ostringstream content;
        content << in.rdbuf();
        entry.readable = true;
        extractAnchors(content.str(), &entry);
        LOG_DEBUG("Indexed %zu anchors in %s", entry.ordered.size(), document.c_str());
    }

    return cache_.emplace(document, std::move(entry)).first->second;
}

auto AnchorIndex::extractAnchors(std::string_view content, Entry* entry) -> void {
    std::vector<std::string> explicit_ids;
    size_t line_start = 0;
    while (line_start <= content.size()) {
        size_t line_end = content.find('\n', line_start);
        if (line_end == std::string_view::npos) {
            line_end = content.size();
        }
        std::string_view line = content.substr(line_start, line_end - line_start);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }

        // Header: one or more '#', one whitespace, then at least one char
        size_t hashes = 0;
        while (hashes < line.size() && line[hashes] == '#') {
            ++hashes;
        }
        if (hashes > 0 && hashes + 1 < line.size() && isSpace(line[hashes])) {
            addAnchor(entry, normalizeAnchor(line.substr(hashes + 1)));
        }

        // Explicit id attributes, anywhere on the line
        size_t pos = line.find(ID_ATTRIBUTE);
        while (pos != std::string_view::npos) {
            const size_t value_start = pos + ID_ATTRIBUTE.size();
            const size_t value_end = line.find('"', value_start);
            if (value_end == std::string_view::npos) {
                break;  // unterminated attribute
            }
            if (value_end > value_start) {
                explicit_ids.emplace_back(line.substr(value_start, value_end - value_start));
            }
            pos = line.find(ID_ATTRIBUTE, value_end + 1);
        }

        if (line_end == content.size()) {
            break;
        }
        line_start = line_end + 1;
    }

    // Explicit ids follow all header anchors
    for (auto& id : explicit_ids) {
        addAnchor(entry, std::move(id));
    }
}

auto AnchorIndex::addAnchor(Entry* entry, std::string anchor) -> void {
    // A header of only punctuation normalizes to nothing
    if (anchor.empty()) {
        return;
    }
    entry->lookup.insert(anchor);
    entry->ordered.push_back(std::move(anchor));
}

} // namespace DocLinks
