#include "anchor_resolver.h"
#include "anchor_normalizer.h"
#include "common/logging.h"

namespace DocLinks {

namespace {

inline bool isDigit(char c) noexcept {
    return c >= '0' && c <= '9';
}

// Consumes "<digits>-" at pos; returns the position after '-' or npos
inline size_t skipNumberGroup(std::string_view s, size_t pos) noexcept {
    const size_t start = pos;
    while (pos < s.size() && isDigit(s[pos])) {
        ++pos;
    }
    if (pos == start || pos >= s.size() || s[pos] != '-') {
        return std::string_view::npos;
    }
    return pos + 1;
}

} // namespace

auto AnchorResolver::resolve(const std::string& document, std::string_view requested) -> AnchorMatch {
    const AnchorIndex::Entry& entry = index_->ensureBuilt(document);
    const std::string anchor = normalizeAnchor(requested);

    if (anchor.empty()) {
        return AnchorMatch::EMPTY;
    }

    if (entry.lookup.count(anchor) != 0) {
        return AnchorMatch::EXACT;
    }

    const std::string variant = numberedVariant(anchor);
    if (!variant.empty() && entry.lookup.count(variant) != 0) {
        LOG_DEBUG("Anchor #%s matched numbered section #%s in %s",
                  anchor.c_str(), variant.c_str(), document.c_str());
        return AnchorMatch::NUMBERED_FUZZ;
    }

    if (!hasSectionPrefix(anchor)) {
        for (const auto& candidate : entry.ordered) {
            if (isSectionSuffixOf(candidate, anchor)) {
                LOG_DEBUG("Anchor #%s matched by suffix #%s in %s",
                          anchor.c_str(), candidate.c_str(), document.c_str());
                return AnchorMatch::SUFFIX;
            }
        }
    }

    return AnchorMatch::NONE;
}

auto AnchorResolver::numberedVariant(const std::string& anchor) -> std::string {
    // One digit, then one or more digits, then '-'
    if (anchor.size() < 3 || !isDigit(anchor[0]) || !isDigit(anchor[1])) {
        return {};
    }
    size_t pos = 1;
    while (pos < anchor.size() && isDigit(anchor[pos])) {
        ++pos;
    }
    if (pos >= anchor.size() || anchor[pos] != '-') {
        return {};
    }

    std::string variant;
    variant.reserve(anchor.size() + 1);
    variant.push_back(anchor[0]);
    variant.push_back('-');
    variant.append(anchor, 1, std::string::npos);
    return variant;
}

auto AnchorResolver::hasSectionPrefix(std::string_view anchor) noexcept -> bool {
    size_t pos = skipNumberGroup(anchor, 0);
    if (pos == std::string_view::npos) {
        return false;
    }
    return skipNumberGroup(anchor, pos) != std::string_view::npos;
}

auto AnchorResolver::isSectionSuffixOf(std::string_view candidate, std::string_view anchor) noexcept -> bool {
    size_t pos = skipNumberGroup(candidate, 0);
    if (pos == std::string_view::npos) {
        return false;
    }
    pos = skipNumberGroup(candidate, pos);
    if (pos == std::string_view::npos) {
        return false;
    }
    return candidate.substr(pos) == anchor;
}

} // namespace DocLinks
