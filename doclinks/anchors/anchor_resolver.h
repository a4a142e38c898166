#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "anchor_index.h"

namespace DocLinks {

enum class AnchorMatch : uint8_t {
    NONE = 0,
    EXACT = 1,           // normalized anchor is cached as-is
    NUMBERED_FUZZ = 2,   // "25-x" found as "2-5-x"
    SUFFIX = 3,          // "x" found as "<n>-<m>-x"
    EMPTY = 4            // bare "#", refers to the document itself
};

/// Answers "does document define this anchor" against an AnchorIndex,
/// trying exact, numbered-section and suffix matching in that order.
class AnchorResolver {
public:
    explicit AnchorResolver(AnchorIndex* index) noexcept : index_(index) {}

    auto resolve(const std::string& document, std::string_view requested) -> AnchorMatch;

    auto exists(const std::string& document, std::string_view requested) -> bool {
        return resolve(document, requested) != AnchorMatch::NONE;
    }

    /// "25-x" -> "2-5-x"; empty when the anchor has no such prefix
    static auto numberedVariant(const std::string& anchor) -> std::string;

    /// True when anchor starts with "<digits>-<digits>-"
    static auto hasSectionPrefix(std::string_view anchor) noexcept -> bool;

    /// True when candidate is "<digits>-<digits>-" followed by exactly anchor
    static auto isSectionSuffixOf(std::string_view candidate, std::string_view anchor) noexcept -> bool;

private:
    AnchorIndex* index_;
};

} // namespace DocLinks
