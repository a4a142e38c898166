#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace DocLinks {

/// In-place rewrites of one line of a source document. All matching is
/// literal. The file is replaced atomically (temp file + rename), so a
/// failed edit leaves the original untouched.
class DocumentEditor {
public:
    /// Rewrites target inside the "(...)" of the "[text](target ...)" link
    /// on line line_no (1-based); the link text and the rest of the line are kept
    auto replaceLinkTarget(const std::string& path, uint32_t line_no,
                           std::string_view target, std::string_view new_target) noexcept -> bool;

    /// Replaces the whole "[text](target ...)" markup whose target is
    /// exactly target on line line_no with replacement
    auto replaceLinkMarkup(const std::string& path, uint32_t line_no,
                           std::string_view target, std::string_view replacement) noexcept -> bool;

    /// Locates "[text](target ...)" in line; returns false when absent.
    /// target_begin, when given, receives the offset of target itself.
    static auto findLinkMarkup(std::string_view line, std::string_view target,
                               size_t* begin, size_t* end, size_t* target_begin = nullptr) noexcept -> bool;

private:
    template<typename Edit>
    auto editLine(const std::string& path, uint32_t line_no, Edit&& edit) noexcept -> bool;

    static auto readFile(const std::string& path, std::string* content) -> bool;
    static auto writeFileAtomic(const std::string& path, const std::string& content) -> bool;
};

} // namespace DocLinks
