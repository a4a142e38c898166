#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "doclinks/anchors/anchor_index.h"
#include "doclinks/anchors/anchor_resolver.h"
#include "doclinks/paths/path_resolver.h"
#include "document_editor.h"
#include "history_probe.h"

namespace DocLinks {

enum class VerdictKind : uint8_t {
    INTERNAL_VALID = 0,
    EXTERNAL_VALID = 1,
    ANCHOR_WARNING = 2,   // target exists, anchor missing; still counted valid
    BROKEN = 3
};

enum class LinkAction : uint8_t {
    NONE = 0,
    SKIPPED_EXTERNAL = 1, // URL scheme, never resolved
    BATCH_FIXED = 2,
    TODO_MARKED = 3
};

enum class BrokenReason : uint8_t {
    NONE = 0,
    ANCHOR = 1,           // anchor-only link into the source document
    FILE_NOT_FOUND = 2
};

/// Outcome of one link
struct Verdict {
    VerdictKind kind = VerdictKind::INTERNAL_VALID;
    LinkAction action = LinkAction::NONE;
    BrokenReason reason = BrokenReason::NONE;
    bool internal = true;

    std::string source;          // absolute path of the scanned document
    uint32_t line = 0;
    std::string link;            // raw target as written
    std::string file_part;       // before the first '#'
    std::string anchor;          // "#..." or empty
    std::string resolved;        // canonical target, empty when not resolved
    std::string fixed_link;      // rewritten link after a batch fix

    uint32_t depth = 0;          // "../" count
    bool deep_path = false;
    bool history_found = false;  // auto-TODO skipped because the file has history

    [[nodiscard]] auto isValid() const noexcept -> bool { return kind != VerdictKind::BROKEN; }

    /// JSON "type" of a broken link or warning
    [[nodiscard]] auto typeName() const noexcept -> const char*;
};

struct ValidatorOptions {
    std::string fix_old;          // empty disables batch fix
    std::string fix_new;
    bool auto_todo = false;
    bool warn_deep_paths = true;
    uint32_t max_path_depth = 5;
    std::string extension = ".md";
};

/// Per-link state machine: scheme skip, depth check, anchor-only lookup,
/// batch fix, path resolution, auto-TODO, anchor check. One instance per
/// worker; it shares nothing with other workers except the history probe.
class LinkValidator {
public:
    LinkValidator(const ValidatorOptions& options, const PathResolver& paths,
                  AnchorIndex* index, HistoryProbe* history, DocumentEditor* editor) noexcept;

    auto validate(const std::string& source, uint32_t line, const std::string& link) -> Verdict;

    /// http://, https://, ftp:// and mailto: links
    [[nodiscard]] static auto hasExternalScheme(std::string_view link) noexcept -> bool;

    /// Every occurrence of from in text replaced by to
    [[nodiscard]] static auto replaceAll(std::string text, std::string_view from, std::string_view to) -> std::string;

    /// "`name.md` (TODO: to create)"
    [[nodiscard]] static auto todoMarker(std::string_view file_part) -> std::string;

private:
    auto tryBatchFix(Verdict* verdict) -> bool;
    auto tryAutoTodo(Verdict* verdict) -> bool;

    const ValidatorOptions& options_;
    const PathResolver& paths_;
    AnchorResolver anchors_;
    HistoryProbe* history_;
    DocumentEditor* editor_;
};

auto verdictKindToString(VerdictKind kind) noexcept -> const char*;

} // namespace DocLinks
