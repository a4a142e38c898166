#include "link_validator.h"
#include "common/logging.h"

#include <filesystem>
#include <system_error>

namespace DocLinks {

auto Verdict::typeName() const noexcept -> const char* {
    if (kind == VerdictKind::ANCHOR_WARNING) {
        return "anchor_not_found";
    }
    switch (reason) {
        case BrokenReason::ANCHOR:         return "anchor";
        case BrokenReason::FILE_NOT_FOUND: return "file_not_found";
        default:                           return "none";
    }
}

auto verdictKindToString(VerdictKind kind) noexcept -> const char* {
    switch (kind) {
        case VerdictKind::INTERNAL_VALID: return "internal_valid";
        case VerdictKind::EXTERNAL_VALID: return "external_valid";
        case VerdictKind::ANCHOR_WARNING: return "anchor_warning";
        case VerdictKind::BROKEN:         return "broken";
        default:                          return "unknown";
    }
}

LinkValidator::LinkValidator(const ValidatorOptions& options, const PathResolver& paths,
                             AnchorIndex* index, HistoryProbe* history, DocumentEditor* editor) noexcept
    : options_(options),
      paths_(paths),
      anchors_(index),
      history_(history),
      editor_(editor) {
}

auto LinkValidator::validate(const std::string& source, uint32_t line, const std::string& link) -> Verdict {
    Verdict verdict;
    verdict.source = source;
    verdict.line = line;
    verdict.link = link;

    if (hasExternalScheme(link)) {
        verdict.kind = VerdictKind::EXTERNAL_VALID;
        verdict.action = LinkAction::SKIPPED_EXTERNAL;
        verdict.internal = false;
        return verdict;
    }

    verdict.depth = PathResolver::countDepth(link);
    verdict.deep_path = options_.warn_deep_paths && verdict.depth > options_.max_path_depth;

    // Anchor into the document being scanned
    if (!link.empty() && link.front() == '#') {
        verdict.anchor = link;
        verdict.resolved = source;
        if (anchors_.exists(source, link)) {
            verdict.kind = VerdictKind::INTERNAL_VALID;
        } else {
            verdict.kind = VerdictKind::BROKEN;
            verdict.reason = BrokenReason::ANCHOR;
        }
        return verdict;
    }

    const size_t hash = link.find('#');
    verdict.file_part = link.substr(0, hash);
    if (hash != std::string::npos) {
        verdict.anchor = link.substr(hash);
    }

    if (!options_.fix_old.empty() && link.find(options_.fix_old) != std::string::npos) {
        if (tryBatchFix(&verdict)) {
            return verdict;
        }
    }

    verdict.resolved = paths_.resolve(source, verdict.file_part);
    verdict.internal = paths_.isInternal(verdict.resolved);

    std::error_code ec;
    const bool exists = std::filesystem::is_regular_file(verdict.resolved, ec) && !ec;
    if (!exists) {
        if (options_.auto_todo && tryAutoTodo(&verdict)) {
            verdict.kind = verdict.internal ? VerdictKind::INTERNAL_VALID : VerdictKind::EXTERNAL_VALID;
            return verdict;
        }
        verdict.kind = VerdictKind::BROKEN;
        verdict.reason = BrokenReason::FILE_NOT_FOUND;
        return verdict;
    }

    if (!verdict.anchor.empty() && !anchors_.exists(verdict.resolved, verdict.anchor)) {
        verdict.kind = VerdictKind::ANCHOR_WARNING;
        return verdict;
    }

    verdict.kind = verdict.internal ? VerdictKind::INTERNAL_VALID : VerdictKind::EXTERNAL_VALID;
    return verdict;
}

auto LinkValidator::tryBatchFix(Verdict* verdict) -> bool {
    const std::string fixed = replaceAll(verdict->link, options_.fix_old, options_.fix_new);
    if (!editor_->replaceLinkTarget(verdict->source, verdict->line, verdict->link, fixed)) {
        LOG_WARN("Batch fix not applied at %s:%u (%s)", verdict->source.c_str(), verdict->line, verdict->link.c_str());
        return false;
    }

    LOG_INFO("Batch fix %s:%u: %s -> %s", verdict->source.c_str(), verdict->line,
             verdict->link.c_str(), fixed.c_str());
    verdict->fixed_link = fixed;
    verdict->action = LinkAction::BATCH_FIXED;
    verdict->kind = VerdictKind::INTERNAL_VALID;
    verdict->internal = true;
    return true;
}

auto LinkValidator::tryAutoTodo(Verdict* verdict) -> bool {
    if (!history_) {
        return false;
    }

    const std::string name = std::filesystem::path(verdict->file_part).filename().string();
    const HistoryProbe::Result history = history_->lookup(name);
    if (history == HistoryProbe::Result::FOUND) {
        verdict->history_found = true;
        LOG_INFO("Not marking %s as TODO: %s has history", verdict->link.c_str(), name.c_str());
        return false;
    }
    if (history == HistoryProbe::Result::UNAVAILABLE) {
        LOG_WARN("History unavailable for %s, leaving link broken", name.c_str());
        return false;
    }

    if (!editor_->replaceLinkMarkup(verdict->source, verdict->line, verdict->link, todoMarker(verdict->file_part))) {
        LOG_WARN("TODO marker not applied at %s:%u (%s)", verdict->source.c_str(), verdict->line, verdict->link.c_str());
        return false;
    }

    LOG_INFO("Marked %s:%u as TODO (%s)", verdict->source.c_str(), verdict->line, verdict->link.c_str());
    verdict->action = LinkAction::TODO_MARKED;
    return true;
}

auto LinkValidator::hasExternalScheme(std::string_view link) noexcept -> bool {
    constexpr std::string_view SCHEMES[] = {"http://", "https://", "ftp://", "mailto:"};
    for (const auto scheme : SCHEMES) {
        if (link.substr(0, scheme.size()) == scheme) {
            return true;
        }
    }
    return false;
}

auto LinkValidator::replaceAll(std::string text, std::string_view from, std::string_view to) -> std::string {
    if (from.empty()) {
        return text;
    }
    size_t pos = text.find(from);
    while (pos != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos = text.find(from, pos + to.size());
    }
    return text;
}

auto LinkValidator::todoMarker(std::string_view file_part) -> std::string {
    const std::string name = std::filesystem::path(std::string(file_part)).filename().string();
    return "`" + name + "` (TODO: to create)";
}

} // namespace DocLinks
