#include "text_renderer.h"

namespace DocLinks {

auto makePalette(bool enabled) noexcept -> Palette {
    if (!enabled) {
        return Palette{"", "", "", "", "", "", ""};
    }
    return Palette{
        "\033[0;32m",
        "\033[0;31m",
        "\033[1;33m",
        "\033[0;34m",
        "\033[0;36m",
        "\033[0;35m",
        "\033[0m"
    };
}

auto TextRenderer::fileHeader(const std::string& display_path, std::string* out) const -> void {
    out->append(palette_.blue).append("Scanning:").append(palette_.nc).append(" ");
    out->append(display_path).append("\n");
}

// "  <icon> Line N: "
auto TextRenderer::linePrefix(std::string* out, const char* color, const char* icon, uint32_t line) const -> void {
    out->append("  ").append(color).append(icon).append(palette_.nc);
    out->append(" Line ").append(std::to_string(line)).append(": ");
}

auto TextRenderer::verdict(const Verdict& v, std::string* out) const -> void {
    if (v.action == LinkAction::SKIPPED_EXTERNAL) {
        if (verbose_) {
            linePrefix(out, palette_.cyan, "\xE2\x8F\xAD ", v.line);
            out->append("External link skipped: ").append(v.link).append("\n");
        }
        return;
    }

    if (v.deep_path) {
        linePrefix(out, palette_.magenta, "\xF0\x9F\x93\x8F", v.line);
        out->append("Deep path (").append(std::to_string(v.depth)).append(" levels): ").append(v.link).append("\n");
        if (verbose_) {
            out->append("      Consider: absolute path from the docs root or shorter relative\n");
        }
    }

    // Anchor-only link
    if (!v.link.empty() && v.link.front() == '#') {
        if (v.kind == VerdictKind::BROKEN) {
            linePrefix(out, palette_.red, "\xE2\x9D\x8C", v.line);
            out->append("Anchor not found: ").append(v.link).append("\n");
        } else if (verbose_) {
            linePrefix(out, palette_.green, "\xE2\x9C\x85", v.line);
            out->append("Anchor valid: ").append(v.link).append("\n");
        }
        return;
    }

    if (v.action == LinkAction::BATCH_FIXED) {
        linePrefix(out, palette_.green, "\xF0\x9F\x94\xA7", v.line);
        out->append("Fixing: ").append(v.link).append(" \xE2\x86\x92 ").append(v.fixed_link).append("\n");
        return;
    }

    if (v.history_found && verbose_) {
        out->append("      Git history found - not marking as TODO\n");
    }

    if (v.action == LinkAction::TODO_MARKED) {
        linePrefix(out, palette_.cyan, "\xF0\x9F\x93\x9D", v.line);
        out->append("Marked as TODO: ").append(v.link).append("\n");
        return;
    }

    if (v.kind == VerdictKind::BROKEN) {
        linePrefix(out, palette_.red, "\xE2\x9D\x8C", v.line);
        out->append(v.internal ? "File not found: " : "External link broken: ").append(v.file_part).append("\n");
        if (verbose_) {
            out->append("      Resolved to: ").append(v.resolved).append("\n");
        }
        return;
    }

    if (v.kind == VerdictKind::ANCHOR_WARNING) {
        linePrefix(out, palette_.yellow, "\xE2\x9A\xA0\xEF\xB8\x8F ", v.line);
        out->append("Anchor not found: ").append(v.anchor).append(" in ").append(v.file_part).append("\n");
        return;
    }

    if (!verbose_) {
        return;
    }

    if (v.resolved.find("/archive/") != std::string::npos) {
        linePrefix(out, palette_.yellow, "\xE2\x9A\xA0\xEF\xB8\x8F ", v.line);
        out->append("Link to archive (deprecated): ").append(v.file_part).append("\n");
    }

    linePrefix(out, palette_.green, "\xE2\x9C\x85", v.line);
    if (v.kind == VerdictKind::EXTERNAL_VALID) {
        out->append("External link valid: ");
    }
    out->append(v.link).append("\n");
}

auto TextRenderer::fileSummary(const RunStatistics& file_stats, std::string* out) const -> void {
    if (file_stats.total_links == 0) {
        return;
    }
    const std::string links = std::to_string(file_stats.total_links);
    const std::string rate = std::to_string(file_stats.successRate());
    if (file_stats.broken_links == 0) {
        out->append("  ").append(palette_.green).append("\xE2\x9C\x93").append(palette_.nc);
        out->append(" ").append(links).append(" links, all valid (").append(rate).append("%)\n");
    } else {
        out->append("  ").append(palette_.red).append("\xE2\x9C\x97").append(palette_.nc);
        out->append(" ").append(links).append(" links, ").append(std::to_string(file_stats.broken_links));
        out->append(" broken (").append(rate).append("% valid)\n");
    }
}

} // namespace DocLinks
