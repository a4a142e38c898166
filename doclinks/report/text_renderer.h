#pragma once

#include <string>

#include "doclinks/links/link_validator.h"
#include "doclinks/scan/run_statistics.h"

namespace DocLinks {

// ANSI colour sequences, all empty when colour is off
struct Palette {
    const char* green;
    const char* red;
    const char* yellow;
    const char* blue;
    const char* cyan;
    const char* magenta;
    const char* nc;
};

/// enabled should already account for stdout being a terminal
auto makePalette(bool enabled) noexcept -> Palette;

/// Formats the per-file and per-link lines of the text report
class TextRenderer {
public:
    TextRenderer(const Palette& palette, bool verbose) noexcept
        : palette_(palette), verbose_(verbose) {}

    auto fileHeader(const std::string& display_path, std::string* out) const -> void;
    auto verdict(const Verdict& verdict, std::string* out) const -> void;
    auto fileSummary(const RunStatistics& file_stats, std::string* out) const -> void;

    [[nodiscard]] auto palette() const noexcept -> const Palette& { return palette_; }
    [[nodiscard]] auto verbose() const noexcept -> bool { return verbose_; }

private:
    auto linePrefix(std::string* out, const char* color, const char* icon, uint32_t line) const -> void;

    Palette palette_;
    bool verbose_;
};

} // namespace DocLinks
