#pragma once

#include <cstdio>
#include <string>
#include <vector>

#include "doclinks/scan/run_statistics.h"
#include "text_renderer.h"

namespace DocLinks {

/// Run-level report output: headers, the text summary block, the JSON
/// document and the multi-area summary.
class ReportWriter {
public:
    explicit ReportWriter(const Palette& palette) noexcept : palette_(palette) {}

    auto writeHeader(FILE* out, const std::string& area_name) const -> void;
    auto writeTextSummary(FILE* out, const RunStatistics& stats) const -> void;

    /// Per-area verdict line used when several areas are validated
    auto writeAreaResult(FILE* out, const AreaResult& area) const -> void;

    /// Final block after several areas; returns the number of areas with broken links
    auto writeMultiAreaSummary(FILE* out, const std::vector<AreaResult>& areas) const -> uint32_t;

    /// One area: {"summary":{...},"broken_links":[...],"warnings":[...],"deep_paths":[...]}.
    /// Several areas: {"areas":[<one object per area>]}
    [[nodiscard]] static auto toJson(const std::vector<AreaResult>& areas) -> std::string;

private:
    Palette palette_;
};

} // namespace DocLinks
