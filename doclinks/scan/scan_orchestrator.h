#pragma once

#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

#include "doclinks/anchors/anchor_index.h"
#include "doclinks/links/history_probe.h"
#include "doclinks/links/link_validator.h"
#include "doclinks/paths/path_resolver.h"
#include "doclinks/report/text_renderer.h"
#include "run_statistics.h"

namespace DocLinks {

struct ScanOptions {
    uint32_t parallel_jobs = 1;
    bool warm_cache = false;
    bool verbose = false;
    bool render_text = true;      // false in JSON mode
    Palette palette = makePalette(false);
    ValidatorOptions validator;
};

/// Everything one document contributes; filled by exactly one worker
struct FileScanResult {
    std::string file;
    bool readable = false;
    RunStatistics stats;
    std::string text;
    std::vector<Finding> broken;
    std::vector<Finding> warnings;
    std::vector<Finding> deep_paths;
};

/// Drives the link validator over a list of documents. With one job the
/// documents are scanned in order on the calling thread; with N jobs a
/// pool of N workers scans whole documents into private results, which
/// are merged and printed in list order once each is ready.
class ScanOrchestrator {
public:
    ScanOrchestrator(const ScanOptions& options, const PathResolver& paths, HistoryProbe* history) noexcept;

    ScanOrchestrator(const ScanOrchestrator&) = delete;
    ScanOrchestrator& operator=(const ScanOrchestrator&) = delete;

    /// Text lines go to out (if not null) in list order
    auto run(const std::vector<std::string>& files, FILE* out) -> AreaResult;

    /// Scans one document with the given validator
    auto scanFile(const std::string& file, LinkValidator* validator) const -> FileScanResult;

private:
    auto runSequential(const std::vector<std::string>& files, FILE* out, AreaResult* result) -> void;
    auto runParallel(const std::vector<std::string>& files, FILE* out, AreaResult* result) -> void;
    auto merge(FileScanResult&& file_result, FILE* out, AreaResult* result) const -> void;

    const ScanOptions& options_;
    const PathResolver& paths_;
    HistoryProbe* history_;
    TextRenderer renderer_;
};

} // namespace DocLinks
