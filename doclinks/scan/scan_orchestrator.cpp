#include "scan_orchestrator.h"
#include "common/logging.h"
#include "common/thread_utils.h"
#include "common/time_utils.h"
#include "doclinks/links/document_editor.h"
#include "doclinks/links/link_extractor.h"
#include "doclinks/paths/file_finder.h"

#include <cerrno>
#include <cstring>
#include <exception>
#include <fstream>
#include <future>
#include <utility>

namespace DocLinks {

ScanOrchestrator::ScanOrchestrator(const ScanOptions& options, const PathResolver& paths,
                                   HistoryProbe* history) noexcept
    : options_(options),
      paths_(paths),
      history_(history),
      renderer_(options.palette, options.verbose) {
}

auto ScanOrchestrator::run(const std::vector<std::string>& files, FILE* out) -> AreaResult {
    AreaResult result;
    const uint64_t start_ns = Common::getNanosSinceEpoch();

    if (options_.parallel_jobs <= 1) {
        runSequential(files, out, &result);
    } else {
        runParallel(files, out, &result);
    }

    LOG_INFO("Scanned %u files, %u links (%u broken, %u warnings) in %.2f ms with %u job(s)",
             result.stats.total_files, result.stats.total_links, result.stats.broken_links,
             result.stats.warnings, Common::nanosToMillis(Common::getNanosSinceEpoch() - start_ns),
             options_.parallel_jobs);
    return result;
}

auto ScanOrchestrator::runSequential(const std::vector<std::string>& files, FILE* out, AreaResult* result) -> void {
    AnchorIndex index;
    DocumentEditor editor;
    LinkValidator validator(options_.validator, paths_, &index, history_, &editor);

    if (options_.warm_cache) {
        if (out && options_.render_text && options_.verbose) {
            std::fprintf(out, "%sWarming anchor cache...%s\n", options_.palette.blue, options_.palette.nc);
        }
        for (const auto& file : files) {
            index.ensureBuilt(file);
        }
        LOG_INFO("Warmed anchor cache for %zu files", index.size());
        if (out && options_.render_text && options_.verbose) {
            std::fprintf(out, "%sCached anchors for %zu files%s\n", options_.palette.green, index.size(), options_.palette.nc);
        }
    }

    for (const auto& file : files) {
        merge(scanFile(file, &validator), out, result);
    }
}

auto ScanOrchestrator::runParallel(const std::vector<std::string>& files, FILE* out, AreaResult* result) -> void {
    if (options_.warm_cache) {
        LOG_INFO("Cache warming skipped: anchor caches are private to each parallel task");
    }

    std::vector<std::future<FileScanResult>> pending;
    pending.reserve(files.size());

    {
        Common::ThreadPool pool(options_.parallel_jobs, "scan");

        for (const auto& file : files) {
            pending.push_back(pool.enqueue([this, &file]() {
                // Nothing here is shared with other tasks except the history probe
                AnchorIndex index;
                DocumentEditor editor;
                LinkValidator validator(options_.validator, paths_, &index, history_, &editor);
                return scanFile(file, &validator);
            }));
        }

        // Merge in submission order while later files are still scanning
        for (size_t i = 0; i < pending.size(); ++i) {
            FileScanResult file_result;
            try {
                file_result = pending[i].get();
            } catch (const std::exception& e) {
                LOG_ERROR("Scan of %s failed: %s", files[i].c_str(), e.what());
                file_result = FileScanResult{};
                file_result.file = files[i];
                file_result.stats.total_files = 1;
            }
            merge(std::move(file_result), out, result);
        }
    }
}

auto ScanOrchestrator::merge(FileScanResult&& file_result, FILE* out, AreaResult* result) const -> void {
    result->stats += file_result.stats;
    for (auto& f : file_result.broken) result->broken.push_back(std::move(f));
    for (auto& f : file_result.warnings) result->warnings.push_back(std::move(f));
    for (auto& f : file_result.deep_paths) result->deep_paths.push_back(std::move(f));

    if (out && options_.render_text && !file_result.text.empty()) {
        std::fwrite(file_result.text.data(), 1, file_result.text.size(), out);
        std::fflush(out);
    }
}

auto ScanOrchestrator::scanFile(const std::string& file, LinkValidator* validator) const -> FileScanResult {
    FileScanResult result;
    result.file = file;
    result.stats.total_files = 1;

    if (options_.render_text) {
        renderer_.fileHeader(FileFinder::displayPath(paths_.areaRoot(), file), &result.text);
    }

    std::ifstream in(file);
    if (!in) {
        LOG_WARN("Cannot read %s: %s", file.c_str(), std::strerror(errno));
        return result;
    }
    result.readable = true;

    // Read up front: fixes and TODO markers rewrite the file while it is scanned
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(std::move(line));
    }
    in.close();

    std::vector<std::string> links;
    for (size_t i = 0; i < lines.size(); ++i) {
        links.clear();
        if (extractLinks(lines[i], options_.validator.extension, &links) == 0) {
            continue;
        }

        const auto line_no = static_cast<uint32_t>(i + 1);
        for (const auto& link : links) {
            const Verdict verdict = validator->validate(file, line_no, link);
            result.stats.record(verdict);

            if (options_.render_text) {
                renderer_.verdict(verdict, &result.text);
            }
            if (verdict.deep_path) {
                result.deep_paths.push_back(Finding{file, line_no, link, std::string(), verdict.depth});
            }
            if (verdict.kind == VerdictKind::BROKEN) {
                result.broken.push_back(Finding{file, line_no, link, verdict.typeName(), 0});
            } else if (verdict.kind == VerdictKind::ANCHOR_WARNING) {
                result.warnings.push_back(Finding{file, line_no, link, verdict.typeName(), 0});
            }
        }
    }

    if (options_.render_text) {
        renderer_.fileSummary(result.stats, &result.text);
    }

    LOG_DEBUG("%s: %u links, %u broken", file.c_str(), result.stats.total_links, result.stats.broken_links);
    return result;
}

} // namespace DocLinks
