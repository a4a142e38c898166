#include <cstdio>
#include <cstring>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include <unistd.h>

#include "common/logging.h"
#include "common/time_utils.h"
#include "config/config.h"
#include "doclinks/links/history_probe.h"
#include "doclinks/paths/file_finder.h"
#include "doclinks/paths/path_resolver.h"
#include "doclinks/report/report_writer.h"
#include "doclinks/report/text_renderer.h"
#include "doclinks/scan/scan_orchestrator.h"

namespace {

constexpr int EXIT_ALL_VALID = 0;
constexpr int EXIT_BROKEN_LINKS = 1;
constexpr int EXIT_SETUP_ERROR = 2;

auto startLogging(const DocLinks::ValidatorConfig& config) -> void {
    char timestamp[32];
    if (!Common::formatFileTimestamp(timestamp, sizeof(timestamp))) {
        std::snprintf(timestamp, sizeof(timestamp), "%llu",
                      static_cast<unsigned long long>(Common::getWallClockNanos()));
    }

    char log_file[DocLinks::MAX_PATH_LEN + 64];
    std::snprintf(log_file, sizeof(log_file), "%s/doclinks_%s.log", config.paths.logs_dir, timestamp);

    Common::Logger::Level level = Common::Logger::INFO;
    if (!Common::Logger::parseLevel(config.logging.level, &level)) {
        level = Common::Logger::INFO;
    }
    Common::initLogging(log_file, level);

    LOG_INFO("=== DOCLINKS SESSION STARTED ===");
    LOG_INFO("Log file: %s", log_file);
}

auto makeValidatorOptions(const DocLinks::ValidatorConfig& config) -> DocLinks::ValidatorOptions {
    DocLinks::ValidatorOptions options;
    if (config.validation.fix_pattern[0] != '\0') {
        // Shape already checked by ConfigManager::validateConfig
        if (!DocLinks::ConfigManager::splitFixPattern(config.validation.fix_pattern,
                                                      &options.fix_old, &options.fix_new)) {
            LOG_ERROR("Ignoring malformed fix pattern %s", config.validation.fix_pattern);
        }
    }
    options.auto_todo = config.validation.auto_todo;
    options.warn_deep_paths = config.validation.warn_deep_paths;
    options.max_path_depth = config.validation.max_path_depth;
    options.extension = config.validation.extension;
    return options;
}

} // namespace

int main(int argc, char* argv[]) {
    const DocLinks::ArgsResult args = DocLinks::ConfigManager::init(argc, argv);
    if (args == DocLinks::ArgsResult::HELP) {
        DocLinks::ConfigManager::printUsage(argv[0]);
        return EXIT_ALL_VALID;
    }
    if (args != DocLinks::ArgsResult::OK) {
        std::fprintf(stderr, "Run '%s --help' for usage.\n", argv[0]);
        return EXIT_SETUP_ERROR;
    }

    const DocLinks::ValidatorConfig& config = DocLinks::ConfigManager::getConfig();
    startLogging(config);
    DocLinks::ConfigManager::printConfig(config);

    const bool json = config.output.format == DocLinks::OutputFormat::JSON;
    const bool color = config.output.color && ::isatty(STDOUT_FILENO) == 1;
    const DocLinks::Palette palette = DocLinks::makePalette(color);
    const DocLinks::ReportWriter report(palette);
    const bool multi_area = config.num_areas > 1;

    std::unique_ptr<DocLinks::GitHistoryProbe> history;
    if (config.validation.auto_todo) {
        history = std::make_unique<DocLinks::GitHistoryProbe>(config.paths.docs_dir);
    }

    DocLinks::ScanOptions options;
    options.parallel_jobs = config.validation.parallel_jobs;
    options.warm_cache = config.validation.warm_cache;
    options.verbose = config.output.verbose;
    options.render_text = !json;
    options.palette = palette;
    options.validator = makeValidatorOptions(config);

    if (multi_area && !json) {
        std::printf("%s========================================%s\n", palette.blue, palette.nc);
        std::printf("%s Multi-Area Link Validation%s\n", palette.blue, palette.nc);
        std::printf("%s========================================%s\n", palette.blue, palette.nc);
        std::printf("\n");
    }

    std::vector<DocLinks::AreaResult> results;
    bool stopped = false;

    for (uint32_t a = 0; a < config.num_areas && !stopped; ++a) {
        const DocLinks::ValidatorConfig::Area& area = config.areas[a];
        LOG_INFO("Validating area %s (%s)", area.name, area.path);

        DocLinks::FileFinder finder(config.validation.extension, area.exclude);
        std::vector<std::string> files;
        if (!finder.find(area.path, &files)) {
            std::fprintf(stderr, "ERROR: Cannot list documents in %s\n", area.path);
            Common::shutdownLogging();
            return EXIT_SETUP_ERROR;
        }

        if (!json) {
            report.writeHeader(stdout, area.name);
            if (files.empty()) {
                std::printf("No markdown files found in %s\n", area.path);
            } else {
                std::printf("Found %zu markdown files\n\n", files.size());
            }
            std::fflush(stdout);
        }

        const DocLinks::PathResolver paths(config.paths.docs_dir, area.path);
        DocLinks::ScanOrchestrator orchestrator(options, paths, history.get());

        DocLinks::AreaResult result = orchestrator.run(files, json ? nullptr : stdout);
        result.name = area.name;

        if (!json) {
            report.writeTextSummary(stdout, result.stats);
            if (multi_area) {
                std::printf("\n");
                report.writeAreaResult(stdout, result);
            }
        }

        if (result.stats.broken_links > 0 && config.validation.stop_on_error && a + 1 < config.num_areas) {
            LOG_WARN("Stopping after area %s: %u broken links", area.name, result.stats.broken_links);
            if (!json) {
                std::printf("%sStopping due to errors (--stop-on-error)%s\n\n", palette.red, palette.nc);
            }
            stopped = true;
        }
        results.push_back(std::move(result));
    }

    if (json) {
        const std::string document = DocLinks::ReportWriter::toJson(results);
        std::printf("%s\n", document.c_str());
    } else if (multi_area) {
        report.writeMultiAreaSummary(stdout, results);
    }

    uint32_t total_broken = 0;
    for (const auto& result : results) {
        total_broken += result.stats.broken_links;
    }

    LOG_INFO("=== DOCLINKS SESSION FINISHED: %zu area(s), %u broken link(s) ===", results.size(), total_broken);
    Common::shutdownLogging();

    return total_broken == 0 ? EXIT_ALL_VALID : EXIT_BROKEN_LINKS;
}
