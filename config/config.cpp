#include "config.h"
#include "common/logging.h"
#include "common/thread_utils.h"
#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <new>
#include <regex>
#include <system_error>

namespace DocLinks {

// Static member definitions
ValidatorConfig ConfigManager::config_{};
bool ConfigManager::initialized_ = false;

namespace {

// Matches "--name value" and "--name=value"; the value is nullptr when
// the option matched but its argument is missing
auto matchOption(const char* arg, const char* name, int argc, char** argv, int* i,
                 const char** value) noexcept -> bool {
    const size_t n = std::strlen(name);
    if (std::strncmp(arg, name, n) != 0) {
        return false;
    }
    if (arg[n] == '=') {
        *value = arg + n + 1;
        return true;
    }
    if (arg[n] != '\0') {
        return false;
    }
    *value = (*i + 1 < argc) ? argv[++(*i)] : nullptr;
    return true;
}

auto parseUint(const char* text, uint32_t* out) noexcept -> bool {
    if (!text || *text == '\0') {
        return false;
    }
    char* end = nullptr;
    const unsigned long value = std::strtoul(text, &end, 10);
    if (*end != '\0' || value > 0xFFFFFFFFUL) {
        return false;
    }
    *out = static_cast<uint32_t>(value);
    return true;
}

auto copyString(char* dest, size_t max_len, const char* src) noexcept -> void {
    std::snprintf(dest, max_len, "%s", src);
}

auto parseFormat(const char* text, OutputFormat* out) noexcept -> bool {
    if (std::strcmp(text, "text") == 0) {
        *out = OutputFormat::TEXT;
        return true;
    }
    if (std::strcmp(text, "json") == 0) {
        *out = OutputFormat::JSON;
        return true;
    }
    return false;
}

auto skipSpaces(const char* s) noexcept -> const char* {
    while (*s == ' ' || *s == '\t') {
        ++s;
    }
    return s;
}

} // namespace

auto makeDefaultConfig() noexcept -> ValidatorConfig {
    ValidatorConfig config{};

    const char* env_logs = std::getenv("DOCLINKS_LOGS_DIR");
    copyString(config.paths.logs_dir, sizeof(config.paths.logs_dir),
               (env_logs && *env_logs) ? env_logs : "/tmp");

    copyString(config.logging.level, sizeof(config.logging.level), "info");

    config.validation.parallel_jobs = 2;
    config.validation.auto_todo = false;
    config.validation.warn_deep_paths = true;
    config.validation.max_path_depth = 5;
    config.validation.warm_cache = false;
    copyString(config.validation.extension, sizeof(config.validation.extension), ".md");
    config.validation.stop_on_error = false;

    config.output.format = OutputFormat::TEXT;
    config.output.verbose = false;
    config.output.color = true;

    config.num_areas = 0;
    config.is_valid = false;
    return config;
}

auto ConfigManager::init(int argc, char** argv) noexcept -> ArgsResult {
    if (initialized_) {
        LOG_WARN("ConfigManager already initialized");
        return ArgsResult::OK;
    }

    ValidatorConfig config = makeDefaultConfig();

    // The config file is the base layer; every other option overrides it
    for (int i = 1; i < argc; ++i) {
        const char* value = nullptr;
        if (matchOption(argv[i], "--config", argc, argv, &i, &value)) {
            if (!value) {
                std::fprintf(stderr, "Option --config requires a value\n");
                return ArgsResult::ERROR;
            }
            if (!parseTomlFile(value, &config)) {
                std::fprintf(stderr, "Failed to parse config file: %s\n", value);
                return ArgsResult::ERROR;
            }
        }
    }

    try {
        const ArgsResult args = parseArgs(argc, argv, &config);
        if (args != ArgsResult::OK) {
            return args;
        }

        if (!validateConfig(&config)) {
            return ArgsResult::ERROR;
        }
    } catch (const std::bad_alloc&) {
        std::fprintf(stderr, "Out of memory reading the configuration\n");
        return ArgsResult::ERROR;
    }

    config.is_valid = true;
    config_ = config;
    initialized_ = true;
    return ArgsResult::OK;
}

auto ConfigManager::reset() noexcept -> void {
    config_ = ValidatorConfig{};
    initialized_ = false;
}

auto ConfigManager::parseTomlFile(const char* filepath, ValidatorConfig* config) noexcept -> bool {
    FILE* file = std::fopen(filepath, "r");
    if (!file) {
        LOG_ERROR("Cannot open config file: %s", filepath);
        return false;
    }

    char line[2048];
    char current_section[128] = "";
    bool ok = true;

    while (std::fgets(line, sizeof(line), file)) {
        // Remove trailing newline
        size_t len = std::strlen(line);
        while (len > 0 && (line[len - 1] == '\n' || line[len - 1] == '\r')) {
            line[--len] = '\0';
        }

        const char* content = skipSpaces(line);

        // Skip comments and empty lines
        if (*content == '#' || *content == '\0') {
            continue;
        }

        // Section header
        if (*content == '[') {
            const char* end = std::strchr(content, ']');
            if (!end) {
                LOG_ERROR("Malformed section header in %s: %s", filepath, content);
                ok = false;
                break;
            }
            const size_t n = std::min(static_cast<size_t>(end - content - 1), sizeof(current_section) - 1);
            std::memcpy(current_section, content + 1, n);
            current_section[n] = '\0';

            if (std::strncmp(current_section, "area.", 5) == 0) {
                if (!findArea(config, current_section + 5)) {
                    LOG_ERROR("Too many areas in %s (max %zu)", filepath, MAX_AREAS);
                    ok = false;
                    break;
                }
            }
            continue;
        }

        uint64_t temp;
        if (std::strcmp(current_section, "paths") == 0) {
            extractStringValue(content, "docs_dir", config->paths.docs_dir, sizeof(config->paths.docs_dir));
            extractStringValue(content, "logs_dir", config->paths.logs_dir, sizeof(config->paths.logs_dir));
        }
        else if (std::strcmp(current_section, "logging") == 0) {
            extractStringValue(content, "level", config->logging.level, sizeof(config->logging.level));
        }
        else if (std::strcmp(current_section, "validation") == 0) {
            if (extractUintValue(content, "parallel_jobs", &temp)) config->validation.parallel_jobs = static_cast<uint32_t>(temp);
            extractStringValue(content, "fix_pattern", config->validation.fix_pattern, sizeof(config->validation.fix_pattern));
            extractBoolValue(content, "auto_todo", &config->validation.auto_todo);
            extractBoolValue(content, "warn_deep_paths", &config->validation.warn_deep_paths);
            if (extractUintValue(content, "max_path_depth", &temp)) config->validation.max_path_depth = static_cast<uint32_t>(temp);
            extractBoolValue(content, "warm_cache", &config->validation.warm_cache);
            extractStringValue(content, "extension", config->validation.extension, sizeof(config->validation.extension));
            extractBoolValue(content, "stop_on_error", &config->validation.stop_on_error);
        }
        else if (std::strcmp(current_section, "output") == 0) {
            char format[16];
            if (extractStringValue(content, "format", format, sizeof(format)) &&
                !parseFormat(format, &config->output.format)) {
                LOG_ERROR("Unknown output format in %s: %s", filepath, format);
                ok = false;
                break;
            }
            extractBoolValue(content, "verbose", &config->output.verbose);
            extractBoolValue(content, "color", &config->output.color);
        }
        else if (std::strncmp(current_section, "area.", 5) == 0) {
            ValidatorConfig::Area* area = findArea(config, current_section + 5);
            if (area) {
                extractStringValue(content, "path", area->path, sizeof(area->path));
                extractStringValue(content, "exclude", area->exclude, sizeof(area->exclude));
            }
        }
        else {
            LOG_WARN("Ignoring key in unknown section [%s]: %s", current_section, content);
        }
    }

    std::fclose(file);
    if (ok) {
        LOG_INFO("Loaded config file %s (%u areas)", filepath, config->num_areas);
    }
    return ok;
}

auto ConfigManager::parseArgs(int argc, char** argv, ValidatorConfig* config) -> ArgsResult {
    const char* area_dir = nullptr;
    const char* area_name = nullptr;
    const char* exclude = nullptr;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        const char* value = nullptr;

        if (std::strcmp(arg, "-h") == 0 || std::strcmp(arg, "--help") == 0) {
            return ArgsResult::HELP;
        }
        else if (std::strcmp(arg, "-v") == 0 || std::strcmp(arg, "--verbose") == 0) {
            config->output.verbose = true;
            continue;
        }
        else if (std::strcmp(arg, "--no-color") == 0) {
            config->output.color = false;
            continue;
        }
        else if (std::strcmp(arg, "--auto-todo") == 0) {
            config->validation.auto_todo = true;
            continue;
        }
        else if (std::strcmp(arg, "--no-deep-path-warning") == 0) {
            config->validation.warn_deep_paths = false;
            continue;
        }
        else if (std::strcmp(arg, "--warm-cache") == 0) {
            config->validation.warm_cache = true;
            continue;
        }
        else if (std::strcmp(arg, "--stop-on-error") == 0) {
            config->validation.stop_on_error = true;
            continue;
        }

        // Options taking a value
        const char* option = arg;
        if (matchOption(arg, "--config", argc, argv, &i, &value)) {
            // Already applied by init()
        }
        else if (matchOption(arg, "-j", argc, argv, &i, &value) ||
                 matchOption(arg, "--parallel-jobs", argc, argv, &i, &value)) {
            if (value && !parseUint(value, &config->validation.parallel_jobs)) {
                std::fprintf(stderr, "Invalid job count: %s\n", value);
                return ArgsResult::ERROR;
            }
        }
        else if (matchOption(arg, "--max-path-depth", argc, argv, &i, &value)) {
            if (value && !parseUint(value, &config->validation.max_path_depth)) {
                std::fprintf(stderr, "Invalid path depth: %s\n", value);
                return ArgsResult::ERROR;
            }
        }
        else if (matchOption(arg, "--output-format", argc, argv, &i, &value)) {
            if (value && !parseFormat(value, &config->output.format)) {
                std::fprintf(stderr, "Unknown output format: %s (expected text or json)\n", value);
                return ArgsResult::ERROR;
            }
        }
        else if (matchOption(arg, "--fix-pattern", argc, argv, &i, &value)) {
            if (value) copyString(config->validation.fix_pattern, sizeof(config->validation.fix_pattern), value);
        }
        else if (matchOption(arg, "--docs-dir", argc, argv, &i, &value)) {
            if (value) copyString(config->paths.docs_dir, sizeof(config->paths.docs_dir), value);
        }
        else if (matchOption(arg, "--logs-dir", argc, argv, &i, &value)) {
            if (value) copyString(config->paths.logs_dir, sizeof(config->paths.logs_dir), value);
        }
        else if (matchOption(arg, "--log-level", argc, argv, &i, &value)) {
            if (value) copyString(config->logging.level, sizeof(config->logging.level), value);
        }
        else if (matchOption(arg, "--area-dir", argc, argv, &i, &value)) {
            area_dir = value;
        }
        else if (matchOption(arg, "--area-name", argc, argv, &i, &value)) {
            area_name = value;
        }
        else if (matchOption(arg, "--exclude", argc, argv, &i, &value)) {
            exclude = value;
        }
        else {
            std::fprintf(stderr, "Unknown option: %s\n", arg);
            return ArgsResult::ERROR;
        }

        if (!value) {
            std::fprintf(stderr, "Option %s requires a value\n", option);
            return ArgsResult::ERROR;
        }
    }

    // An area given on the command line replaces the configured ones
    if (area_dir) {
        ValidatorConfig::Area& area = config->areas[0];
        area = ValidatorConfig::Area{};
        copyString(area.path, sizeof(area.path), area_dir);
        if (area_name) {
            copyString(area.name, sizeof(area.name), area_name);
        } else {
            std::filesystem::path p(area_dir);
            const std::string base = p.lexically_normal().filename().string();
            copyString(area.name, sizeof(area.name), base.empty() ? area_dir : base.c_str());
        }
        config->num_areas = 1;
    }
    else if (area_name && config->num_areas > 0) {
        copyString(config->areas[0].name, sizeof(config->areas[0].name), area_name);
    }

    if (exclude) {
        for (uint32_t a = 0; a < config->num_areas; ++a) {
            copyString(config->areas[a].exclude, sizeof(config->areas[a].exclude), exclude);
        }
    }

    return ArgsResult::OK;
}

auto ConfigManager::validateConfig(ValidatorConfig* config) -> bool {
    if (config->num_areas == 0) {
        std::fprintf(stderr, "No area configured (use --area-dir or an [area.<name>] section)\n");
        return false;
    }

    if (config->validation.parallel_jobs < 1 ||
        config->validation.parallel_jobs > Common::ThreadPool::MAX_THREADS) {
        std::fprintf(stderr, "parallel_jobs must be between 1 and %zu (got %u)\n",
                     Common::ThreadPool::MAX_THREADS, config->validation.parallel_jobs);
        return false;
    }

    Common::Logger::Level level;
    if (!Common::Logger::parseLevel(config->logging.level, &level)) {
        std::fprintf(stderr, "Unknown log level: %s\n", config->logging.level);
        return false;
    }

    if (config->validation.fix_pattern[0] != '\0') {
        std::string old_part;
        std::string new_part;
        if (!splitFixPattern(config->validation.fix_pattern, &old_part, &new_part)) {
            std::fprintf(stderr, "Invalid fix pattern '%s' (expected OLD:NEW)\n", config->validation.fix_pattern);
            return false;
        }
    }

    if (config->validation.extension[0] == '\0') {
        std::fprintf(stderr, "File extension must not be empty\n");
        return false;
    }

    for (uint32_t a = 0; a < config->num_areas; ++a) {
        ValidatorConfig::Area& area = config->areas[a];
        if (area.path[0] == '\0') {
            std::fprintf(stderr, "Area '%s' has no path\n", area.name);
            return false;
        }
        if (!canonicalDir(area.path, sizeof(area.path))) {
            std::fprintf(stderr, "Area directory not found: %s\n", area.path);
            return false;
        }
        if (area.name[0] == '\0') {
            const std::string base = std::filesystem::path(area.path).filename().string();
            copyString(area.name, sizeof(area.name), base.c_str());
        }
        if (area.exclude[0] != '\0') {
            try {
                std::regex probe(area.exclude, std::regex::extended);
                (void)probe;
            } catch (const std::regex_error& e) {
                std::fprintf(stderr, "Invalid exclude pattern '%s' for area '%s': %s\n",
                             area.exclude, area.name, e.what());
                return false;
            }
        }
    }

    if (config->paths.docs_dir[0] == '\0') {
        copyString(config->paths.docs_dir, sizeof(config->paths.docs_dir), config->areas[0].path);
    }
    if (!canonicalDir(config->paths.docs_dir, sizeof(config->paths.docs_dir))) {
        std::fprintf(stderr, "Docs directory not found: %s\n", config->paths.docs_dir);
        return false;
    }

    if (config->paths.logs_dir[0] == '\0') {
        std::fprintf(stderr, "logs_dir not configured\n");
        return false;
    }

    return true;
}

auto ConfigManager::splitFixPattern(const char* pattern, std::string* old_part, std::string* new_part) -> bool {
    const char* colon = std::strchr(pattern, ':');
    if (!colon || colon == pattern) {
        return false;
    }
    old_part->assign(pattern, static_cast<size_t>(colon - pattern));
    new_part->assign(colon + 1);
    return true;
}

auto ConfigManager::printUsage(const char* program) noexcept -> void {
    const char* usage = R"(
USAGE: %s [OPTIONS]

Validates Markdown links (file targets and #anchors) in one or more areas.

AREA SELECTION:
    --area-dir <path>            Directory to validate
    --area-name <name>           Name shown in reports (default: directory name)
    --exclude <regex>            Skip files under directories matching regex
    --docs-dir <path>            Root for "/"-prefixed links (default: area dir)
    --config <file>              Load settings and [area.<name>] sections from file

OPTIONS:
    -v, --verbose                Show detailed output for all links
    --no-color                   Disable colored output
    -j N, --parallel-jobs=N      Run N parallel jobs (default: 2)
    --output-format=FORMAT       Output format: text (default) or json
    --fix-pattern=OLD:NEW        Rewrite links containing OLD to use NEW
    --auto-todo                  Mark missing files as TODO when they have no git history
    --no-deep-path-warning       Disable deep path warnings
    --max-path-depth=N           Max ../ levels before warning (default: 5)
    --warm-cache                 Pre-build anchor cache for all files
    --stop-on-error              Stop after the first area with broken links
    --log-level=LEVEL            debug, info, warn, error (default: info)
    --logs-dir <path>            Log file directory (default: $DOCLINKS_LOGS_DIR or /tmp)
    -h, --help                   Show this help message

EXAMPLES:
    %s --area-dir docs                               # Basic validation
    %s --area-dir docs -v -j 4                       # Verbose with 4 parallel jobs
    %s --area-dir docs --output-format=json          # JSON output for CI/CD
    %s --area-dir docs --fix-pattern="ref/ops/:ref/ops/emergency/"
    %s --config doclinks.toml --stop-on-error        # All configured areas

EXIT CODES:
    0 - All links valid
    1 - Broken links found
    2 - Usage or setup error
)";

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wformat-nonliteral"
    std::fprintf(stdout, usage, program, program, program, program, program, program);
#pragma GCC diagnostic pop
}

auto ConfigManager::printConfig(const ValidatorConfig& config) noexcept -> void {
    LOG_INFO("=== Link Validator Configuration ===");
    LOG_INFO("Paths:");
    LOG_INFO("  Docs: %s", config.paths.docs_dir);
    LOG_INFO("  Logs: %s", config.paths.logs_dir);
    LOG_INFO("Validation:");
    LOG_INFO("  Parallel jobs: %u", config.validation.parallel_jobs);
    LOG_INFO("  Fix pattern: %s", config.validation.fix_pattern[0] ? config.validation.fix_pattern : "(none)");
    LOG_INFO("  Auto-TODO: %s", config.validation.auto_todo ? "Enabled" : "Disabled");
    LOG_INFO("  Deep path warnings: %s (max depth %u)",
             config.validation.warn_deep_paths ? "Enabled" : "Disabled", config.validation.max_path_depth);
    LOG_INFO("  Warm cache: %s", config.validation.warm_cache ? "Enabled" : "Disabled");
    LOG_INFO("  Extension: %s", config.validation.extension);
    LOG_INFO("Output: %s%s%s", config.output.format == OutputFormat::JSON ? "json" : "text",
             config.output.verbose ? ", verbose" : "", config.output.color ? ", color" : "");
    LOG_INFO("Areas:");
    for (uint32_t a = 0; a < config.num_areas; ++a) {
        LOG_INFO("  %s: %s (exclude: %s)", config.areas[a].name, config.areas[a].path,
                 config.areas[a].exclude[0] ? config.areas[a].exclude : "none");
    }
    LOG_INFO("=====================================");
}

auto ConfigManager::extractStringValue(const char* line, const char* key, char* value, size_t max_len) noexcept -> bool {
    char key_pattern[128];
    std::snprintf(key_pattern, sizeof(key_pattern), "%s = \"", key);

    if (std::strncmp(line, key_pattern, std::strlen(key_pattern)) != 0) {
        return false;
    }

    const char* start = line + std::strlen(key_pattern);
    const char* end = std::strrchr(start, '"');
    if (!end) {
        return false;
    }

    size_t len = static_cast<size_t>(end - start);
    if (len >= max_len) {
        len = max_len - 1;
    }

    std::memcpy(value, start, len);
    value[len] = '\0';

    return true;
}

auto ConfigManager::extractUintValue(const char* line, const char* key, uint64_t* value) noexcept -> bool {
    char key_pattern[128];
    std::snprintf(key_pattern, sizeof(key_pattern), "%s = ", key);

    if (std::strncmp(line, key_pattern, std::strlen(key_pattern)) != 0) {
        return false;
    }

    const char* start = line + std::strlen(key_pattern);
    char* end = nullptr;
    *value = std::strtoull(start, &end, 10);
    return end != start;
}

auto ConfigManager::extractBoolValue(const char* line, const char* key, bool* value) noexcept -> bool {
    char key_pattern[128];
    std::snprintf(key_pattern, sizeof(key_pattern), "%s = ", key);

    if (std::strncmp(line, key_pattern, std::strlen(key_pattern)) != 0) {
        return false;
    }

    const char* start = line + std::strlen(key_pattern);
    *value = (std::strncmp(start, "true", 4) == 0);
    return true;
}

auto ConfigManager::findArea(ValidatorConfig* config, const char* name) noexcept -> ValidatorConfig::Area* {
    for (uint32_t a = 0; a < config->num_areas; ++a) {
        if (std::strcmp(config->areas[a].name, name) == 0) {
            return &config->areas[a];
        }
    }
    if (config->num_areas >= MAX_AREAS) {
        return nullptr;
    }
    ValidatorConfig::Area& area = config->areas[config->num_areas++];
    area = ValidatorConfig::Area{};
    copyString(area.name, sizeof(area.name), name);
    return &area;
}

auto ConfigManager::canonicalDir(char* path, size_t max_len) -> bool {
    std::error_code ec;
    const std::filesystem::path canonical = std::filesystem::canonical(path, ec);
    if (ec || !std::filesystem::is_directory(canonical, ec) || ec) {
        return false;
    }
    const std::string result = canonical.string();
    if (result.size() >= max_len) {
        return false;
    }
    copyString(path, max_len, result.c_str());
    return true;
}

} // namespace DocLinks
