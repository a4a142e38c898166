#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>

namespace DocLinks {

constexpr size_t MAX_PATH_LEN = 1024;
constexpr size_t MAX_AREAS = 16;

enum class OutputFormat : uint8_t {
    TEXT = 0,
    JSON = 1
};

// Complete validator run configuration
struct ValidatorConfig {
    struct Paths {
        char docs_dir[MAX_PATH_LEN];   // root for "/"-prefixed links
        char logs_dir[MAX_PATH_LEN];
    } paths;

    struct Logging {
        char level[16];
    } logging;

    struct Validation {
        uint32_t parallel_jobs;
        char fix_pattern[512];         // OLD:NEW, empty when disabled
        bool auto_todo;
        bool warn_deep_paths;
        uint32_t max_path_depth;
        bool warm_cache;
        char extension[16];
        bool stop_on_error;
    } validation;

    struct Output {
        OutputFormat format;
        bool verbose;
        bool color;
    } output;

    // A documentation subtree validated as one unit
    struct Area {
        char name[64];
        char path[MAX_PATH_LEN];
        char exclude[256];             // regex matched as a directory component
    } areas[MAX_AREAS];
    uint32_t num_areas;

    bool is_valid;
};

/// Built-in defaults: 2 jobs, depth 5, deep-path warnings on, colour on,
/// text output, ".md" files, logs under $DOCLINKS_LOGS_DIR or /tmp
auto makeDefaultConfig() noexcept -> ValidatorConfig;

enum class ArgsResult : uint8_t {
    OK = 0,
    HELP = 1,
    ERROR = 2
};

// Global config manager
class ConfigManager {
private:
    static ValidatorConfig config_;
    static bool initialized_;

public:
    /// Defaults, then the --config file (if any), then the remaining
    /// command line, then validation
    static auto init(int argc, char** argv) noexcept -> ArgsResult;

    [[nodiscard]] static auto getConfig() noexcept -> const ValidatorConfig& {
        return config_;
    }

    [[nodiscard]] static auto isInitialized() noexcept -> bool {
        return initialized_;
    }

    static auto reset() noexcept -> void;

    static auto parseTomlFile(const char* filepath, ValidatorConfig* config) noexcept -> bool;

    /// Applies command-line overrides. --config is skipped here; init()
    /// loads it before the other options are applied.
    static auto parseArgs(int argc, char** argv, ValidatorConfig* config) -> ArgsResult;

    /// Checks the rules of a runnable configuration and makes every
    /// directory absolute and canonical. Fills in docs_dir from the
    /// first area when it is empty. The job count must fit the scan pool.
    static auto validateConfig(ValidatorConfig* config) -> bool;

    /// Splits OLD:NEW at the first ':'. OLD must be non-empty.
    static auto splitFixPattern(const char* pattern, std::string* old_part, std::string* new_part) -> bool;

    static auto printUsage(const char* program) noexcept -> void;
    static auto printConfig(const ValidatorConfig& config) noexcept -> void;

private:
    static auto extractStringValue(const char* line, const char* key, char* value, size_t max_len) noexcept -> bool;
    static auto extractUintValue(const char* line, const char* key, uint64_t* value) noexcept -> bool;
    static auto extractBoolValue(const char* line, const char* key, bool* value) noexcept -> bool;
    static auto findArea(ValidatorConfig* config, const char* name) noexcept -> ValidatorConfig::Area*;
    static auto canonicalDir(char* path, size_t max_len) -> bool;
};

} // namespace DocLinks
