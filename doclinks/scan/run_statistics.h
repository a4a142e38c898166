#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "doclinks/links/link_validator.h"

namespace DocLinks {

/// Counters of one scan. Each worker fills its own copy; copies are
/// merged with += after the workers are done.
struct RunStatistics {
    uint32_t total_files = 0;
    uint32_t total_links = 0;
    uint32_t valid_links = 0;
    uint32_t broken_links = 0;
    uint32_t warnings = 0;
    uint32_t internal_links = 0;
    uint32_t external_links = 0;
    uint32_t valid_internal = 0;
    uint32_t valid_external = 0;
    uint32_t deep_path_warnings = 0;
    uint32_t auto_todo_fixes = 0;
    uint32_t batch_fixes = 0;

    auto record(const Verdict& verdict) noexcept -> void {
        ++total_links;
        if (verdict.internal) {
            ++internal_links;
        } else {
            ++external_links;
        }

        if (verdict.kind == VerdictKind::BROKEN) {
            ++broken_links;
        } else {
            ++valid_links;
            if (verdict.internal) {
                ++valid_internal;
            } else {
                ++valid_external;
            }
            if (verdict.kind == VerdictKind::ANCHOR_WARNING) {
                ++warnings;
            }
        }

        if (verdict.deep_path) ++deep_path_warnings;
        if (verdict.action == LinkAction::TODO_MARKED) ++auto_todo_fixes;
        if (verdict.action == LinkAction::BATCH_FIXED) ++batch_fixes;
    }

    auto operator+=(const RunStatistics& other) noexcept -> RunStatistics& {
        total_files += other.total_files;
        total_links += other.total_links;
        valid_links += other.valid_links;
        broken_links += other.broken_links;
        warnings += other.warnings;
        internal_links += other.internal_links;
        external_links += other.external_links;
        valid_internal += other.valid_internal;
        valid_external += other.valid_external;
        deep_path_warnings += other.deep_path_warnings;
        auto_todo_fixes += other.auto_todo_fixes;
        batch_fixes += other.batch_fixes;
        return *this;
    }

    /// Whole percent of valid links, 0 when there are none
    [[nodiscard]] auto successRate() const noexcept -> uint32_t {
        if (total_links == 0) {
            return 0;
        }
        return static_cast<uint32_t>(static_cast<uint64_t>(valid_links) * 100 / total_links);
    }
};

/// One JSON record: a broken link, a warning, or a deep path
struct Finding {
    std::string file;
    uint32_t line = 0;
    std::string link;
    std::string type;      // unset for deep paths
    uint32_t depth = 0;    // deep paths only
};

/// Everything reported for one area
struct AreaResult {
    std::string name;
    RunStatistics stats;
    std::vector<Finding> broken;
    std::vector<Finding> warnings;
    std::vector<Finding> deep_paths;
};

} // namespace DocLinks
