#include "history_probe.h"
#include "common/logging.h"

#include <cstdio>
#include <new>
#include <sys/wait.h>
#include <utility>

namespace DocLinks {

GitHistoryProbe::GitHistoryProbe(std::string repo_dir)
    : repo_dir_(std::move(repo_dir)) {
}

auto GitHistoryProbe::lookup(const std::string& file_name) noexcept -> Result {
    std::string command;
    try {
        command = "git -C " + shellQuote(repo_dir_) +
                  " log --all --oneline -- " + shellQuote("**/" + file_name) + " 2>/dev/null";
    } catch (const std::bad_alloc&) {
        LOG_ERROR("Out of memory building history query for %s", file_name.c_str());
        return Result::UNAVAILABLE;
    }

    FILE* pipe = ::popen(command.c_str(), "r");
    if (!pipe) {
        LOG_WARN("Cannot run git for history of %s", file_name.c_str());
        return Result::UNAVAILABLE;
    }

    // Read everything so git never blocks on a full pipe
    bool has_output = false;
    char buffer[512];
    while (std::fgets(buffer, sizeof(buffer), pipe)) {
        if (buffer[0] != '\0' && buffer[0] != '\n') {
            has_output = true;
        }
    }

    const int status = ::pclose(pipe);
    if (status == -1 || !WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        LOG_WARN("git history lookup for %s failed (status %d) in %s",
                 file_name.c_str(), status, repo_dir_.c_str());
        return Result::UNAVAILABLE;
    }

    LOG_DEBUG("git history for %s: %s", file_name.c_str(), has_output ? "found" : "none");
    return has_output ? Result::FOUND : Result::NOT_FOUND;
}

auto GitHistoryProbe::shellQuote(const std::string& value) -> std::string {
    std::string quoted;
    quoted.reserve(value.size() + 2);
    quoted.push_back('\'');
    for (const char c : value) {
        if (c == '\'') {
            quoted.append("'\\''");
        } else {
            quoted.push_back(c);
        }
    }
    quoted.push_back('\'');
    return quoted;
}

auto historyResultToString(HistoryProbe::Result result) noexcept -> const char* {
    switch (result) {
        case HistoryProbe::Result::FOUND:       return "found";
        case HistoryProbe::Result::NOT_FOUND:   return "not_found";
        case HistoryProbe::Result::UNAVAILABLE: return "unavailable";
        default:                                return "unknown";
    }
}

} // namespace DocLinks
