#pragma once

#include <cstdint>
#include <string>

namespace DocLinks {

/// Version-control lookup used by auto-TODO to tell a moved document
/// (it has history) from one that was never written.
class HistoryProbe {
public:
    enum class Result : uint8_t {
        FOUND = 0,
        NOT_FOUND = 1,
        UNAVAILABLE = 2    // no repository, no git, or the query failed
    };

    virtual ~HistoryProbe() = default;

    /// file_name is a base name such as "setup.md"; any directory matches.
    /// Called concurrently by parallel scan workers.
    virtual auto lookup(const std::string& file_name) noexcept -> Result = 0;
};

/// Runs "git log --all --oneline -- '**/<name>'" inside repo_dir
class GitHistoryProbe final : public HistoryProbe {
public:
    explicit GitHistoryProbe(std::string repo_dir);

    auto lookup(const std::string& file_name) noexcept -> Result override;

    /// Wraps value in single quotes for /bin/sh
    static auto shellQuote(const std::string& value) -> std::string;

private:
    std::string repo_dir_;
};

auto historyResultToString(HistoryProbe::Result result) noexcept -> const char*;

} // namespace DocLinks
