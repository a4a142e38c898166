#pragma once

#include <string>
#include <vector>

namespace DocLinks {

/// Lists the documents of an area: regular files whose name ends with
/// the extension, minus those below a directory matching the exclude
/// pattern (POSIX extended regex, matched as "/<pattern>/" against the
/// path relative to the root). Sorted by path.
class FileFinder {
public:
    FileFinder(std::string extension, std::string exclude_pattern);

    /// False when the root cannot be walked or the pattern is invalid
    auto find(const std::string& root, std::vector<std::string>* files) const -> bool;

    /// Relative path of file below root, or its file name when outside
    static auto displayPath(const std::string& root, const std::string& file) -> std::string;

private:
    std::string extension_;
    std::string exclude_pattern_;
};

} // namespace DocLinks
