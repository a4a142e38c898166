#include "file_finder.h"
#include "common/logging.h"

#include <algorithm>
#include <filesystem>
#include <regex>
#include <system_error>
#include <utility>

namespace DocLinks {

FileFinder::FileFinder(std::string extension, std::string exclude_pattern)
    : extension_(std::move(extension)),
      exclude_pattern_(std::move(exclude_pattern)) {
}

auto FileFinder::find(const std::string& root, std::vector<std::string>* files) const -> bool {
    namespace fs = std::filesystem;

    std::regex exclude;
    const bool has_exclude = !exclude_pattern_.empty();
    if (has_exclude) {
        try {
            exclude = std::regex("/(" + exclude_pattern_ + ")/", std::regex::extended | std::regex::nosubs);
        } catch (const std::regex_error& e) {
            LOG_ERROR("Invalid exclude pattern '%s': %s", exclude_pattern_.c_str(), e.what());
            return false;
        }
    }

    std::error_code ec;
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        LOG_ERROR("Cannot walk %s: %s", root.c_str(), ec.message().c_str());
        return false;
    }

    size_t excluded = 0;
    fs::recursive_directory_iterator end_it;
    while (it != end_it) {
        const fs::directory_entry& entry = *it;

        std::error_code type_ec;
        const std::string name = entry.path().filename().string();
        if (entry.is_regular_file(type_ec) && !type_ec &&
            name.size() >= extension_.size() &&
            name.compare(name.size() - extension_.size(), extension_.size(), extension_) == 0) {
            const std::string relative = "/" + entry.path().lexically_relative(root).string();
            if (has_exclude && std::regex_search(relative, exclude)) {
                ++excluded;
            } else {
                files->push_back(entry.path().string());
            }
        }

        it.increment(ec);
        if (ec) {
            // The iterator is unusable after a failed increment
            LOG_WARN("Directory walk below %s stopped early: %s", root.c_str(), ec.message().c_str());
            break;
        }
    }

    std::sort(files->begin(), files->end());
    LOG_INFO("Found %zu documents below %s (%zu excluded)", files->size(), root.c_str(), excluded);
    return true;
}

auto FileFinder::displayPath(const std::string& root, const std::string& file) -> std::string {
    namespace fs = std::filesystem;
    const fs::path relative = fs::path(file).lexically_relative(root);
    const std::string rel = relative.string();
    if (rel.empty() || rel.compare(0, 2, "..") == 0) {
        return fs::path(file).filename().string();
    }
    return rel;
}

} // namespace DocLinks
