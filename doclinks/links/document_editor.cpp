#include "document_editor.h"
#include "common/logging.h"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <new>
#include <sstream>
#include <system_error>

namespace DocLinks {

template<typename Edit>
auto DocumentEditor::editLine(const std::string& path, uint32_t line_no, Edit&& edit) noexcept -> bool {
    try {
        std::string content;
        if (!readFile(path, &content)) {
            return false;
        }

        // Locate line line_no without disturbing line endings
        size_t begin = 0;
        for (uint32_t n = 1; n < line_no; ++n) {
            const size_t nl = content.find('\n', begin);
            if (nl == std::string::npos) {
                LOG_WARN("Edit of %s: line %u past end of file", path.c_str(), line_no);
                return false;
            }
            begin = nl + 1;
        }
        size_t end = content.find('\n', begin);
        if (end == std::string::npos) {
            end = content.size();
        }

        std::string line = content.substr(begin, end - begin);
        if (!edit(&line)) {
            return false;
        }

        content.replace(begin, end - begin, line);
        return writeFileAtomic(path, content);
    } catch (const std::bad_alloc&) {
        LOG_ERROR("Out of memory editing %s", path.c_str());
        return false;
    }
}

auto DocumentEditor::replaceLinkTarget(const std::string& path, uint32_t line_no,
                                       std::string_view target, std::string_view new_target) noexcept -> bool {
    if (target.empty()) {
        return false;
    }
    return editLine(path, line_no, [&](std::string* line) {
        size_t begin = 0;
        size_t end = 0;
        size_t target_begin = 0;
        if (!findLinkMarkup(*line, target, &begin, &end, &target_begin)) {
            LOG_WARN("Edit of %s:%u: link target not found", path.c_str(), line_no);
            return false;
        }
        line->replace(target_begin, target.size(), new_target);
        return true;
    });
}

auto DocumentEditor::replaceLinkMarkup(const std::string& path, uint32_t line_no,
                                       std::string_view target, std::string_view replacement) noexcept -> bool {
    return editLine(path, line_no, [&](std::string* line) {
        size_t begin = 0;
        size_t end = 0;
        if (!findLinkMarkup(*line, target, &begin, &end)) {
            LOG_WARN("Edit of %s:%u: link markup not found", path.c_str(), line_no);
            return false;
        }
        line->replace(begin, end - begin, replacement);
        return true;
    });
}

auto DocumentEditor::findLinkMarkup(std::string_view line, std::string_view target,
                                    size_t* begin, size_t* end, size_t* target_begin) noexcept -> bool {
    size_t search = 0;
    while (true) {
        const size_t paren = line.find("](", search);
        if (paren == std::string_view::npos) {
            return false;
        }
        search = paren + 2;

        size_t target_pos = paren + 2;
        while (target_pos < line.size() && (line[target_pos] == ' ' || line[target_pos] == '<')) {
            ++target_pos;
        }
        if (line.compare(target_pos, target.size(), target) != 0) {
            continue;
        }
        // The target must end here, not merely start with target
        const size_t after = target_pos + target.size();
        if (after >= line.size() ||
            (line[after] != ')' && line[after] != ' ' && line[after] != '>' && line[after] != '\t')) {
            continue;
        }
        const size_t close = line.find(')', after);
        if (close == std::string_view::npos) {
            return false;
        }

        // Walk back to the '[' that opens this link text
        int depth = 0;
        size_t open = paren + 1;
        while (open > 0) {
            --open;
            if (line[open] == ']') {
                ++depth;
            } else if (line[open] == '[') {
                if (--depth == 0) {
                    break;
                }
            }
        }
        if (depth != 0 || line[open] != '[') {
            continue;
        }

        *begin = open;
        *end = close + 1;
        if (target_begin) {
            *target_begin = target_pos;
        }
        return true;
    }
}

auto DocumentEditor::readFile(const std::string& path, std::string* content) -> bool {
    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in) {
        LOG_ERROR("Cannot open %s for editing: %s", path.c_str(), std::strerror(errno));
        return false;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    *content = buffer.str();
    return true;
}

auto DocumentEditor::writeFileAtomic(const std::string& path, const std::string& content) -> bool {
    const std::string temp_path = path + ".doclinks.tmp";

    FILE* out = std::fopen(temp_path.c_str(), "wb");
    if (!out) {
        LOG_ERROR("Cannot create %s: %s", temp_path.c_str(), std::strerror(errno));
        return false;
    }
    const size_t written = std::fwrite(content.data(), 1, content.size(), out);
    const bool flushed = std::fflush(out) == 0;
    const bool closed = std::fclose(out) == 0;
    if (written != content.size() || !flushed || !closed) {
        LOG_ERROR("Short write to %s", temp_path.c_str());
        std::remove(temp_path.c_str());
        return false;
    }

    // Keep the original permission bits
    std::error_code ec;
    const auto perms = std::filesystem::status(path, ec).permissions();
    if (!ec) {
        std::filesystem::permissions(temp_path, perms, ec);
    }

    if (std::rename(temp_path.c_str(), path.c_str()) != 0) {
        LOG_ERROR("Cannot replace %s: %s", path.c_str(), std::strerror(errno));
        std::remove(temp_path.c_str());
        return false;
    }
    return true;
}

} // namespace DocLinks
