#include "link_extractor.h"

namespace DocLinks {

namespace {

inline bool isSpace(char c) noexcept {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

// Index of the ']' closing the '[' at open, honouring nested brackets
auto findClosingBracket(std::string_view line, size_t open) noexcept -> size_t {
    int depth = 0;
    for (size_t i = open; i < line.size(); ++i) {
        if (line[i] == '\\') {
            ++i;
            continue;
        }
        if (line[i] == '[') {
            ++depth;
        } else if (line[i] == ']') {
            if (--depth == 0) {
                return i;
            }
        }
    }
    return std::string_view::npos;
}

auto cleanTarget(std::string_view raw) -> std::string_view {
    while (!raw.empty() && isSpace(raw.front())) raw.remove_prefix(1);
    while (!raw.empty() && isSpace(raw.back())) raw.remove_suffix(1);

    if (!raw.empty() && raw.front() == '<') {
        const size_t close = raw.find('>');
        if (close != std::string_view::npos) {
            return raw.substr(1, close - 1);
        }
    }

    // [text](target "title")
    for (size_t i = 0; i < raw.size(); ++i) {
        if (isSpace(raw[i])) {
            return raw.substr(0, i);
        }
    }
    return raw;
}

} // namespace

auto extractLinks(std::string_view line, std::string_view extension, std::vector<std::string>* targets) -> size_t {
    size_t found = 0;
    size_t pos = 0;

    while (pos < line.size()) {
        const size_t open = line.find('[', pos);
        if (open == std::string_view::npos) {
            break;
        }

        const size_t close = findClosingBracket(line, open);
        if (close == std::string_view::npos) {
            break;
        }
        if (close + 1 >= line.size() || line[close + 1] != '(') {
            // Not a link; a nested "[a](b)" may still start inside
            pos = open + 1;
            continue;
        }

        const size_t target_start = close + 2;
        const size_t target_end = line.find(')', target_start);
        if (target_end == std::string_view::npos) {
            break;
        }

        const std::string_view target = cleanTarget(line.substr(target_start, target_end - target_start));
        if (!target.empty() &&
            (target.front() == '#' || (!extension.empty() && target.find(extension) != std::string_view::npos))) {
            targets->emplace_back(target);
            ++found;
        }
        pos = target_end + 1;
    }

    return found;
}

} // namespace DocLinks
