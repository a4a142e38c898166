#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace DocLinks {

/// Collects the targets of inline links "[text](target)" on one line,
/// left to right. A target is kept when it contains the document
/// extension or starts with '#'. A trailing "title" and <angle brackets>
/// are dropped. Returns the number of targets appended.
auto extractLinks(std::string_view line, std::string_view extension, std::vector<std::string>* targets) -> size_t;

} // namespace DocLinks
