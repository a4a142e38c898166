#pragma once

#include <string>
#include <string_view>

namespace DocLinks {

/// Maps header text (or a requested "#fragment") to its canonical anchor:
/// one leading '#' dropped, lowercased, German umlauts and sharp s
/// transliterated, every run outside [a-z0-9] folded to a single '-',
/// leading and trailing '-' stripped. Never fails; the result may be empty.
///
/// normalizeAnchor(normalizeAnchor(x)) == normalizeAnchor(x)
auto normalizeAnchor(std::string_view text) -> std::string;

} // namespace DocLinks
