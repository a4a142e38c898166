#include "anchor_normalizer.h"

#include <cstdint>

namespace DocLinks {

namespace {

constexpr unsigned char UTF8_LATIN1_LEAD = 0xC3;

// Latin-1 supplement capitals A-grave .. Thorn, except the multiplication sign
inline bool isLatin1Upper(unsigned char second) noexcept {
    return second >= 0x80 && second <= 0x9E && second != 0x97;
}

inline bool isAnchorChar(unsigned char c) noexcept {
    return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');
}

auto lowercase(std::string_view text) -> std::string {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        const auto c = static_cast<unsigned char>(text[i]);
        if (c >= 'A' && c <= 'Z') {
            out.push_back(static_cast<char>(c + ('a' - 'A')));
        } else if (c == UTF8_LATIN1_LEAD && i + 1 < text.size() &&
                   isLatin1Upper(static_cast<unsigned char>(text[i + 1]))) {
            out.push_back(static_cast<char>(c));
            out.push_back(static_cast<char>(static_cast<unsigned char>(text[i + 1]) + 0x20));
            ++i;
        } else {
            out.push_back(static_cast<char>(c));
        }
    }
    return out;
}

// Must run before folding, otherwise "ü" becomes "-" instead of "u"
auto transliterate(std::string_view text) -> std::string {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        const auto c = static_cast<unsigned char>(text[i]);
        if (c == UTF8_LATIN1_LEAD && i + 1 < text.size()) {
            const auto second = static_cast<unsigned char>(text[i + 1]);
            const char* replacement = nullptr;
            switch (second) {
                case 0x9F: replacement = "ss"; break;  // ß
                case 0xBC: replacement = "u"; break;   // ü
                case 0xB6: replacement = "o"; break;   // ö
                case 0xA4: replacement = "a"; break;   // ä
                default: break;
            }
            if (replacement) {
                out.append(replacement);
                ++i;
                continue;
            }
        }
        out.push_back(static_cast<char>(c));
    }
    return out;
}

} // namespace

auto normalizeAnchor(std::string_view text) -> std::string {
    if (!text.empty() && text.front() == '#') {
        text.remove_prefix(1);
    }

    const std::string ascii = transliterate(lowercase(text));

    std::string out;
    out.reserve(ascii.size());
    for (const char ch : ascii) {
        const auto c = static_cast<unsigned char>(ch);
        if (isAnchorChar(c)) {
            out.push_back(ch);
        } else if (!out.empty() && out.back() != '-') {
            out.push_back('-');
        }
    }
    while (!out.empty() && out.back() == '-') {
        out.pop_back();
    }
    return out;
}

} // namespace DocLinks
