#include "Redaction.hpp"

namespace redaction {

std::string hide(std::string_view text) {
    std::string out;
    out.reserve(text.size() + kHiddenStart.size() + kHiddenEnd.size());
    out.append(kHiddenStart);
    out.append(text);
    out.append(kHiddenEnd);
    return out;
}

std::string clean(std::string_view text) {
    std::string out;
    out.reserve(text.size());

    size_t pos = 0;
    while (pos < text.size()) {
        size_t start = text.find(kHiddenStart, pos);
        if (start == std::string_view::npos) {
            out.append(text.substr(pos));
            break;
        }
        out.append(text.substr(pos, start - pos));

        size_t end = text.find(kHiddenEnd, start + kHiddenStart.size());
        if (end == std::string_view::npos) {
            break;  // unterminated: drop the rest
        }
        pos = end + kHiddenEnd.size();
    }

    // A stray end marker carries no content
    for (size_t stray = out.find(kHiddenEnd); stray != std::string::npos; stray = out.find(kHiddenEnd)) {
        out.erase(stray, kHiddenEnd.size());
    }

    while (!out.empty() && (out.back() == ' ' || out.back() == ':')) {
        out.pop_back();
    }
    return out;
}

std::string reveal(std::string_view text) {
    std::string out{text};
    for (std::string_view marker : {kHiddenStart, kHiddenEnd}) {
        for (size_t p = out.find(marker); p != std::string::npos; p = out.find(marker, p)) {
            out.erase(p, marker.size());
        }
    }
    return out;
}

} // namespace redaction
