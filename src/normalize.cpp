#include "normalize.hpp"

std::string normalize_line_breaks(const std::string& text) {
    std::string normalized;
    normalized.reserve(text.size());
    bool in_run = false;
    for (auto c : text) {
        if (is_line_break(c)) {
            if (!in_run) {
                normalized.push_back('\n');
                in_run = true;
            }
        } else {
            normalized.push_back(c);
            in_run = false;
        }
    }
    return normalized;
}
