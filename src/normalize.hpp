#ifndef FASTACLEAN_NORMALIZE_HPP
#define FASTACLEAN_NORMALIZE_HPP

#include <string>

/*
 * Replace every maximal run of '\n' and '\r' characters, in any order and
 * mixture, by a single '\n'. Runs at the start and at the end of the text
 * are collapsed as well. All other characters are copied unchanged.
 */
std::string normalize_line_breaks(const std::string& text);

inline bool is_line_break(char c) {
    return c == '\n' || c == '\r';
}

#endif
