#pragma once

#include <cctype>
#include <string>
#include <string_view>

// Collapses every whitespace run to one space and trims both ends.
inline std::string normalize_whitespace(std::string_view in) {
    std::string out;
    out.reserve(in.size());
    bool pending_space = false;
    for (char c : in) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) {
            out += ' ';
            pending_space = false;
        }
        out += c;
    }
    return out;
}
