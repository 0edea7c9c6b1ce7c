/*******************************************************************************
    Project: Fleetwatch - Session Fleet Coordination & Recovery Core
    Date: October 19, 2026

    File: token_estimator.cpp
*******************************************************************************/

#include "signals/token_estimator.h"

#include <cctype>

namespace fleetwatch {

namespace {

bool is_letter(unsigned char c) {
    return std::isalpha(c) != 0 || c >= 0x80;
}

bool is_digit(unsigned char c) {
    return c >= '0' && c <= '9';
}

bool is_space(unsigned char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

bool is_newline(unsigned char c) {
    return c == '\n' || c == '\r';
}

bool is_punct(unsigned char c) {
    return !is_letter(c) && !is_digit(c) && !is_space(c);
}

// Length of a contraction suffix starting at i ("'s", "'ll", ...), or 0.
size_t contraction_length(const std::string& text, size_t i) {
    if (text[i] != '\'' || i + 1 >= text.size()) return 0;

    char a = static_cast<char>(std::tolower(static_cast<unsigned char>(text[i + 1])));
    if (a == 's' || a == 't' || a == 'm' || a == 'd') return 2;

    if (i + 2 < text.size()) {
        char b = static_cast<char>(std::tolower(static_cast<unsigned char>(text[i + 2])));
        if ((a == 'r' && b == 'e') || (a == 'v' && b == 'e') || (a == 'l' && b == 'l')) return 3;
    }
    return 0;
}

} // namespace

std::vector<std::string> TokenEstimator::pre_tokenize(const std::string& text) {
    std::vector<std::string> pieces;
    const size_t n = text.size();
    size_t i = 0;

    auto at = [&text](size_t pos) { return static_cast<unsigned char>(text[pos]); };

    while (i < n) {
        size_t start = i;
        unsigned char c = at(i);

        if (size_t len = contraction_length(text, i)) {
            i += len;
        } else if (is_letter(c) ||
                   (!is_newline(c) && !is_digit(c) && i + 1 < n && is_letter(at(i + 1)))) {
            ++i;
            while (i < n && is_letter(at(i))) ++i;
        } else if (is_digit(c)) {
            while (i < n && i - start < 3 && is_digit(at(i))) ++i;
        } else if (is_punct(c) || (c == ' ' && i + 1 < n && is_punct(at(i + 1)))) {
            ++i;
            while (i < n && is_punct(at(i))) ++i;
            while (i < n && is_newline(at(i))) ++i;
        } else {
            while (i < n && is_space(at(i))) ++i;
            // Leave one space to lead the following word.
            if (i < n && i - start > 1 && at(i - 1) == ' ') --i;
        }

        pieces.push_back(text.substr(start, i - start));
    }
    return pieces;
}

size_t TokenEstimator::count(const std::string& text) {
    size_t tokens = 0;
    for (const auto& piece : pre_tokenize(text)) {
        size_t cost = piece_cost(piece.size());
        tokens += cost > 0 ? cost : 1;
    }
    return tokens;
}

} // namespace fleetwatch
