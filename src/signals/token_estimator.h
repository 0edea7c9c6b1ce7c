/*******************************************************************************
    Project: Fleetwatch - Session Fleet Coordination & Recovery Core
    Date: October 19, 2026

    File: token_estimator.h

    Description:
        Deterministic token count for message text, close to what a
        GPT-style byte-pair tokenizer reports for English prose and code.

        Text is first split the way the BPE pre-tokenizer splits it:
        - English contractions ('s 't 're 've 'm 'll 'd)
        - letter runs, optionally led by one non-letter such as a space
        - digit runs of at most 3
        - punctuation runs, optionally led by a space, plus trailing newlines
        - whitespace runs (a run before a word leaves its last space to it)

        Each piece then costs ceil(bytes / 4) tokens, minimum 1. Bytes at or
        above 0x80 count as letters, so UTF-8 words stay in one piece.
*******************************************************************************/

#ifndef TOKEN_ESTIMATOR_H
#define TOKEN_ESTIMATOR_H

#include <cstddef>
#include <string>
#include <vector>

namespace fleetwatch {

class TokenEstimator {
public:
    static size_t count(const std::string& text);

    static std::vector<std::string> pre_tokenize(const std::string& text);

private:
    static size_t piece_cost(size_t length) { return length == 0 ? 0 : (length + 3) / 4; }
};

} // namespace fleetwatch

#endif // TOKEN_ESTIMATOR_H
