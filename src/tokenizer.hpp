#pragma once
#include <string>
#include <vector>

struct Word {
    std::string text;
    size_t end{};   // offset in the input just past this word
};

// Splits a console line into words. Single quotes are literal, double
// quotes and bare backslashes escape the next character.
// Throws std::runtime_error on an unterminated quote or dangling escape.
std::vector<Word> tokenize(const std::string& line);

// Raw text after the first `words` words, leading blanks removed.
std::string remainder_after(const std::string& line, const std::vector<Word>& words, size_t count);
