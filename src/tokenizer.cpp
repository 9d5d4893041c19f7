#include "tokenizer.hpp"
#include <stdexcept>

static bool is_space(char c) { return c==' ' || c=='\t' || c=='\n'; }

std::vector<Word> tokenize(const std::string& line) {
    std::vector<Word> out;
    std::string cur;
    bool in_word = false;

    auto flush_word = [&](size_t end){
        if (in_word) {
            out.push_back({cur, end});
            cur.clear();
            in_word = false;
        }
    };

    enum class Q { None, Single, Double };
    Q q = Q::None;

    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];

        if (q == Q::None) {
            if (is_space(c)) { flush_word(i); continue; }

            in_word = true;
            if (c == '\'') { q = Q::Single; continue; }
            if (c == '"')  { q = Q::Double; continue; }

            if (c == '\\') {
                if (i + 1 < line.size()) cur.push_back(line[++i]);
                else throw std::runtime_error("dangling escape");
                continue;
            }

            cur.push_back(c);
        } else if (q == Q::Single) {
            if (c == '\'') { q = Q::None; continue; }
            cur.push_back(c);
        } else { // double
            if (c == '"') { q = Q::None; continue; }
            if (c == '\\') {
                if (i + 1 < line.size()) cur.push_back(line[++i]);
                else throw std::runtime_error("dangling escape");
                continue;
            }
            cur.push_back(c);
        }
    }

    if (q != Q::None) throw std::runtime_error("unterminated quote");
    flush_word(line.size());
    return out;
}

std::string remainder_after(const std::string& line, const std::vector<Word>& words, size_t count) {
    if (count == 0) {
        auto b = line.find_first_not_of(" \t");
        return b == std::string::npos ? std::string() : line.substr(b);
    }
    if (count > words.size()) return {};
    auto b = line.find_first_not_of(" \t", words[count - 1].end);
    return b == std::string::npos ? std::string() : line.substr(b);
}
