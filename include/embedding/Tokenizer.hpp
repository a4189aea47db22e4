#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace later {

// Byte range of one whitespace-delimited word.
struct TokenSpan {
    size_t begin;
    size_t end;   // one past the last byte
};

class Tokenizer {
public:
    static std::vector<TokenSpan> tokenize(const std::string& text);

    static int countTokens(const std::string& text);

    // Words only, in order
    static std::vector<std::string> words(const std::string& text);
};

} // namespace later
