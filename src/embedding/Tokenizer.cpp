#include "embedding/Tokenizer.hpp"
#include <cctype>

namespace later {

namespace {
    bool isSpace(char c) {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    }
}

std::vector<TokenSpan> Tokenizer::tokenize(const std::string& text) {
    std::vector<TokenSpan> spans;
    size_t i = 0;
    while (i < text.size()) {
        while (i < text.size() && isSpace(text[i])) ++i;
        if (i >= text.size()) break;
        size_t begin = i;
        while (i < text.size() && !isSpace(text[i])) ++i;
        spans.push_back({begin, i});
    }
    return spans;
}

int Tokenizer::countTokens(const std::string& text) {
    int count = 0;
    bool inWord = false;
    for (char c : text) {
        if (isSpace(c)) {
            inWord = false;
        } else if (!inWord) {
            inWord = true;
            ++count;
        }
    }
    return count;
}

std::vector<std::string> Tokenizer::words(const std::string& text) {
    std::vector<std::string> out;
    for (const auto& span : tokenize(text)) {
        out.push_back(text.substr(span.begin, span.end - span.begin));
    }
    return out;
}

} // namespace later
