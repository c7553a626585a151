/**
 * Codeveil - Source Code Veiling Codecs
 *
 * source_scanner.cpp - Pattern-level source scanning
 */

#include "source_scanner.hpp"

#include <regex>
#include <unordered_set>

namespace codeveil {
namespace lexer {

namespace {

bool isRegexWhitespace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

/**
 * Try to match (["'`])(?:(?=(\\?))\2.)*?\1 at `start`. The lookahead makes
 * a backslash always pair with the following character, and `.` refuses
 * line terminators, so an unclosed quote on its line is no match.
 *
 * @return one past the closing quote, or npos
 */
size_t matchQuotedLiteral(const std::string& s, size_t start) {
    const char quote = s[start];
    size_t j = start + 1;
    while (j < s.size()) {
        if (s[j] == quote) {
            return j + 1;
        }
        size_t k = (s[j] == '\\') ? j + 1 : j;
        if (k >= s.size() || isLineTerminator(s[k])) {
            return std::string::npos;
        }
        j = k + 1;
    }
    return std::string::npos;
}

/**
 * Try to match "((?:[^"\\]|\\.)*)" (or the single-quoted twin) at `start`.
 * Unescaped newlines are allowed inside; a backslash before a line
 * terminator or end of input is not.
 */
size_t matchStringLiteral(const std::string& s, size_t start) {
    const char quote = s[start];
    size_t j = start + 1;
    while (j < s.size()) {
        char c = s[j];
        if (c == quote) {
            return j + 1;
        }
        if (c == '\\') {
            if (j + 1 >= s.size() || isLineTerminator(s[j + 1])) {
                return std::string::npos;
            }
            j += 2;
        } else {
            j++;
        }
    }
    return std::string::npos;
}

} // namespace

std::string stripComments(const std::string& source) {
    std::string out;
    out.reserve(source.size());

    size_t i = 0;
    while (i < source.size()) {
        if (source[i] == '/' && i + 1 < source.size()) {
            if (source[i + 1] == '*') {
                size_t close = source.find("*/", i + 2);
                if (close != std::string::npos) {
                    i = close + 2;
                    continue;
                }
            } else if (source[i + 1] == '/') {
                i += 2;
                while (i < source.size() && !isLineTerminator(source[i])) i++;
                continue;
            }
        }
        out += source[i++];
    }

    return out;
}

std::string stripQuotedLiterals(const std::string& source) {
    std::string out;
    out.reserve(source.size());

    size_t i = 0;
    while (i < source.size()) {
        char c = source[i];
        if (c == '"' || c == '\'' || c == '`') {
            size_t end = matchQuotedLiteral(source, i);
            if (end != std::string::npos) {
                i = end;
                continue;
            }
        }
        out += c;
        i++;
    }

    return out;
}

std::vector<LiteralSpan> findStringLiterals(const std::string& source) {
    std::vector<LiteralSpan> spans;

    size_t i = 0;
    while (i < source.size()) {
        char c = source[i];
        if (c == '"' || c == '\'') {
            size_t end = matchStringLiteral(source, i);
            if (end != std::string::npos) {
                LiteralSpan span;
                span.begin = i;
                span.end = end;
                span.quote = c;
                span.body = source.substr(i + 1, end - i - 2);
                spans.push_back(std::move(span));
                i = end;
                continue;
            }
        }
        i++;
    }

    return spans;
}

std::string collapseWhitespace(const std::string& source) {
    std::string out;
    out.reserve(source.size());

    bool in_run = false;
    for (char c : source) {
        if (isRegexWhitespace(c)) {
            if (!in_run) out += ' ';
            in_run = true;
        } else {
            out += c;
            in_run = false;
        }
    }

    return out;
}

std::vector<std::string> scanIdentifiers(const std::string& source) {
    static const std::regex identifier_re(R"([a-zA-Z_$][a-zA-Z0-9_$]*)");

    std::vector<std::string> ordered;
    std::unordered_set<std::string> seen;

    auto begin = std::sregex_iterator(source.begin(), source.end(), identifier_re);
    auto end = std::sregex_iterator();
    for (auto it = begin; it != end; ++it) {
        std::string name = it->str();
        if (seen.insert(name).second) {
            ordered.push_back(std::move(name));
        }
    }

    return ordered;
}

std::vector<std::string> wordsOf(const std::string& source) {
    std::vector<std::string> words;
    size_t i = 0;
    while (i < source.size()) {
        if (!isIdentifierChar(source[i])) {
            i++;
            continue;
        }
        size_t start = i;
        while (i < source.size() && isIdentifierChar(source[i])) i++;
        words.push_back(source.substr(start, i - start));
    }
    return words;
}

std::string replaceWholeWords(const std::string& source,
                              const std::unordered_map<std::string, std::string>& mapping,
                              size_t* replaced) {
    std::string out;
    out.reserve(source.size());

    size_t i = 0;
    while (i < source.size()) {
        if (!isIdentifierChar(source[i])) {
            out += source[i++];
            continue;
        }

        size_t start = i;
        while (i < source.size() && isIdentifierChar(source[i])) i++;
        std::string word = source.substr(start, i - start);

        auto it = mapping.find(word);
        if (it != mapping.end()) {
            out += it->second;
            if (replaced) (*replaced)++;
        } else {
            out += word;
        }
    }

    return out;
}

} // namespace lexer
} // namespace codeveil
