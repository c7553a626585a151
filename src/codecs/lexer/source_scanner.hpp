/**
 * Codeveil - Source Code Veiling Codecs
 *
 * source_scanner.hpp - Pattern-level scanning of JavaScript-like source
 *
 * This is deliberately not a lexer. Each routine reproduces one regular
 * expression contract exactly, including its blind spots:
 *
 *   stripComments         /\/\*[\s\S]*?\*\/|\/\/.*\/g  -> ""
 *   stripQuotedLiterals   /(["'`])(?:(?=(\\?))\2.)*?\1/g -> ""
 *   findStringLiterals    /"((?:[^"\\]|\\.)*)"|'((?:[^'\\]|\\.)*)'/g
 *   collapseWhitespace    /\s+/g -> " "
 *   scanIdentifiers       /[a-zA-Z_$][a-zA-Z0-9_$]*\/g
 *
 * Comment stripping knows nothing about strings ("http://x" loses its tail)
 * and literal stripping knows nothing about comments. The scans are linear
 * hand-written loops so that long comments or literals cannot exhaust the
 * stack of a backtracking matcher.
 */

#ifndef CODEVEIL_SOURCE_SCANNER_HPP
#define CODEVEIL_SOURCE_SCANNER_HPP

#include <cstddef>
#include <string>
#include <vector>
#include <unordered_map>

namespace codeveil {
namespace lexer {

/**
 * A quoted literal found in the source: [begin, end) covers the quotes,
 * body is the text between them with escapes left untouched.
 */
struct LiteralSpan {
    size_t begin = 0;
    size_t end = 0;
    char quote = '"';
    std::string body;
};

inline bool isLineTerminator(char c) {
    return c == '\n' || c == '\r';
}

inline bool isIdentifierStart(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_' || c == '$';
}

inline bool isIdentifierChar(char c) {
    return isIdentifierStart(c) || (c >= '0' && c <= '9');
}

std::string stripComments(const std::string& source);

std::string stripQuotedLiterals(const std::string& source);

std::vector<LiteralSpan> findStringLiterals(const std::string& source);

std::string collapseWhitespace(const std::string& source);

/**
 * Distinct identifier-shaped runs, in order of first occurrence
 */
std::vector<std::string> scanIdentifiers(const std::string& source);

/**
 * Every maximal run of identifier characters ([A-Za-z0-9_$]+) found in
 * the text. Used to detect names that already occur as whole words.
 */
std::vector<std::string> wordsOf(const std::string& source);

/**
 * Replace every whole-word occurrence of a key of `mapping` with its value
 * in a single left-to-right pass. A word is a maximal run of
 * [A-Za-z0-9_$]; replaced text is never rescanned.
 *
 * @param replaced  incremented once per substitution when non-null
 */
std::string replaceWholeWords(const std::string& source,
                              const std::unordered_map<std::string, std::string>& mapping,
                              size_t* replaced = nullptr);

} // namespace lexer
} // namespace codeveil

#endif // CODEVEIL_SOURCE_SCANNER_HPP
