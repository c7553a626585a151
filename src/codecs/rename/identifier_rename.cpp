/**
 * Codeveil - Source Code Veiling Codecs
 *
 * identifier_rename.cpp - "lexical-scramble" implementation
 */

#include "identifier_rename.hpp"
#include "../lexer/source_scanner.hpp"
#include "../../common/json_parser.hpp"

#include <algorithm>
#include <unordered_map>

namespace codeveil {
namespace rename {

const std::unordered_set<std::string>& builtinReservedWords() {
    static const std::unordered_set<std::string> words = {
        "break", "case", "catch", "continue", "debugger", "default", "delete",
        "do", "else", "finally", "for", "function", "if", "in", "instanceof",
        "new", "return", "switch", "this", "throw", "try", "typeof", "var",
        "let", "const", "void", "while", "with", "class", "enum", "export",
        "extends", "import", "super", "implements", "interface", "package",
        "private", "protected", "public", "static", "yield", "await",
        "null", "true", "false", "undefined",
        "document", "window", "console"
    };
    return words;
}

std::string generateName(size_t n) {
    static const std::string alphabet =
        "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ_";
    const long long base = static_cast<long long>(alphabet.size());

    std::string name;
    long long value = static_cast<long long>(n);
    do {
        name.insert(name.begin(), alphabet[static_cast<size_t>(value % base)]);
        value = value / base - 1;
    } while (value >= 0);
    return name;
}

std::string serializeTable(const RenameTable& table) {
    JsonValue root = JsonValue::object();
    for (const auto& [original, replacement] : table) {
        root.set(original, JsonValue(replacement));
    }
    return JsonSerializer::serialize(root, true);
}

RenameTable parseTable(const std::string& json) {
    if (json.find_first_not_of(" \t\r\n") == std::string::npos) {
        throw CodecError(ErrorKind::MissingDecodeKey,
                         "Deobfuscation map is required for Lexical Scramble.");
    }

    JsonValue root;
    try {
        root = JsonParser::parse(json);
    } catch (const std::runtime_error& e) {
        throw CodecError(ErrorKind::MalformedArtifact,
                         std::string("Failed to parse map or deobfuscate. ") + e.what());
    }

    if (!root.isObject()) {
        throw CodecError(ErrorKind::MalformedArtifact,
                         "Failed to parse map or deobfuscate. The map must be a JSON object.");
    }

    RenameTable table;
    table.reserve(root.size());
    for (size_t i = 0; i < root.object_keys.size(); i++) {
        const JsonValue& value = root.object_values[i];
        if (!value.isString() || value.string_value.empty()) {
            throw CodecError(ErrorKind::MalformedArtifact,
                             "Failed to parse map or deobfuscate. Entry '" +
                             root.object_keys[i] + "' has no replacement name.");
        }
        table.emplace_back(root.object_keys[i], value.string_value);
    }
    return table;
}

bool IdentifierRenameCodec::isReserved(const std::string& word) const {
    if (builtinReservedWords().count(word) > 0) {
        return true;
    }
    return std::find(config_.extra_reserved.begin(), config_.extra_reserved.end(), word)
           != config_.extra_reserved.end();
}

std::string IdentifierRenameCodec::minify(const std::string& source) {
    return lexer::collapseWhitespace(lexer::stripComments(source));
}

std::vector<std::string> IdentifierRenameCodec::discoverIdentifiers(const std::string& source) const {
    std::string clean = lexer::stripQuotedLiterals(lexer::stripComments(source));

    std::vector<std::string> identifiers;
    for (auto& name : lexer::scanIdentifiers(clean)) {
        if (!isReserved(name)) {
            identifiers.push_back(std::move(name));
        }
    }
    return identifiers;
}

RenameTable IdentifierRenameCodec::assignNames(std::vector<std::string> identifiers,
                                               const std::string& source) const {
    // longest first; ties keep first-occurrence order
    std::stable_sort(identifiers.begin(), identifiers.end(),
        [](const std::string& a, const std::string& b) {
            return a.size() > b.size();
        });

    std::unordered_set<std::string> renamed(identifiers.begin(), identifiers.end());
    std::unordered_set<std::string> untouched;
    for (auto& word : lexer::wordsOf(source)) {
        if (renamed.count(word) == 0) {
            untouched.insert(std::move(word));
        }
    }

    RenameTable table;
    table.reserve(identifiers.size());

    size_t counter = 0;
    for (const auto& original : identifiers) {
        std::string candidate = generateName(counter++);
        while (isReserved(candidate) || untouched.count(candidate) > 0) {
            logger_.trace("skipping generated name '{}'", candidate);
            candidate = generateName(counter++);
        }
        table.emplace_back(original, std::move(candidate));
    }

    return table;
}

CodecResult IdentifierRenameCodec::encode(const std::string& source,
                                          const std::string& secret) const {
    (void)secret;

    RenameTable table = assignNames(discoverIdentifiers(source), source);
    logger_.debug("{} identifiers discovered", table.size());

    std::unordered_map<std::string, std::string> mapping;
    mapping.reserve(table.size());
    for (const auto& [original, replacement] : table) {
        mapping.emplace(original, replacement);
    }

    size_t replacements = 0;
    std::string scrambled = lexer::replaceWholeWords(source, mapping, &replacements);
    if (config_.minify) {
        scrambled = minify(scrambled);
    }

    CodecResult result;
    result.text = std::move(scrambled);
    result.log = serializeTable(table);
    result.counters["identifiers_renamed"] = toCounter(table.size());
    result.counters["replacements"] = toCounter(replacements);
    result.counters["bytes_in"] = toCounter(source.size());
    result.counters["bytes_out"] = toCounter(result.text.size());
    return result;
}

CodecResult IdentifierRenameCodec::decode(const std::string& artifact,
                                          const std::string& table_json) const {
    RenameTable table = parseTable(table_json);

    std::unordered_map<std::string, std::string> inverse;
    inverse.reserve(table.size());
    for (const auto& [original, replacement] : table) {
        auto inserted = inverse.emplace(replacement, original);
        if (!inserted.second && inserted.first->second != original) {
            throw CodecError(ErrorKind::InconsistentMapping,
                             "Failed to parse map or deobfuscate. '" + replacement +
                             "' replaces both '" + inserted.first->second +
                             "' and '" + original + "'.");
        }
    }
    logger_.debug("reversing {} renames", inverse.size());

    size_t replacements = 0;
    CodecResult result;
    result.text = lexer::replaceWholeWords(artifact, inverse, &replacements);
    result.log = "Successfully deobfuscated using the provided map.";
    result.counters["identifiers_restored"] = toCounter(inverse.size());
    result.counters["replacements"] = toCounter(replacements);
    return result;
}

} // namespace rename
} // namespace codeveil
