/**
 * Codeveil - Source Code Veiling Codecs
 *
 * string_extraction.cpp - "string-conceal" implementation
 */

#include "string_extraction.hpp"
#include "../cipher/cipher_base.hpp"
#include "../lexer/source_scanner.hpp"
#include "../../common/base64.hpp"
#include "../../common/json_parser.hpp"
#include "../../common/random.hpp"

#include <regex>
#include <sstream>
#include <stdexcept>
#include <unordered_set>

namespace codeveil {
namespace strings {

namespace {

const char* kBase36 = "0123456789abcdefghijklmnopqrstuvwxyz";
const char* kRevealFailure = "Failed to reveal strings. ";
const int kMaxNameAttempts = 64;

bool isIdentifierShaped(const std::string& name) {
    if (name.empty() || !lexer::isIdentifierStart(name[0])) {
        return false;
    }
    for (char c : name) {
        if (!lexer::isIdentifierChar(c)) return false;
    }
    return true;
}

std::string escapeForRegex(const std::string& literal) {
    std::string out;
    for (char c : literal) {
        if (c == '$') out += '\\';
        out += c;
    }
    return out;
}

bool isBase64Text(const std::string& text) {
    for (char c : text) {
        if (base64Value(c) < 0 && c != '=') return false;
    }
    return true;
}

} // namespace

StringExtractionCodec::StringExtractionCodec(const StringConcealConfig& config)
    : config_(config), logger_("StringExtraction") {
    if (!isIdentifierShaped(config_.array_prefix) ||
        !isIdentifierShaped(config_.decoder_prefix)) {
        throw std::invalid_argument("string-conceal prefixes must be identifiers");
    }
    if (config_.name_length == 0) {
        throw std::invalid_argument("string-conceal name_length must be positive");
    }
}

std::string StringExtractionCodec::buildPrelude(const std::string& array_name,
                                                const std::string& decoder_name,
                                                const std::vector<std::string>& encrypted,
                                                const std::string& encoded_key) const {
    JsonValue table = JsonValue::array();
    for (const auto& entry : encrypted) {
        table.push(JsonValue(entry));
    }

    std::ostringstream oss;
    oss << "var " << array_name << "=" << JsonSerializer::compact(table) << ";"
        << "var " << decoder_name << "=function(i){var k=\"" << encoded_key << "\";"
        << "return decodeURIComponent(escape(atob(" << array_name << "[i]).split('').map(function(c,j){"
        << "return String.fromCharCode(c.charCodeAt(0)^atob(k).charCodeAt(j%atob(k).length))"
        << "}).join('')))};";
    return oss.str();
}

CodecResult StringExtractionCodec::encode(const std::string& source,
                                          const std::string& secret) const {
    if (secret.empty()) {
        throw CodecError(ErrorKind::InvalidInput,
                         "A secret key is required for String Concealment.");
    }
    requireNonEmpty(source, "Code", "String Concealment.");

    std::vector<lexer::LiteralSpan> spans = lexer::findStringLiterals(source);

    CodecResult result;
    if (spans.empty()) {
        logger_.debug("no string literals found");
        result.text = source;
        result.log = "No strings found to conceal.";
        result.counters["strings_concealed"] = 0;
        return result;
    }

    std::vector<std::string> encrypted;
    encrypted.reserve(spans.size());
    for (const auto& span : spans) {
        encrypted.push_back(base64Encode(cipher::xorCipher(span.body, secret)));
    }

    // names must not clash with each other or with any word already present
    std::unordered_set<std::string> taken;
    for (auto& word : lexer::wordsOf(source)) {
        taken.insert(std::move(word));
    }

    Random rng;
    if (config_.use_fixed_seed) {
        rng.seed(config_.seed);
    }
    auto pickName = [&](const std::string& prefix) {
        std::string name;
        for (int attempt = 0; attempt < kMaxNameAttempts; attempt++) {
            name = prefix + rng.nextToken(kBase36, config_.name_length);
            if (taken.insert(name).second) {
                return name;
            }
        }
        throw CodecError(ErrorKind::InvalidInput,
                         "Could not generate an unused name with prefix " + prefix);
    };
    const std::string array_name = pickName(config_.array_prefix);
    const std::string decoder_name = pickName(config_.decoder_prefix);

    std::string body;
    body.reserve(source.size());
    size_t cursor = 0;
    for (size_t i = 0; i < spans.size(); i++) {
        body.append(source, cursor, spans[i].begin - cursor);
        body += decoder_name + "(" + std::to_string(i) + ")";
        cursor = spans[i].end;
    }
    body.append(source, cursor, std::string::npos);

    result.text = buildPrelude(array_name, decoder_name, encrypted, base64Encode(secret)) + body;
    result.log = "Concealed " + std::to_string(spans.size()) +
                 " strings. Deobfuscation can reveal the strings but not reconstruct "
                 "the code automatically.";
    result.counters["strings_concealed"] = toCounter(spans.size());
    result.counters["bytes_in"] = toCounter(source.size());
    result.counters["bytes_out"] = toCounter(result.text.size());

    logger_.debug("concealed {} strings behind {}()", spans.size(), decoder_name);
    return result;
}

ConcealedTable StringExtractionCodec::locateTable(const std::string& artifact) const {
    const std::regex array_anchor("var (" + escapeForRegex(config_.array_prefix) +
                                  "[a-zA-Z0-9]+)=\\[");
    static const std::regex key_anchor(R"(var k=")");

    ConcealedTable table;
    bool found_array = false;

    std::smatch array_match;
    if (std::regex_search(artifact, array_match, array_anchor)) {
        size_t open = static_cast<size_t>(array_match.position(0) + array_match.length(0)) - 1;
        size_t close = artifact.find("];", open);
        if (close != std::string::npos) {
            table.array_name = array_match[1].str();
            JsonValue parsed;
            try {
                parsed = JsonParser::parse(artifact.substr(open, close - open + 1));
            } catch (const std::runtime_error& e) {
                throw CodecError(ErrorKind::MalformedArtifact,
                                 std::string(kRevealFailure) + "Unreadable string array: " + e.what());
            }
            for (const auto& item : parsed.array_value) {
                if (!item.isString()) {
                    throw CodecError(ErrorKind::MalformedArtifact,
                                     std::string(kRevealFailure) + "String array entries must be strings.");
                }
                table.entries.push_back(item.string_value);
            }
            found_array = true;
        }
    }

    bool found_key = false;
    std::smatch key_match;
    if (std::regex_search(artifact, key_match, key_anchor)) {
        size_t start = static_cast<size_t>(key_match.position(0) + key_match.length(0));
        size_t close = artifact.find("\";", start);
        if (close != std::string::npos && close > start) {
            table.encoded_key = artifact.substr(start, close - start);
            found_key = isBase64Text(table.encoded_key);
        }
    }

    if (!found_array || !found_key) {
        throw CodecError(ErrorKind::MalformedArtifact,
                         std::string(kRevealFailure) +
                         "Could not find the concealed string array or key in the code.");
    }

    return table;
}

std::vector<std::string> StringExtractionCodec::revealStrings(const std::string& artifact,
                                                              const std::string& secret) const {
    if (secret.empty()) {
        throw CodecError(ErrorKind::InvalidInput,
                         std::string(kRevealFailure) + "A secret key is required.");
    }

    ConcealedTable table = locateTable(artifact);

    if (base64Encode(secret) != table.encoded_key) {
        throw CodecError(ErrorKind::AuthenticationMismatch,
                         std::string(kRevealFailure) + "The provided key is incorrect.");
    }

    std::vector<std::string> revealed;
    revealed.reserve(table.entries.size());
    for (size_t i = 0; i < table.entries.size(); i++) {
        try {
            revealed.push_back(cipher::xorCipher(base64Decode(table.entries[i]), secret));
        } catch (const std::invalid_argument& e) {
            throw CodecError(ErrorKind::MalformedArtifact,
                             std::string(kRevealFailure) + "Entry " + std::to_string(i) +
                             ": " + e.what());
        }
    }

    logger_.debug("revealed {} strings from {}", revealed.size(), table.array_name);
    return revealed;
}

CodecResult StringExtractionCodec::decode(const std::string& artifact,
                                          const std::string& secret) const {
    std::vector<std::string> revealed = revealStrings(artifact, secret);

    std::ostringstream log;
    log << "Revealed strings from the concealed array:\n\n";
    for (size_t i = 0; i < revealed.size(); i++) {
        if (i > 0) log << '\n';
        log << i << ": \"" << revealed[i] << "\"";
    }

    CodecResult result;
    result.text = "// Code cannot be automatically reconstructed.\n"
                  "// See the map/log for the list of revealed strings.";
    result.log = log.str();
    result.counters["strings_revealed"] = toCounter(revealed.size());
    return result;
}

} // namespace strings
} // namespace codeveil
