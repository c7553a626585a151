/**
 * Codeveil - Source Code Veiling Codecs
 *
 * fragment_cipher.cpp - "lana-vortex" implementation
 */

#include "fragment_cipher.hpp"
#include "../../common/base64.hpp"
#include "../../common/json_parser.hpp"

#include <algorithm>
#include <numeric>
#include <regex>
#include <cmath>

namespace codeveil {
namespace fragment {

namespace {

const char* kDecodeFailure =
    "Decoding failed. The key might be incorrect or the code is corrupted. ";

/**
 * Find the array literal that starts at the end of an anchor match,
 * searching from `from`. The arrays embedded by buildWrapper never contain
 * ']' inside their elements. Only the anchor goes through the regex engine
 * so that long payloads are cut out with a plain find.
 *
 * @return true and the array text (brackets included) on success
 */
bool locateArray(const std::string& text, const std::regex& anchor, size_t from,
                 std::string& array_text, size_t& after) {
    std::smatch match;
    auto search_begin = text.begin() + static_cast<std::ptrdiff_t>(from);
    if (!std::regex_search(search_begin, text.end(), match, anchor)) {
        return false;
    }

    size_t open = from + static_cast<size_t>(match.position(0) + match.length(0)) - 1;
    size_t close = text.find(']', open);
    if (close == std::string::npos) {
        return false;
    }

    array_text = text.substr(open, close - open + 1);
    after = close + 1;
    return true;
}

JsonValue parseEmbedded(const std::string& json, const char* what) {
    try {
        return JsonParser::parse(json);
    } catch (const std::runtime_error& e) {
        throw CodecError(ErrorKind::MalformedArtifact,
                         std::string(kDecodeFailure) + "Unreadable " + what + ": " + e.what());
    }
}

} // namespace

size_t chunkSizeForKey(const std::string& key) {
    return std::max<size_t>(2, key.size() / 2);
}

std::vector<std::string> splitIntoFragments(const std::string& text, size_t chunk_size) {
    std::vector<std::string> fragments;
    fragments.reserve(text.size() / chunk_size + 1);
    for (size_t i = 0; i < text.size(); i += chunk_size) {
        fragments.push_back(text.substr(i, chunk_size));
    }
    return fragments;
}

std::vector<size_t> keyedShuffle(size_t n, cipher::KeyedRandom& rng) {
    std::vector<size_t> order(n);
    std::iota(order.begin(), order.end(), 0);

    for (size_t i = 1; i < n; i++) {
        size_t pivot = order[i];
        size_t left = 0;
        size_t right = i;

        while (left < right) {
            size_t mid = left + ((right - left) >> 1);
            if (rng.next() - 0.5 < 0) {
                right = mid;
            } else {
                left = mid + 1;
            }
        }

        for (size_t p = i; p > left; p--) {
            order[p] = order[p - 1];
        }
        order[left] = pivot;
    }

    return order;
}

std::vector<size_t> invertPermutation(const std::vector<long long>& map, size_t expected_size) {
    if (map.size() != expected_size) {
        throw CodecError(ErrorKind::InconsistentMapping,
                         "Map is inconsistent. It has " + std::to_string(map.size()) +
                         " entries for " + std::to_string(expected_size) + " fragments.");
    }

    const size_t unset = expected_size;
    std::vector<size_t> order(expected_size, unset);

    for (size_t original = 0; original < map.size(); original++) {
        long long shuffled = map[original];
        if (shuffled < 0 || static_cast<unsigned long long>(shuffled) >= expected_size) {
            throw CodecError(ErrorKind::InconsistentMapping,
                             "Map is inconsistent. Position " + std::to_string(shuffled) +
                             " is out of range.");
        }
        size_t pos = static_cast<size_t>(shuffled);
        if (order[pos] != unset) {
            throw CodecError(ErrorKind::InconsistentMapping,
                             "Map is inconsistent. Position " + std::to_string(pos) +
                             " is claimed twice.");
        }
        order[pos] = original;
    }

    // sizes match and no duplicates, so every position is filled
    return order;
}

FragmentPlan planFragments(const std::string& text, const std::string& key) {
    FragmentPlan plan;
    plan.chunk_size = chunkSizeForKey(key);
    plan.fragments = splitIntoFragments(text, plan.chunk_size);

    cipher::KeyedRandom rng(cipher::createSeed(key));
    plan.shuffled_order = keyedShuffle(plan.fragments.size(), rng);

    plan.permutation.assign(plan.fragments.size(), 0);
    for (size_t shuffled = 0; shuffled < plan.shuffled_order.size(); shuffled++) {
        plan.permutation[plan.shuffled_order[shuffled]] = shuffled;
    }

    return plan;
}

std::string FragmentCipherCodec::buildWrapper(const std::string& payload_json,
                                              const std::string& map_json,
                                              const std::string& encoded_key) {
    std::string wrapper;
    wrapper.reserve(payload_json.size() + map_json.size() + 400);

    wrapper += "(function(){var p=";
    wrapper += payload_json;
    wrapper += ",m=";
    wrapper += map_json;
    wrapper += ",k=atob(\"";
    wrapper += encoded_key;
    wrapper += "\"),x=function(t,k){return t.split('').map(function(c,i){"
               "return String.fromCharCode(c.charCodeAt(0)^k.charCodeAt(i%k.length))"
               "}).join('')},d=new Array(p.length);"
               "p.forEach(function(e,i){var oi=m.indexOf(i);d[oi]=x(atob(e),k)});"
               "(new Function(decodeURIComponent(escape(d.join('')))))()})();";
    return wrapper;
}

CodecResult FragmentCipherCodec::encode(const std::string& source,
                                        const std::string& secret) const {
    if (source.empty() || secret.empty()) {
        throw CodecError(ErrorKind::InvalidInput,
                         "Code and key cannot be empty for Lana-Vortex.");
    }

    FragmentPlan plan = planFragments(source, secret);
    logger_.debug("{} fragments of {} bytes", plan.fragments.size(), plan.chunk_size);

    JsonValue payload = JsonValue::array();
    for (size_t shuffled = 0; shuffled < plan.shuffled_order.size(); shuffled++) {
        const std::string& fragment = plan.fragments[plan.shuffled_order[shuffled]];
        payload.push(JsonValue(base64Encode(cipher::xorCipher(fragment, secret))));
    }

    JsonValue order_map = JsonValue::array();
    for (size_t pos : plan.permutation) {
        order_map.push(JsonValue(static_cast<double>(pos)));
    }

    CodecResult result;
    result.text = buildWrapper(JsonSerializer::compact(payload),
                               JsonSerializer::compact(order_map),
                               base64Encode(secret));
    result.log = "Deobfuscation requires the original key. The result is a self-executing script.";
    result.counters["fragments"] = toCounter(plan.fragments.size());
    result.counters["chunk_size"] = toCounter(plan.chunk_size);
    result.counters["bytes_in"] = toCounter(source.size());
    result.counters["bytes_out"] = toCounter(result.text.size());

    logger_.trace("permutation: {}", JsonSerializer::compact(order_map));
    return result;
}

EmbeddedTables FragmentCipherCodec::extractTables(const std::string& artifact) const {
    static const std::regex payload_anchor(R"(var p=\[)");
    static const std::regex map_anchor(R"((?:var |,)m=\[)");
    static const std::regex key_anchor(R"(k=atob\(")");

    std::string payload_text;
    std::string map_text;
    size_t after_payload = 0;
    size_t after_map = 0;

    if (!locateArray(artifact, payload_anchor, 0, payload_text, after_payload) ||
        !locateArray(artifact, map_anchor, after_payload, map_text, after_map)) {
        throw CodecError(ErrorKind::MalformedArtifact,
                         std::string(kDecodeFailure) +
                         "Invalid Lana-Vortex format. Cannot find payload or map.");
    }

    EmbeddedTables tables;

    JsonValue payload = parseEmbedded(payload_text, "payload");
    for (const auto& item : payload.array_value) {
        if (!item.isString()) {
            throw CodecError(ErrorKind::MalformedArtifact,
                             std::string(kDecodeFailure) + "Payload entries must be strings.");
        }
        tables.payload.push_back(item.string_value);
    }

    JsonValue order_map = parseEmbedded(map_text, "permutation map");
    for (const auto& item : order_map.array_value) {
        double integral = 0.0;
        if (!item.isNumber() || std::modf(item.number_value, &integral) != 0.0) {
            throw CodecError(ErrorKind::InconsistentMapping,
                             std::string(kDecodeFailure) +
                             "Map is inconsistent. Entries must be whole numbers.");
        }
        if (item.number_value < 0 ||
            item.number_value >= static_cast<double>(tables.payload.size())) {
            throw CodecError(ErrorKind::InconsistentMapping,
                             std::string(kDecodeFailure) + "Map is inconsistent. Position " +
                             JsonSerializer::compact(item) + " is out of range.");
        }
        tables.permutation.push_back(static_cast<long long>(item.number_value));
    }

    std::smatch key_match;
    if (std::regex_search(artifact, key_match, key_anchor)) {
        size_t start = static_cast<size_t>(key_match.position(0) + key_match.length(0));
        size_t close = artifact.find('"', start);
        if (close != std::string::npos) {
            tables.encoded_key = artifact.substr(start, close - start);
        }
    }

    return tables;
}

std::string FragmentCipherCodec::reassemble(const EmbeddedTables& tables,
                                            const std::string& key) const {
    std::vector<size_t> order;
    try {
        order = invertPermutation(tables.permutation, tables.payload.size());
    } catch (const CodecError& e) {
        throw CodecError(e.kind(), std::string(kDecodeFailure) + e.what());
    }

    std::vector<std::string> originals(tables.payload.size());
    for (size_t shuffled = 0; shuffled < tables.payload.size(); shuffled++) {
        std::string cipher_text;
        try {
            cipher_text = base64Decode(tables.payload[shuffled]);
        } catch (const std::invalid_argument& e) {
            throw CodecError(ErrorKind::MalformedArtifact,
                             std::string(kDecodeFailure) + "Fragment " +
                             std::to_string(shuffled) + ": " + e.what());
        }
        originals[order[shuffled]] = cipher::xorCipher(cipher_text, key);
    }

    std::string text;
    for (const auto& fragment : originals) {
        text += fragment;
    }
    return text;
}

CodecResult FragmentCipherCodec::decode(const std::string& artifact,
                                        const std::string& secret) const {
    if (artifact.empty() || secret.empty()) {
        throw CodecError(ErrorKind::InvalidInput,
                         "Encoded code and key are required for decoding.");
    }

    EmbeddedTables tables = extractTables(artifact);
    logger_.debug("decoding {} fragments", tables.payload.size());

    CodecResult result;
    result.text = reassemble(tables, secret);
    result.log = "Successfully deobfuscated with the provided key.";
    result.counters["fragments"] = toCounter(tables.payload.size());
    return result;
}

CodecResult FragmentCipherCodec::reconstruct(const std::string& artifact) const {
    if (artifact.empty()) {
        throw CodecError(ErrorKind::InvalidInput, "Encoded code is required for reconstruction.");
    }

    EmbeddedTables tables = extractTables(artifact);
    if (tables.encoded_key.empty()) {
        throw CodecError(ErrorKind::MalformedArtifact,
                         std::string(kDecodeFailure) + "The wrapper carries no key.");
    }

    std::string key;
    try {
        key = base64Decode(tables.encoded_key);
    } catch (const std::invalid_argument& e) {
        throw CodecError(ErrorKind::MalformedArtifact,
                         std::string(kDecodeFailure) + "Embedded key: " + e.what());
    }

    CodecResult result;
    result.text = reassemble(tables, key);
    result.log = "Reconstructed with the key embedded in the artifact.";
    result.counters["fragments"] = toCounter(tables.payload.size());
    return result;
}

} // namespace fragment
} // namespace codeveil
