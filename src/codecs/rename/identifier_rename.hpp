/**
 * Codeveil - Source Code Veiling Codecs
 *
 * identifier_rename.hpp - "lexical-scramble": rename identifiers, minify
 *
 * Identifiers are discovered on a copy of the source with comments and
 * quoted literals removed, but renaming is applied to the full source,
 * so a word inside a string or comment that matches a discovered
 * identifier is renamed as well. decode relies on the same scope.
 *
 * The rename table is the decode key. It is returned as the encode log,
 * serialized as a JSON object in assignment order.
 */

#ifndef CODEVEIL_IDENTIFIER_RENAME_HPP
#define CODEVEIL_IDENTIFIER_RENAME_HPP

#include "../../core/codec_base.hpp"
#include "../../common/logging.hpp"

#include <string>
#include <vector>
#include <utility>
#include <unordered_set>

namespace codeveil {
namespace rename {

/**
 * Ordered original -> replacement pairs
 */
using RenameTable = std::vector<std::pair<std::string, std::string>>;

struct IdentifierRenameConfig {
    bool minify = true;                         // strip comments, collapse whitespace
    std::vector<std::string> extra_reserved;    // names never renamed, on top of the built-ins
};

/**
 * Keywords, literals and host globals that are never renamed
 */
const std::unordered_set<std::string>& builtinReservedWords();

/**
 * Bijective numbering over the 53 characters a..z A..Z _
 *   0 -> "a", 26 -> "A", 52 -> "_", 53 -> "aa", 54 -> "ab", ...
 */
std::string generateName(size_t n);

std::string serializeTable(const RenameTable& table);

/**
 * Throws CodecError(MissingDecodeKey) on empty input,
 * CodecError(MalformedArtifact) on anything that is not a JSON object of
 * string values.
 */
RenameTable parseTable(const std::string& json);

class IdentifierRenameCodec : public Codec {
public:
    static constexpr const char* kMethodName = "lexical-scramble";

    IdentifierRenameCodec() : logger_("IdentifierRename") {}
    explicit IdentifierRenameCodec(const IdentifierRenameConfig& config)
        : config_(config), logger_("IdentifierRename") {}

    std::string getName() const override { return kMethodName; }
    std::string getDescription() const override {
        return "Renames identifiers to short generated names and minifies";
    }

    CodecTraits getTraits() const override {
        CodecTraits traits;
        traits.encode_requires_key = false;
        traits.decode_input = DecodeInput::RenameTable;
        traits.self_decoding = false;
        traits.lossless = !config_.minify;
        return traits;
    }

    const IdentifierRenameConfig& getConfig() const { return config_; }

    /**
     * secret is ignored. The returned log is the serialized RenameTable.
     */
    CodecResult encode(const std::string& source, const std::string& secret) const override;

    CodecResult decode(const std::string& artifact, const std::string& table_json) const override;

    /**
     * Identifiers eligible for renaming, in first-occurrence order
     */
    std::vector<std::string> discoverIdentifiers(const std::string& source) const;

    /**
     * Sort by descending length (stable) and assign generated names,
     * skipping candidates that would collide with reserved words or with
     * words left untouched in the source.
     */
    RenameTable assignNames(std::vector<std::string> identifiers,
                            const std::string& source) const;

    /**
     * Comment stripping plus whitespace collapsing, as applied by encode
     */
    static std::string minify(const std::string& source);

private:
    IdentifierRenameConfig config_;
    Logger logger_;

    bool isReserved(const std::string& word) const;
};

} // namespace rename
} // namespace codeveil

#endif // CODEVEIL_IDENTIFIER_RENAME_HPP
