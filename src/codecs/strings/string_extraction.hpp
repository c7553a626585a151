/**
 * Codeveil - Source Code Veiling Codecs
 *
 * string_extraction.hpp - "string-conceal": move literals into an
 * encrypted table behind a generated decoder function
 *
 *   let x = "hi";
 *
 * becomes
 *
 *   var _S1a2b=["AwI="];var _D3c4d=function(i){var k="aw==";...};let x = _D3c4d(0);
 *
 * The decoder XORs UTF-8 bytes and decodes each result as UTF-8.
 * decode is lossy: it recovers the literals, never the program.
 */

#ifndef CODEVEIL_STRING_EXTRACTION_HPP
#define CODEVEIL_STRING_EXTRACTION_HPP

#include "../../core/codec_base.hpp"
#include "../../common/logging.hpp"

#include <string>
#include <vector>
#include <cstdint>

namespace codeveil {
namespace strings {

struct StringConcealConfig {
    std::string array_prefix = "_S";     // name of the encrypted table
    std::string decoder_prefix = "_D";   // name of the decoder function
    size_t name_length = 4;              // random base-36 suffix length
    bool use_fixed_seed = false;         // reproducible names
    uint64_t seed = 0;
};

/**
 * Table and key found in an artifact
 */
struct ConcealedTable {
    std::string array_name;
    std::vector<std::string> entries;    // base64 ciphertexts
    std::string encoded_key;
};

class StringExtractionCodec : public Codec {
public:
    static constexpr const char* kMethodName = "string-conceal";

    StringExtractionCodec() : logger_("StringExtraction") {}

    /**
     * Throws std::invalid_argument when a prefix is not identifier-shaped
     * or the suffix length is zero
     */
    explicit StringExtractionCodec(const StringConcealConfig& config);

    std::string getName() const override { return kMethodName; }
    std::string getDescription() const override {
        return "Moves string literals into an XOR-encrypted table behind a decoder call";
    }

    CodecTraits getTraits() const override {
        CodecTraits traits;
        traits.encode_requires_key = true;
        traits.decode_input = DecodeInput::SecretKey;
        traits.self_decoding = false;
        traits.lossless = false;
        return traits;
    }

    const StringConcealConfig& getConfig() const { return config_; }

    CodecResult encode(const std::string& source, const std::string& secret) const override;

    /**
     * Text is a fixed note that the program cannot be rebuilt; the log
     * enumerates the recovered strings as `i: "value"` lines.
     */
    CodecResult decode(const std::string& artifact, const std::string& secret) const override;

    /**
     * Recovered literal bodies, in extraction order
     *
     * @throws CodecError MalformedArtifact / AuthenticationMismatch / InvalidInput
     */
    std::vector<std::string> revealStrings(const std::string& artifact,
                                           const std::string& secret) const;

    ConcealedTable locateTable(const std::string& artifact) const;

private:
    StringConcealConfig config_;
    Logger logger_;

    std::string buildPrelude(const std::string& array_name,
                             const std::string& decoder_name,
                             const std::vector<std::string>& encrypted,
                             const std::string& encoded_key) const;
};

} // namespace strings
} // namespace codeveil

#endif // CODEVEIL_STRING_EXTRACTION_HPP
