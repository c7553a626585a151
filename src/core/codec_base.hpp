/**
 * Codeveil - Source Code Veiling Codecs
 *
 * codec_base.hpp - Base class and result/error types for all codecs
 *
 * Every codec (fragment cipher, identifier rename, string extraction)
 * implements the same two-operation surface:
 *
 *   encode(source, secret)         -> CodecResult { artifact, log }
 *   decode(artifact, secretOrMap)  -> CodecResult { text, log }
 *
 * Codecs hold configuration only. No state survives a call, so a single
 * instance may be used from several threads at once.
 */

#ifndef CODEVEIL_CODEC_BASE_HPP
#define CODEVEIL_CODEC_BASE_HPP

#include <string>
#include <map>
#include <limits>
#include <cstddef>
#include <stdexcept>

namespace codeveil {

/**
 * Failure categories surfaced by encode/decode
 */
enum class ErrorKind {
    InvalidInput,           // empty text or key where one is mandatory
    MalformedArtifact,      // embedded tables missing or unparsable
    InconsistentMapping,    // permutation / rename table cannot be inverted
    AuthenticationMismatch, // supplied key does not match the embedded one
    MissingDecodeKey        // rename table absent
};

inline const char* errorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidInput: return "InvalidInput";
        case ErrorKind::MalformedArtifact: return "MalformedArtifact";
        case ErrorKind::InconsistentMapping: return "InconsistentMapping";
        case ErrorKind::AuthenticationMismatch: return "AuthenticationMismatch";
        case ErrorKind::MissingDecodeKey: return "MissingDecodeKey";
        default: return "Unknown";
    }
}

class CodecError : public std::runtime_error {
public:
    CodecError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

/**
 * Output of one encode or decode call
 *
 * text     - the artifact (encode) or recovered text (decode)
 * log      - human readable log; for the rename codec's encode this is the
 *            serialized rename table needed to decode
 * counters - per-call statistics, merged by CodecRegistry
 */
struct CodecResult {
    std::string text;
    std::string log;
    std::map<std::string, int> counters;
};

// sizes go into int counters; saturate instead of wrapping
inline int toCounter(size_t n) {
    return n > static_cast<size_t>(std::numeric_limits<int>::max())
        ? std::numeric_limits<int>::max()
        : static_cast<int>(n);
}

/**
 * What the secondary argument of decode must carry
 */
enum class DecodeInput {
    SecretKey,
    RenameTable
};

struct CodecTraits {
    bool encode_requires_key = false;
    DecodeInput decode_input = DecodeInput::SecretKey;
    bool self_decoding = false;   // artifact carries everything needed to rebuild
    bool lossless = true;         // decode restores the program text
};

/**
 * Abstract base class for all codecs
 */
class Codec {
public:
    virtual ~Codec() = default;

    /**
     * Method name used on the command line and in configs ("lana-vortex")
     */
    virtual std::string getName() const = 0;

    virtual std::string getDescription() const = 0;

    virtual CodecTraits getTraits() const = 0;

    /**
     * @param source  program text to transform
     * @param secret  key; ignored by codecs whose traits say it is not needed
     * @throws CodecError
     */
    virtual CodecResult encode(const std::string& source,
                               const std::string& secret) const = 0;

    /**
     * @param artifact       output of a previous encode
     * @param secret_or_map  key or serialized rename table (see getTraits())
     * @throws CodecError
     */
    virtual CodecResult decode(const std::string& artifact,
                               const std::string& secret_or_map) const = 0;

    /**
     * Rebuild the source from the artifact alone. Only self-decoding codecs
     * support this; the default throws.
     */
    virtual CodecResult reconstruct(const std::string& artifact) const {
        (void)artifact;
        throw CodecError(ErrorKind::InvalidInput,
                         getName() + " artifacts cannot be reconstructed without a key");
    }

protected:
    static void requireNonEmpty(const std::string& value, const std::string& what,
                                const std::string& codec) {
        if (value.empty()) {
            throw CodecError(ErrorKind::InvalidInput,
                             what + " cannot be empty for " + codec);
        }
    }
};

} // namespace codeveil

#endif // CODEVEIL_CODEC_BASE_HPP
