/**
 * Codeveil - Source Code Veiling Codecs
 *
 * fragment_cipher.hpp - "lana-vortex": fragment, shuffle, XOR, wrap
 *
 * encode:
 *   1. split the source into chunks of max(2, len(key) / 2) bytes
 *   2. reorder the chunks with a comparator fed by KeyedRandom draws
 *   3. XOR every shuffled chunk against the key, base64 it
 *   4. emit a self-executing JavaScript wrapper carrying the payload,
 *      the permutation map and base64(key). The wrapper works on the
 *      UTF-8 bytes and decodes the joined text as UTF-8 before running it.
 *
 * decode(artifact, key) reads the payload and map back out of the wrapper
 * text and restores the original order. reconstruct(artifact) does the
 * same with the key embedded in the wrapper. Neither executes anything.
 */

#ifndef CODEVEIL_FRAGMENT_CIPHER_HPP
#define CODEVEIL_FRAGMENT_CIPHER_HPP

#include "../../core/codec_base.hpp"
#include "../../common/logging.hpp"
#include "../cipher/cipher_base.hpp"

#include <string>
#include <vector>

namespace codeveil {
namespace fragment {

/**
 * Fragments and permutation produced by one encode call
 */
struct FragmentPlan {
    size_t chunk_size = 0;
    std::vector<std::string> fragments;       // original order
    std::vector<size_t> shuffled_order;       // shuffled position -> original index
    std::vector<size_t> permutation;          // original index -> shuffled position
};

/**
 * Tables read back out of a wrapper
 */
struct EmbeddedTables {
    std::vector<std::string> payload;         // base64 ciphertexts, shuffled order
    std::vector<long long> permutation;       // as written, validated on use
    std::string encoded_key;                  // empty when absent
};

size_t chunkSizeForKey(const std::string& key);

std::vector<std::string> splitIntoFragments(const std::string& text, size_t chunk_size);

/**
 * Binary insertion sort of [0, n) driven by draws: one draw per comparison,
 * draw < 0.5 places the element being inserted before the compared one.
 * Always yields a permutation whatever the draws are.
 */
std::vector<size_t> keyedShuffle(size_t n, cipher::KeyedRandom& rng);

/**
 * Given map[original] = shuffled, return order[shuffled] = original.
 * Throws CodecError(InconsistentMapping) unless map is a bijection over
 * [0, expected_size).
 */
std::vector<size_t> invertPermutation(const std::vector<long long>& map, size_t expected_size);

FragmentPlan planFragments(const std::string& text, const std::string& key);

class FragmentCipherCodec : public Codec {
public:
    static constexpr const char* kMethodName = "lana-vortex";

    FragmentCipherCodec() : logger_("FragmentCipher") {}

    std::string getName() const override { return kMethodName; }
    std::string getDescription() const override {
        return "Key-seeded fragment shuffle with XOR; emits a self-decoding wrapper";
    }

    CodecTraits getTraits() const override {
        CodecTraits traits;
        traits.encode_requires_key = true;
        traits.decode_input = DecodeInput::SecretKey;
        traits.self_decoding = true;
        traits.lossless = true;
        return traits;
    }

    CodecResult encode(const std::string& source, const std::string& secret) const override;

    CodecResult decode(const std::string& artifact, const std::string& secret) const override;

    /**
     * Decode with the key carried inside the artifact
     */
    CodecResult reconstruct(const std::string& artifact) const override;

    /**
     * Locate the payload array, permutation map and encoded key.
     * Throws CodecError(MalformedArtifact) when payload or map is missing.
     */
    EmbeddedTables extractTables(const std::string& artifact) const;

    static std::string buildWrapper(const std::string& payload_json,
                                    const std::string& map_json,
                                    const std::string& encoded_key);

private:
    Logger logger_;

    std::string reassemble(const EmbeddedTables& tables, const std::string& key) const;
};

} // namespace fragment
} // namespace codeveil

#endif // CODEVEIL_FRAGMENT_CIPHER_HPP
