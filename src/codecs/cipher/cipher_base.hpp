/**
 * Codeveil - Source Code Veiling Codecs
 *
 * cipher_base.hpp - Key-derived primitives shared by the key-based codecs
 *
 *   - seed hash:   32-bit signed hash of the key (h = h*31 + c, wrapping)
 *   - KeyedRandom: linear congruential generator seeded from that hash
 *   - xorCipher:   position-keyed XOR, c[i] ^ key[i % len(key)]
 *
 * None of this is cryptographically meaningful. The constants and the
 * truncated-remainder arithmetic are fixed so that artifacts stay
 * reproducible for a given key.
 */

#ifndef CODEVEIL_CIPHER_BASE_HPP
#define CODEVEIL_CIPHER_BASE_HPP

#include <string>
#include <cstdint>

namespace codeveil {
namespace cipher {

/**
 * hash = int32((hash << 5) - hash + byte) over every key byte
 */
inline int32_t createSeed(const std::string& key) {
    uint32_t hash = 0;
    for (char c : key) {
        hash = (hash << 5) - hash + static_cast<uint8_t>(c);
    }
    return static_cast<int32_t>(hash);
}

/**
 * S = (S * 9301 + 49297) mod 233280, draw = S / 233280
 *
 * The remainder keeps the sign of the dividend, so a negative seed yields
 * draws in (-1, 0]. Magnitudes stay below 2^45 and fit int64_t exactly.
 */
class KeyedRandom {
public:
    static constexpr int64_t kMultiplier = 9301;
    static constexpr int64_t kIncrement = 49297;
    static constexpr int64_t kModulus = 233280;

    explicit KeyedRandom(int64_t seed) : state_(seed) {}

    double next() {
        state_ = (state_ * kMultiplier + kIncrement) % kModulus;
        return static_cast<double>(state_) / static_cast<double>(kModulus);
    }

    int64_t state() const { return state_; }

private:
    int64_t state_;
};

/**
 * Position-keyed XOR. Self-inverse for a given key. An empty key leaves
 * the text unchanged; callers reject empty keys before getting here.
 */
inline std::string xorCipher(const std::string& text, const std::string& key) {
    if (key.empty()) {
        return text;
    }
    std::string out(text.size(), '\0');
    for (size_t i = 0; i < text.size(); i++) {
        out[i] = static_cast<char>(static_cast<uint8_t>(text[i]) ^
                                   static_cast<uint8_t>(key[i % key.size()]));
    }
    return out;
}

} // namespace cipher
} // namespace codeveil

#endif // CODEVEIL_CIPHER_BASE_HPP
