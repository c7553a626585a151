/*
 * random.hpp
 *
 * general purpose RNG for cosmetic randomness (generated identifier
 * suffixes). seedable for reproducible artifacts. key-derived shuffles
 * do NOT use this - see codecs/cipher/cipher_base.hpp
 */

#ifndef CODEVEIL_RANDOM_HPP
#define CODEVEIL_RANDOM_HPP

#include <random>
#include <mutex>
#include <cstdint>
#include <string>
#include <vector>
#include <stdexcept>

namespace codeveil {

class Random {
public:
    Random() : rng_(std::random_device{}()) {}
    explicit Random(uint64_t seed) : rng_(seed), seed_(seed) {}

    uint64_t getSeed() const { return seed_; }

    void seed(uint64_t new_seed) {
        std::lock_guard<std::mutex> lock(mutex_);
        seed_ = new_seed;
        rng_.seed(new_seed);
    }

    // [min, max] inclusive
    int nextInt(int min, int max) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::uniform_int_distribution<int> dist(min, max);
        return dist(rng_);
    }

    // [0, max) exclusive
    size_t nextSize(size_t max) {
        if (max == 0) {
            throw std::invalid_argument("nextSize: empty range");
        }
        std::lock_guard<std::mutex> lock(mutex_);
        std::uniform_int_distribution<size_t> dist(0, max - 1);
        return dist(rng_);
    }

    template<typename T>
    const T& choose(const std::vector<T>& items) {
        if (items.empty()) {
            throw std::runtime_error("Cannot choose from empty vector");
        }
        return items[nextSize(items.size())];
    }

    // length characters drawn uniformly from alphabet
    std::string nextToken(const std::string& alphabet, size_t length) {
        if (alphabet.empty()) {
            throw std::invalid_argument("nextToken: empty alphabet");
        }
        std::string token;
        token.reserve(length);
        for (size_t i = 0; i < length; i++) {
            token += alphabet[nextSize(alphabet.size())];
        }
        return token;
    }

private:
    std::mt19937_64 rng_;
    uint64_t seed_ = 0;
    std::mutex mutex_;
};

} // namespace codeveil

#endif // CODEVEIL_RANDOM_HPP
