/*
 * codec_registry.hpp
 *
 * owns the codecs by method name and runs encode/decode through them,
 * collecting per-method statistics
 */

#ifndef CODEVEIL_CODEC_REGISTRY_HPP
#define CODEVEIL_CODEC_REGISTRY_HPP

#include "codec_base.hpp"
#include "statistics.hpp"
#include "../common/logging.hpp"

#include <memory>
#include <vector>
#include <unordered_map>
#include <type_traits>

namespace codeveil {

class CodecRegistry {
public:
    CodecRegistry() : logger_("CodecRegistry") {}

    // takes ownership of the codec
    template<typename T>
    void registerCodec(std::unique_ptr<T> codec) {
        static_assert(
            std::is_base_of<Codec, T>::value,
            "Codec must inherit from Codec"
        );

        std::string name = codec->getName();

        if (codecs_.find(name) != codecs_.end()) {
            logger_.warn("Codec '{}' already registered, replacing", name);
        } else {
            order_.push_back(name);
        }

        codecs_[name] = std::move(codec);
        logger_.debug("Registered codec: {}", name);
    }

    bool has(const std::string& name) const {
        return codecs_.find(name) != codecs_.end();
    }

    /**
     * @throws CodecError(InvalidInput) for an unknown method
     */
    const Codec& getCodec(const std::string& name) const {
        auto it = codecs_.find(name);
        if (it == codecs_.end()) {
            throw CodecError(ErrorKind::InvalidInput, "Unknown method: " + name);
        }
        return *it->second;
    }

    // registration order
    std::vector<std::string> listCodecs() const {
        return order_;
    }

    CodecResult encode(const std::string& method, const std::string& source,
                       const std::string& secret) {
        const Codec& codec = getCodec(method);
        CodecResult result;
        double elapsed = 0.0;
        {
            ScopedTimer timer(elapsed);
            result = run(method, "encode", [&]() { return codec.encode(source, secret); });
        }
        stats_.add(method + ".encode_time", elapsed);
        record(method, "encodes", result);
        return result;
    }

    CodecResult decode(const std::string& method, const std::string& artifact,
                       const std::string& secret_or_map) {
        const Codec& codec = getCodec(method);
        CodecResult result;
        double elapsed = 0.0;
        {
            ScopedTimer timer(elapsed);
            result = run(method, "decode", [&]() { return codec.decode(artifact, secret_or_map); });
        }
        stats_.add(method + ".decode_time", elapsed);
        record(method, "decodes", result);
        return result;
    }

    CodecResult reconstruct(const std::string& method, const std::string& artifact) {
        const Codec& codec = getCodec(method);
        if (!codec.getTraits().self_decoding) {
            throw CodecError(ErrorKind::InvalidInput,
                             method + " artifacts are not self-decoding");
        }
        CodecResult result;
        double elapsed = 0.0;
        {
            ScopedTimer timer(elapsed);
            result = run(method, "reconstruct", [&]() { return codec.reconstruct(artifact); });
        }
        stats_.add(method + ".decode_time", elapsed);
        record(method, "reconstructs", result);
        return result;
    }

    const Statistics& getStatistics() const { return stats_; }

    void printStatistics() const {
        logger_.info("{}", stats_.format());
    }

    void resetStatistics() {
        stats_.clear();
    }

private:
    std::unordered_map<std::string, std::unique_ptr<Codec>> codecs_;
    std::vector<std::string> order_;
    Statistics stats_;
    Logger logger_;

    template<typename Fn>
    CodecResult run(const std::string& method, const char* operation, Fn&& fn) {
        try {
            return fn();
        } catch (const CodecError& e) {
            stats_.increment(method + ".failures");
            logger_.debug("{} {} failed ({}): {}", method, operation,
                          errorKindToString(e.kind()), e.what());
            throw;
        }
    }

    void record(const std::string& method, const std::string& operation,
                const CodecResult& result) {
        stats_.increment(method + "." + operation);
        stats_.mergeCounters(method, result.counters);
    }
};

} // namespace codeveil

#endif // CODEVEIL_CODEC_REGISTRY_HPP
