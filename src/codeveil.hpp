/*
 * codeveil.hpp - main include file
 *
 * just include this and you get everything
 */

#ifndef CODEVEIL_HPP
#define CODEVEIL_HPP

// Version information
#define CODEVEIL_VERSION_MAJOR 1
#define CODEVEIL_VERSION_MINOR 0
#define CODEVEIL_VERSION_PATCH 0
#define CODEVEIL_VERSION_STRING "1.0.0"

// Core components
#include "core/codec_base.hpp"
#include "core/codec_registry.hpp"
#include "core/statistics.hpp"

// Common utilities
#include "common/logging.hpp"
#include "common/random.hpp"
#include "common/json_parser.hpp"
#include "common/base64.hpp"

// Codecs
#include "codecs/codecs.hpp"

#include <cmath>
#include <iostream>
#include <memory>
#include <stdexcept>

namespace codeveil {

// version string
inline const char* getVersion() {
    return CODEVEIL_VERSION_STRING;
}

// ascii art banner
inline const char* getBanner() {
    return R"(
   ___          _                 _ _
  / __|___   __| |___ __ _____ _ (_) |
 | (__/ _ \ / _` / -_) V / -_) || | |
  \___\___/ \__,_\___|\_/\___|_||_|_|
  Source Code Veiling Codecs v)" CODEVEIL_VERSION_STRING R"(
)";
}

inline void printBanner() {
    std::cerr << getBanner() << std::endl;
}

// config options - everything has a usable default
struct CodeveilConfig {
    std::string method = fragment::FragmentCipherCodec::kMethodName;
    int verbosity = 1;  // 0=silent, 1=warnings, 2=info, 3=debug, 4=trace
    bool has_log_level = false;
    LogLevel log_level = LogLevel::Warn;
    std::string log_file;

    // lexical-scramble
    bool minify = true;
    std::vector<std::string> reserved_words;

    // string-conceal
    std::string array_prefix = "_S";
    std::string decoder_prefix = "_D";
    int name_length = 4;

    // for reproducible artifacts
    bool use_fixed_seed = false;
    uint64_t random_seed = 0;

    // output options
    bool print_statistics = false;
    std::string stats_output_file;

    bool loadFromFile(const std::string& path) {
        try {
            auto json = JsonParser::parseFile(path);
            loadFromJson(json);
            return true;
        } catch (const std::exception& e) {
            LOG_ERROR("Failed to load config: {}", e.what());
            return false;
        }
    }

    /**
     * @throws std::runtime_error for a value of the wrong shape
     */
    void loadFromJson(const JsonValue& json) {
        if (!json.isObject()) {
            throw std::runtime_error("config root must be a JSON object");
        }

        if (json.has("method")) {
            method = json["method"].asString(method);
        }
        if (json.has("verbosity")) {
            verbosity = json["verbosity"].asInt(1);
        }
        if (json.has("log_level")) {
            std::string name = json["log_level"].asString();
            if (!parseLogLevel(name, log_level)) {
                throw std::runtime_error("unknown log_level '" + name + "'");
            }
            has_log_level = true;
        }
        if (json.has("log_file")) {
            log_file = json["log_file"].asString();
        }

        if (json.has("lexical_scramble")) {
            const auto& ls = json["lexical_scramble"];
            if (ls.has("minify")) {
                minify = ls["minify"].asBool(true);
            }
            if (ls.has("reserved_words")) {
                reserved_words = ls["reserved_words"].asStringArray();
            }
        }

        if (json.has("string_conceal")) {
            const auto& sc = json["string_conceal"];
            if (sc.has("array_prefix")) {
                array_prefix = sc["array_prefix"].asString(array_prefix);
            }
            if (sc.has("decoder_prefix")) {
                decoder_prefix = sc["decoder_prefix"].asString(decoder_prefix);
            }
            if (sc.has("name_length")) {
                name_length = sc["name_length"].asInt(4);
            }
        }

        if (json.has("random_seed")) {
            const auto& seed = json["random_seed"];
            double integral = 0.0;
            // 2^64 is exactly representable; anything at or above it is not a seed
            if (!seed.isNumber() || seed.number_value < 0 ||
                seed.number_value >= 18446744073709551616.0 ||
                std::modf(seed.number_value, &integral) != 0.0) {
                throw std::runtime_error("random_seed must be a non-negative integer");
            }
            use_fixed_seed = true;
            random_seed = static_cast<uint64_t>(seed.number_value);
        }

        if (json.has("print_statistics")) {
            print_statistics = json["print_statistics"].asBool(false);
        }
        if (json.has("stats_output_file")) {
            stats_output_file = json["stats_output_file"].asString();
        }
    }

    rename::IdentifierRenameConfig toRenameConfig() const {
        rename::IdentifierRenameConfig rc;
        rc.minify = minify;
        rc.extra_reserved = reserved_words;
        return rc;
    }

    strings::StringConcealConfig toConcealConfig() const {
        strings::StringConcealConfig sc;
        sc.array_prefix = array_prefix;
        sc.decoder_prefix = decoder_prefix;
        sc.name_length = name_length > 0 ? static_cast<size_t>(name_length) : 0;
        sc.use_fixed_seed = use_fixed_seed;
        sc.seed = random_seed;
        return sc;
    }
};

inline void initialize(const CodeveilConfig& config) {
    if (config.has_log_level) {
        LogConfig::get().setLevel(config.log_level);
    } else {
        LogConfig::get().setVerbosity(config.verbosity);
    }

    if (!config.log_file.empty() && !LogConfig::get().setOutputFile(config.log_file)) {
        LOG_WARN("cannot open log file {}, logging to stderr", config.log_file);
    }

    LOG_DEBUG("initialized with method={}, verbosity={}", config.method, config.verbosity);
}

/**
 * Registry holding the three codecs, configured from config
 *
 * @throws std::invalid_argument when the string-conceal settings are unusable
 */
inline std::unique_ptr<CodecRegistry> createDefaultRegistry(const CodeveilConfig& config = {}) {
    auto registry = std::make_unique<CodecRegistry>();
    registry->registerCodec(std::make_unique<fragment::FragmentCipherCodec>());
    registry->registerCodec(std::make_unique<rename::IdentifierRenameCodec>(config.toRenameConfig()));
    registry->registerCodec(std::make_unique<strings::StringExtractionCodec>(config.toConcealConfig()));
    return registry;
}

} // namespace codeveil

#endif // CODEVEIL_HPP
