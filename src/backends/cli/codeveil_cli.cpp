/**
 * Codeveil - Source Code Veiling Codecs
 *
 * codeveil_cli.cpp - Command line driver
 *
 * Reads a source file, runs one codec over it and writes the result.
 *
 * Usage:
 *   codeveil [options] <encode|decode|reveal> <input> <output>
 *
 * Workflow:
 *   1. codeveil --method lana-vortex --key s3cret encode app.js app.veiled.js
 *   2. codeveil --method lana-vortex --key s3cret decode app.veiled.js app.js
 *      or, without the key:
 *      codeveil --method lana-vortex reveal app.veiled.js app.js
 *
 *   lexical-scramble writes its rename table next to the output
 *   (or to --map-out) and needs it back with --map to decode.
 */

#include "codeveil.hpp"

#include <cstdio>
#include <fstream>
#include <iostream>
#include <string>

using namespace codeveil;

namespace {

bool readFile(const std::string& path, std::string& content) {
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        return false;
    }
    content.assign((std::istreambuf_iterator<char>(input)),
                   std::istreambuf_iterator<char>());
    return true;
}

bool writeFile(const std::string& path, const std::string& content) {
    std::ofstream output(path, std::ios::binary);
    if (!output.is_open()) {
        return false;
    }
    output << content;
    return static_cast<bool>(output);
}

void printCodecs(const CodecRegistry& registry) {
    std::cout << "Available methods:" << std::endl;
    for (const auto& name : registry.listCodecs()) {
        const Codec& codec = registry.getCodec(name);
        CodecTraits traits = codec.getTraits();
        std::cout << "  " << name << std::endl;
        std::cout << "      " << codec.getDescription() << std::endl;
        std::cout << "      encode needs key: " << (traits.encode_requires_key ? "yes" : "no")
                  << ", decode needs: "
                  << (traits.decode_input == DecodeInput::RenameTable ? "rename table (--map)" : "key (--key)")
                  << (traits.self_decoding ? ", supports reveal" : "")
                  << (traits.lossless ? "" : ", lossy")
                  << std::endl;
    }
}

} // namespace

/**
 * Print usage
 */
void printUsage(const char* program) {
    std::cout << getBanner() << std::endl;
    std::cout << "Usage: " << program << " [options] <encode|decode|reveal> <input> <output>" << std::endl;
    std::cout << std::endl;
    std::cout << "Commands:" << std::endl;
    std::cout << "  encode                Veil the input" << std::endl;
    std::cout << "  decode                Undo a previous encode (needs --key or --map)" << std::endl;
    std::cout << "  reveal                Rebuild a self-decoding artifact without the key" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --method <name>       Codec to use (default: lana-vortex)" << std::endl;
    std::cout << "  --key <secret>        Secret key" << std::endl;
    std::cout << "  --map <file>          Rename table for lexical-scramble decode" << std::endl;
    std::cout << "  --map-out <file>      Where to write the codec log / rename table" << std::endl;
    std::cout << "  --config <file>       Configuration file (JSON)" << std::endl;
    std::cout << "  --seed <n>            Fixed seed for generated names" << std::endl;
    std::cout << "  --no-minify           lexical-scramble: keep comments and layout" << std::endl;
    std::cout << "  --stats               Print statistics when done" << std::endl;
    std::cout << "  --list                List available methods" << std::endl;
    std::cout << "  --verbose, -v         Debug output" << std::endl;
    std::cout << "  --help, -h            Show this help" << std::endl;
    std::cout << std::endl;
    std::cout << "Examples:" << std::endl;
    std::cout << "  " << program << " --key s3cret encode app.js out.js" << std::endl;
    std::cout << "  " << program << " --method lexical-scramble encode app.js out.js" << std::endl;
    std::cout << "  " << program << " --method lexical-scramble --map out.js.map.json decode out.js app.js" << std::endl;
    std::cout << "  " << program << " --method string-conceal --key k decode out.js notes.txt" << std::endl;
}

int main(int argc, char* argv[]) {
    std::string config_file;
    std::string method;
    std::string key;
    std::string map_file;
    std::string map_out_file;
    std::string seed;
    std::string command;
    std::string input_file;
    std::string output_file;
    bool no_minify = false;
    bool stats = false;
    bool verbose = false;
    bool list = false;

    // Parse arguments
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "--config" && i + 1 < argc) {
            config_file = argv[++i];
        } else if (arg == "--method" && i + 1 < argc) {
            method = argv[++i];
        } else if (arg == "--key" && i + 1 < argc) {
            key = argv[++i];
        } else if (arg == "--map" && i + 1 < argc) {
            map_file = argv[++i];
        } else if (arg == "--map-out" && i + 1 < argc) {
            map_out_file = argv[++i];
        } else if (arg == "--seed" && i + 1 < argc) {
            seed = argv[++i];
        } else if (arg == "--no-minify") {
            no_minify = true;
        } else if (arg == "--stats") {
            stats = true;
        } else if (arg == "--list") {
            list = true;
        } else if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (!arg.empty() && arg[0] != '-') {
            if (command.empty()) {
                command = arg;
            } else if (input_file.empty()) {
                input_file = arg;
            } else if (output_file.empty()) {
                output_file = arg;
            } else {
                std::cerr << "Unexpected argument: " << arg << std::endl;
                return 1;
            }
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            printUsage(argv[0]);
            return 1;
        }
    }

    CodeveilConfig config;
    if (!config_file.empty() && !config.loadFromFile(config_file)) {
        return 1;
    }

    // command line overrides the config file
    if (!method.empty()) {
        config.method = method;
    }
    if (no_minify) {
        config.minify = false;
    }
    if (stats) {
        config.print_statistics = true;
    }
    if (verbose) {
        config.has_log_level = true;
        config.log_level = LogLevel::Debug;
    }
    if (!seed.empty()) {
        try {
            config.random_seed = std::stoull(seed);
            config.use_fixed_seed = true;
        } catch (const std::exception&) {
            std::cerr << "[codeveil] Error: invalid seed: " << seed << std::endl;
            return 1;
        }
    }

    initialize(config);

    std::unique_ptr<CodecRegistry> registry;
    try {
        registry = createDefaultRegistry(config);
    } catch (const std::invalid_argument& e) {
        std::cerr << "[codeveil] Error: bad configuration: " << e.what() << std::endl;
        return 1;
    }

    if (list) {
        printCodecs(*registry);
        return 0;
    }

    if (command.empty() || input_file.empty() || output_file.empty()) {
        printUsage(argv[0]);
        return 1;
    }

    if (command != "encode" && command != "decode" && command != "reveal") {
        std::cerr << "Unknown command: " << command << std::endl;
        printUsage(argv[0]);
        return 1;
    }

    if (!registry->has(config.method)) {
        std::cerr << "[codeveil] Error: unknown method '" << config.method
                  << "' (see --list)" << std::endl;
        return 1;
    }

    const CodecTraits traits = registry->getCodec(config.method).getTraits();

    fprintf(stderr, "[codeveil] Command: %s\n", command.c_str());
    fprintf(stderr, "[codeveil] Method: %s\n", config.method.c_str());
    fprintf(stderr, "[codeveil] Input: %s\n", input_file.c_str());
    fprintf(stderr, "[codeveil] Output: %s\n", output_file.c_str());

    // Read input
    std::string text;
    if (!readFile(input_file, text)) {
        std::cerr << "[codeveil] Error: Cannot open input file: " << input_file << std::endl;
        return 1;
    }
    fprintf(stderr, "[codeveil] Read %zu bytes from %s\n", text.size(), input_file.c_str());

    CodecResult result;
    try {
        if (command == "encode") {
            result = registry->encode(config.method, text, key);
            if (map_out_file.empty() && traits.decode_input == DecodeInput::RenameTable) {
                map_out_file = output_file + ".map.json";
            }
        } else if (command == "decode") {
            std::string secret = key;
            if (traits.decode_input == DecodeInput::RenameTable) {
                if (map_file.empty()) {
                    std::cerr << "[codeveil] Error: " << config.method
                              << " needs its rename table (--map <file>)" << std::endl;
                    return 1;
                }
                if (!readFile(map_file, secret)) {
                    std::cerr << "[codeveil] Error: Cannot open map file: " << map_file << std::endl;
                    return 1;
                }
            }
            result = registry->decode(config.method, text, secret);
        } else {
            result = registry->reconstruct(config.method, text);
        }
    } catch (const CodecError& e) {
        LOG_ERROR("{} {} failed [{}]", config.method, command, errorKindToString(e.kind()));
        std::cerr << "[codeveil] Error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[codeveil] Error: " << e.what() << std::endl;
        return 1;
    }

    // Write output
    if (!writeFile(output_file, result.text)) {
        std::cerr << "[codeveil] Error: Cannot create output file: " << output_file << std::endl;
        return 1;
    }
    fprintf(stderr, "[codeveil] Wrote %zu bytes to %s\n", result.text.size(), output_file.c_str());

    if (!map_out_file.empty()) {
        if (!writeFile(map_out_file, result.log)) {
            std::cerr << "[codeveil] Error: Cannot create map file: " << map_out_file << std::endl;
            return 1;
        }
        fprintf(stderr, "[codeveil] Wrote log to %s\n", map_out_file.c_str());
    } else if (!result.log.empty()) {
        fprintf(stderr, "[codeveil] %s\n", result.log.c_str());
    }

    if (!text.empty()) {
        double change = (static_cast<double>(result.text.size()) / text.size() - 1.0) * 100.0;
        fprintf(stderr, "[codeveil] Size change: %+.1f%%\n", change);
    }

    if (config.print_statistics) {
        std::cerr << registry->getStatistics().format();
    }
    if (!config.stats_output_file.empty()) {
        if (!writeFile(config.stats_output_file, registry->getStatistics().toJson())) {
            std::cerr << "[codeveil] Error: Cannot write statistics to "
                      << config.stats_output_file << std::endl;
            return 1;
        }
    }

    return 0;
}
