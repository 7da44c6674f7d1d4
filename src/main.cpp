#include "fountain.hpp"
#include "fountain_config.hpp"
#include "fountain_errors.hpp"
#include "strand_codec.hpp"
#include "self_test.hpp"
#include "logging.hpp"

#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

constexpr int EXIT_INSUFFICIENT = 2;

static void usage(const char* prog) {
    std::cerr << "Usage: " << prog << " [--log-level LEVEL] <command> [options]" << std::endl;
    std::cerr << "  encode <input> <output> [--chunk-bits N] [--redundancy R] [--threads T] [--seed-symbols S]" << std::endl;
    std::cerr << "  decode <input> <output> [--strict] [--seed-symbols S]" << std::endl;
    std::cerr << "  selftest [--chunk-bits N]" << std::endl;
    std::cerr << "Example: " << prog << " encode photo.jpg photo.dna --chunk-bits 64 --redundancy 2.5" << std::endl;
}

struct Arguments {
    std::string command;
    std::vector<std::string> positional;
    FountainConfig config;
    bool chunk_bits_given = false;
};

static std::string option_value(int argc, char** argv, int& i) {
    if (i + 1 >= argc) throw InvalidConfiguration(std::string("missing value for ") + argv[i]);
    return argv[++i];
}

static int to_int(const std::string& name, const std::string& value) {
    try {
        std::size_t used = 0;
        int v = std::stoi(value, &used);
        if (used != value.size()) throw std::invalid_argument(value);
        return v;
    } catch (const std::logic_error&) {
        throw InvalidConfiguration(name + " expects an integer, got '" + value + "'");
    }
}

static double to_double(const std::string& name, const std::string& value) {
    try {
        std::size_t used = 0;
        double v = std::stod(value, &used);
        if (used != value.size()) throw std::invalid_argument(value);
        return v;
    } catch (const std::logic_error&) {
        throw InvalidConfiguration(name + " expects a number, got '" + value + "'");
    }
}

static Arguments parse_arguments(int argc, char** argv) {
    Arguments args;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--log-level") {
            args.config.log_level = parse_log_level(option_value(argc, argv, i));
        } else if (a == "--chunk-bits") {
            args.config.chunk_bits = to_int(a, option_value(argc, argv, i));
            args.chunk_bits_given = true;
        } else if (a == "--redundancy") {
            args.config.redundancy = to_double(a, option_value(argc, argv, i));
        } else if (a == "--threads") {
            args.config.threads = to_int(a, option_value(argc, argv, i));
        } else if (a == "--seed-symbols") {
            args.config.seed_symbols = to_int(a, option_value(argc, argv, i));
        } else if (a == "--strict") {
            args.config.strict = true;
        } else if (a.size() > 2 && a.compare(0, 2, "--") == 0) {
            throw InvalidConfiguration("unknown option " + a);
        } else if (args.command.empty()) {
            args.command = a;
        } else {
            args.positional.push_back(a);
        }
    }
    return args;
}

static std::vector<uint8_t> read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw std::runtime_error("cannot open " + path);
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

static int run_encode(const Arguments& args) {
    std::vector<uint8_t> message = read_file(args.positional[0]);
    EncodedMessage encoded = encode_message(message, args.config);

    std::ofstream out(args.positional[1]);
    if (!out) throw std::runtime_error("cannot create " + args.positional[1]);
    out << encoded.session.to_header() << "\n";
    for (const auto& d : encoded.droplets)
        out << strand_from_droplet(d, args.config.seed_symbols) << "\n";
    if (!out.flush()) throw std::runtime_error("write failed on " + args.positional[1]);

    std::cout << "[cli] " << message.size() << " bytes -> " << encoded.droplets.size()
              << " strands (" << encoded.session.chunk_count << " chunks of "
              << encoded.session.chunk_bits << " bits)" << std::endl;
    return 0;
}

static int run_decode(const Arguments& args) {
    std::ifstream in(args.positional[0]);
    if (!in) throw std::runtime_error("cannot open " + args.positional[0]);

    std::string line;
    if (!std::getline(in, line)) throw InvalidConfiguration("missing session header");

    EncodedMessage encoded;
    encoded.session = parse_session_header(line);

    std::size_t line_no = 1, discarded = 0;
    while (std::getline(in, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;
        try {
            encoded.droplets.push_back(
                droplet_from_strand(line, args.config.seed_symbols, encoded.session.chunk_bits));
        } catch (const InvalidSymbol& e) {
            // A damaged strand is only one droplet, the rest may still cover the message
            ++discarded;
            if (log_enabled(LogLevel::Warning))
                std::cerr << "[cli] Line " << line_no << " discarded: " << e.what() << std::endl;
        }
    }

    std::vector<uint8_t> message = decode_message(encoded, args.config.strict);

    std::ofstream out(args.positional[1], std::ios::binary);
    if (!out) throw std::runtime_error("cannot create " + args.positional[1]);
    out.write(reinterpret_cast<const char*>(message.data()), static_cast<std::streamsize>(message.size()));
    if (!out.flush()) throw std::runtime_error("write failed on " + args.positional[1]);

    std::cout << "[cli] " << encoded.droplets.size() << " strands (" << discarded << " discarded) -> "
              << message.size() << " bytes" << std::endl;
    return 0;
}

int main(int argc, char** argv) {
    if (argc < 2) {
        usage(argv[0]);
        return 1;
    }

    try {
        Arguments args = parse_arguments(argc, argv);
        set_log_level(args.config.log_level);
        if (log_enabled(LogLevel::Debug))
            std::cerr << "[cli] Logging level set to: " << log_level_name(args.config.log_level) << std::endl;

        if (args.command == "encode" && args.positional.size() == 2) {
            args.config.validate();
            return run_encode(args);
        }
        if (args.command == "decode" && args.positional.size() == 2) {
            return run_decode(args);
        }
        if (args.command == "selftest" && args.positional.empty()) {
            int bits = args.chunk_bits_given ? args.config.chunk_bits : 4;
            return run_self_test(bits, std::cout) ? 0 : 1;
        }

        usage(argv[0]);
        return 1;
    } catch (const InsufficientDroplets& e) {
        std::cerr << "[cli] " << e.what() << ", supply more strands" << std::endl;
        return EXIT_INSUFFICIENT;
    } catch (const std::exception& e) {
        std::cerr << "[cli] Error: " << e.what() << std::endl;
        return 1;
    }
}
