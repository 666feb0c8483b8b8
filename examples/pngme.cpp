/**
 * @file pngme.cpp
 * @brief Command line tool hiding messages inside PNG chunks
 *
 * Usage:
 *   pngme encode FILE CHUNK_TYPE MESSAGE [OUTPUT_FILE]
 *   pngme decode FILE CHUNK_TYPE
 *   pngme remove FILE CHUNK_TYPE
 *   pngme print FILE
 */

#include <pngme/commands.hh>
#include <pngme/exceptions.hh>
#include <pngme/file_io.hh>
#include <pngme/parse_options.hh>
#include <pngme/pngme_config.h>

#include <iostream>
#include <string>
#include <vector>

namespace {

    constexpr int exit_ok = 0;
    constexpr int exit_failure = 1;
    constexpr int exit_usage = 2;

    void print_usage(std::ostream& os, const char* program) {
        os << "Usage: " << program << " [--strict] <command> [arguments]\n";
        os << "\n";
        os << "Hide and recover text messages in PNG chunks.\n";
        os << "\n";
        os << "Commands:\n";
        os << "  encode FILE CHUNK_TYPE MESSAGE [OUTPUT_FILE]\n";
        os << "      Append MESSAGE as a CHUNK_TYPE chunk. Writes OUTPUT_FILE,\n";
        os << "      or overwrites FILE when no output is given\n";
        os << "  decode FILE CHUNK_TYPE\n";
        os << "      Print the message of the first CHUNK_TYPE chunk\n";
        os << "  remove FILE CHUNK_TYPE\n";
        os << "      Remove the first CHUNK_TYPE chunk and rewrite FILE\n";
        os << "  print FILE\n";
        os << "      List every chunk of FILE\n";
        os << "\n";
        os << "Options:\n";
        os << "  --strict     Reject files with broken IHDR/IEND structure\n";
        os << "  -h, --help   Show this help\n";
        os << "  --version    Show the version\n";
    }

    struct command_line {
        bool strict = false;
        bool help = false;
        bool version = false;
        std::vector<std::string> positional;
    };

    command_line parse_command_line(int argc, char* argv[]) {
        command_line cl;
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--strict") {
                cl.strict = true;
            } else if (arg == "-h" || arg == "--help") {
                cl.help = true;
            } else if (arg == "--version") {
                cl.version = true;
            } else {
                cl.positional.push_back(std::move(arg));
            }
        }
        return cl;
    }

    void print_warning(std::uint64_t offset, std::string_view category, std::string_view message) {
        std::cerr << "Warning [" << category << "] at offset " << offset << ": " << message << "\n";
    }

    int run(const std::vector<std::string>& args, const pngme::parse_options& options, const char* program) {
        const auto& command = args[0];

        if (command == "encode" && (args.size() == 4 || args.size() == 5)) {
            auto data = pngme::read_file(args[1]);
            auto encoded = pngme::encode(data, args[2], args[3], options);
            pngme::write_file(args.size() == 5 ? args[4] : args[1], encoded);
            return exit_ok;
        }

        if (command == "decode" && args.size() == 3) {
            auto message = pngme::decode(pngme::read_file(args[1]), args[2], options);
            std::cout << "Chunk data: `" << message << "`\n";
            return exit_ok;
        }

        if (command == "remove" && args.size() == 3) {
            auto data = pngme::remove_message(pngme::read_file(args[1]), args[2], options);
            pngme::write_file(args[1], data);
            return exit_ok;
        }

        if (command == "print" && args.size() == 2) {
            std::cout << pngme::describe(pngme::read_file(args[1]), options);
            return exit_ok;
        }

        std::cerr << "Invalid command line: '" << command << "' with " << (args.size() - 1) << " argument(s)\n\n";
        print_usage(std::cerr, program);
        return exit_usage;
    }
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(std::cout, argv[0]);
        return exit_failure;
    }

    auto cl = parse_command_line(argc, argv);
    if (cl.help) {
        print_usage(std::cout, argv[0]);
        return exit_ok;
    }
    if (cl.version) {
        std::cout << "pngme " << LIBPNGME_VERSION << "\n";
        return exit_ok;
    }
    if (cl.positional.empty()) {
        print_usage(std::cerr, argv[0]);
        return exit_usage;
    }

    pngme::parse_options options;
    options.strict = cl.strict;
    options.on_warning = print_warning;

    try {
        return run(cl.positional, options, argv[0]);
    } catch (const pngme::pngme_error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return exit_failure;
    }
}
