/**
 * dsPack Unpacker - Entry Point
 *
 *   dspack_unpacker <path>                          Analyze archive(s)
 *   dspack_unpacker --extract <path> --output <dir> Analyze and extract
 *   dspack_unpacker --list <path>                   List files
 *   dspack_unpacker --help
 *
 * <path> is one .dsPack file or a directory of them.
 */

#include "dspack/batch.hpp"
#include "dspack/settings.hpp"
#include "dspack/logging.hpp"

#include <iostream>
#include <string>
#include <filesystem>

// CLI argument parsing
struct CliArgs {
    bool show_help = false;
    bool extract_mode = false;
    bool list_mode = false;
    bool show_tree = false;
    bool debug_logging = false;
    std::string input_path;
    std::string output_dir;
    std::string config_path;
    std::string error;
};

void print_help() {
    std::cout << R"(
dsPack Unpacker - .dsPack archive analysis and extraction

Usage:
  dspack_unpacker [--analyze] <path>                Analyze archive(s)
  dspack_unpacker --extract <path> --output <dir>   Analyze and extract
  dspack_unpacker --list <path>                     List files in archive(s)
  dspack_unpacker --help                            Show this help

<path> is a single .dsPack file or a directory containing .dsPack files.
Each archive is extracted to <dir>/<archive name>/.

Options:
  --help, -h           Show this help message
  --analyze, -a        Print the analysis report (default)
  --extract, -e        Extract files
  --output, -o <dir>   Output directory for extraction
  --list, -l           List every file path
  --tree, -t           Print the folder tree
  --config, -c <json>  Load settings from a JSON file
  --debug, -d          Debug logging with per-record detail (alias --verbose, -v)

Files whose payload cannot be decompressed are written as-is with
[Compressed] before their extension.

Exit codes: 0 success, 1 usage or fatal error, 2 partial extraction.
)" << std::endl;
}

CliArgs parse_args(int argc, char* argv[]) {
    CliArgs args;

    auto take_value = [&](int& i, const std::string& flag, std::string& out) {
        if (i + 1 < argc) {
            out = argv[++i];
        } else {
            args.error = "Missing value for " + flag;
        }
    };

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            args.show_help = true;
        }
        else if (arg == "--analyze" || arg == "-a") {
            take_value(i, arg, args.input_path);
        }
        else if (arg == "--extract" || arg == "-e") {
            args.extract_mode = true;
            take_value(i, arg, args.input_path);
        }
        else if (arg == "--list" || arg == "-l") {
            args.list_mode = true;
            take_value(i, arg, args.input_path);
        }
        else if (arg == "--output" || arg == "-o") {
            take_value(i, arg, args.output_dir);
        }
        else if (arg == "--config" || arg == "-c") {
            take_value(i, arg, args.config_path);
        }
        else if (arg == "--tree" || arg == "-t") {
            args.show_tree = true;
        }
        else if (arg == "--debug" || arg == "-d" || arg == "--verbose" || arg == "-v") {
            args.debug_logging = true;
        }
        else if (!arg.empty() && arg[0] != '-' && args.input_path.empty()) {
            args.input_path = arg;
        }
        else {
            args.error = "Unknown option: " + arg;
        }
    }

    return args;
}

int main(int argc, char* argv[]) {
    CliArgs args = parse_args(argc, argv);

    if (args.show_help) {
        print_help();
        return 0;
    }
    if (!args.error.empty()) {
        std::cerr << "Error: " << args.error << "\n";
        print_help();
        return 1;
    }
    if (args.input_path.empty()) {
        std::cerr << "Error: No archive or directory specified\n";
        print_help();
        return 1;
    }

    dspack::UnpackerSettings settings;
    if (!args.config_path.empty()) {
        auto loaded = dspack::load_settings(args.config_path);
        if (loaded) {
            settings = loaded.value();
        } else {
            std::cerr << "Warning: " << loaded.error().full_message() << " (using defaults)\n";
        }
    }
    if (args.debug_logging) {
        settings.log_level = dspack::LogLevel::Debug;
    }
    dspack::apply_logging_settings(settings);

    dspack::BatchOptions options;
    options.show_tree = args.show_tree;
    options.list_files = args.list_mode;
    if (args.extract_mode) {
        std::filesystem::path output = args.output_dir.empty() ? settings.output_dir
                                                               : std::filesystem::path(args.output_dir);
        if (output.empty()) {
            std::cerr << "Error: No output directory specified (use --output)\n";
            return 1;
        }
        options.output_root = output;
    }

    dspack::BatchResult result = dspack::run_batch(args.input_path, options, settings);

    for (const auto& error : result.errors) {
        std::cerr << "  " << error << "\n";
    }

    if (result.opened == 0 && result.failed > 0) {
        return 1;
    }
    if (!result.success()) {
        return 2;
    }
    return 0;
}
