#include <sp/cli_args.h>
#include <sp/cli_utils.h>
#include <stdexcept>
#include <string>
#include <vector>

namespace sp {

CliArgs::CliArgs(int argc, const char* argv[]) {
    // Valid options for error suggestions
    static const std::vector<std::string> valid_options = {
        "--help", "-h",
        "--schema", "-s",
        "--strict",
        "--require",
        "--bool-style",
        "--allow-duplicates",
        "--format", "-f",
        "--verbose", "-v"
    };

    auto value_of = [&](int& i, const std::string& flag) -> std::string {
        if (i + 1 >= argc) {
            throw std::invalid_argument(flag + " requires a value argument");
        }
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            action_ = Action::HELP;
            return;
        }
        else if (arg == "--schema" || arg == "-s") {
            schemaPath_ = value_of(i, "--schema");
            action_ = Action::VALIDATE;
        }
        else if (arg == "--strict") {
            validateOptions_.strict = true;
        }
        else if (arg == "--require") {
            validateOptions_.require_exact = true;
        }
        else if (arg == "--bool-style") {
            std::string style = value_of(i, "--bool-style");
            if (style == "truefalse") {
                validateOptions_.boolean_style = BooleanStyle::TrueFalse;
            } else if (style == "01") {
                validateOptions_.boolean_style = BooleanStyle::ZeroOne;
            } else {
                throw std::invalid_argument("--bool-style expects 'truefalse' or '01', got '" + style + "'");
            }
        }
        else if (arg == "--allow-duplicates") {
            parseOptions_.duplicates = DuplicateKeyPolicy::LastWins;
        }
        else if (arg == "--format" || arg == "-f") {
            std::string fmt = value_of(i, "--format");
            if (fmt == "flat") {
                layout_ = JsonLayout::Flat;
            } else if (fmt == "nested") {
                layout_ = JsonLayout::Nested;
            } else if (fmt == "entries") {
                layout_ = JsonLayout::Entries;
            } else {
                throw std::invalid_argument("unknown format '" + fmt + "' (expected 'flat', 'nested' or 'entries')");
            }
        }
        else if (arg == "--verbose" || arg == "-v") {
            verbose_ = true;
        }
        else if (arg.size() > 1 && arg[0] == '-') {
            throw std::invalid_argument(cli_utils::unknown_argument_message(arg, valid_options));
        }
        else if (configPath_.empty()) {
            configPath_ = arg;
        }
        else {
            throw std::invalid_argument("unexpected extra argument: " + arg);
        }
    }
}

std::string CliArgs::usage() {
    return "sysctl-parser - Parse and validate sysctl configuration files\n"
           "\n"
           "USAGE:\n"
           "  sysctl-parser [OPTIONS] [CONFIG]\n"
           "  sysctl-parser --schema <schema> [OPTIONS] [CONFIG]\n"
           "\n"
           "Reads CONFIG (or standard input when CONFIG is absent or '-') and prints\n"
           "it as JSON. With --schema, the configuration is validated first and each\n"
           "violation is reported on standard error.\n"
           "\n"
           "OPTIONS:\n"
           "  -h, --help               Show this help message\n"
           "  -s, --schema <path>      Validate against a schema file\n"
           "      --strict             Report keys that no schema rule matches\n"
           "      --require            Report exact schema keys missing from the config\n"
           "      --bool-style <style> Accepted booleans: 'truefalse' (default) or '01'\n"
           "      --allow-duplicates   Let a repeated key override the earlier one\n"
           "  -f, --format <layout>    JSON layout: flat (default), nested or entries\n"
           "  -v, --verbose            Trace parsing and validation on standard error\n"
           "\n"
           "EXIT STATUS:\n"
           "  0 success, 1 parse error or validation violations, 2 usage or I/O error\n";
}

}  // namespace sp
