#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <sp/cli_args.h>
#include <sp/errors.h>
#include <sp/json.h>
#include <sp/schema.h>
#include <sp/sysctl.h>
#include <sp/validate.h>

namespace {

std::optional<std::string> read_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) return std::nullopt;
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

std::string read_stdin() {
    std::ostringstream ss;
    ss << std::cin.rdbuf();
    return ss.str();
}

}  // namespace

int main(int argc, char** argv) {
    std::optional<sp::CliArgs> parsed;
    try {
        parsed.emplace(argc, const_cast<const char**>(argv));
    } catch (const std::invalid_argument& e) {
        std::cerr << "error: " << e.what() << "\n\n" << sp::CliArgs::usage();
        return 2;
    }
    const sp::CliArgs& args = *parsed;

    if (args.getAction() == sp::CliArgs::Action::HELP) {
        std::cout << sp::CliArgs::usage();
        return 0;
    }

    std::optional<sp::Schema> schema;
    if (args.getAction() == sp::CliArgs::Action::VALIDATE) {
        auto schema_text = read_file(args.getSchemaPath());
        if (!schema_text) {
            std::cerr << "error: cannot open schema: " << args.getSchemaPath() << "\n";
            return 2;
        }
        try {
            schema = sp::parse_schema(*schema_text);
        } catch (const sp::SchemaSyntaxFault& e) {
            std::cerr << args.getSchemaPath() << ": " << e.what() << "\n";
            return 1;
        }
        if (args.verbose())
            std::cerr << "sysctl-parser: loaded " << schema->size() << " rule(s) from " << args.getSchemaPath()
                      << "\n";
    }

    std::string source = args.readsStdin() ? std::string("<stdin>") : args.getConfigPath();
    std::string content;
    if (args.readsStdin()) {
        content = read_stdin();
    } else {
        auto text = read_file(args.getConfigPath());
        if (!text) {
            std::cerr << "error: cannot open file: " << args.getConfigPath() << "\n";
            return 2;
        }
        content = std::move(*text);
    }
    if (args.verbose()) std::cerr << "sysctl-parser: read " << content.size() << " byte(s) from " << source << "\n";

    sp::Document doc;
    try {
        doc = sp::parse_sysctl(content, args.parseOptions());
    } catch (const sp::SyntaxFault& e) {
        std::cerr << source << ": " << e.what() << "\n";
        return 1;
    } catch (const sp::DuplicateKeyFault& e) {
        std::cerr << source << ": " << e.what() << "\n";
        return 1;
    }
    if (args.verbose()) std::cerr << "sysctl-parser: parsed " << doc.size() << " entry(ies)\n";

    if (schema) {
        auto result = sp::validate(doc, *schema, args.validateOptions());
        if (args.verbose())
            std::cerr << "sysctl-parser: validation found " << result.violation_count() << " violation(s)\n";
        if (!result.is_valid()) {
            for (auto const& v : result.violations) {
                std::cerr << source << ": " << v.message << "\n";
            }
            std::cerr << result.violation_count() << " violation(s)\n";
            return 1;
        }
    }

    std::cout << sp::dump_json(doc, args.getLayout()) << std::endl;
    return 0;
}
