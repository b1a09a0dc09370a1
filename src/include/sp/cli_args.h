#pragma once

#include <string>
#include <sp/document.h>
#include <sp/json.h>
#include <sp/validate.h>

namespace sp {

// Command-line arguments of the sysctl-parser tool. Throws
// std::invalid_argument for unknown flags, missing flag values and extra
// positional arguments.
class CliArgs {
public:
    enum class Action {
        HELP,     // Show help message
        PRINT,    // Parse and print the document as JSON (default)
        VALIDATE  // Parse, validate against --schema, then print
    };

    CliArgs(int argc, const char* argv[]);

    Action getAction() const { return action_; }
    // Empty or "-" means standard input.
    const std::string& getConfigPath() const { return configPath_; }
    bool readsStdin() const { return configPath_.empty() || configPath_ == "-"; }
    const std::string& getSchemaPath() const { return schemaPath_; }
    JsonLayout getLayout() const { return layout_; }
    const ParseOptions& parseOptions() const { return parseOptions_; }
    const ValidateOptions& validateOptions() const { return validateOptions_; }
    bool verbose() const { return verbose_; }

    static std::string usage();

private:
    Action action_ = Action::PRINT;
    std::string configPath_;
    std::string schemaPath_;
    JsonLayout layout_ = JsonLayout::Flat;
    ParseOptions parseOptions_;
    ValidateOptions validateOptions_;
    bool verbose_ = false;
};

}  // namespace sp
