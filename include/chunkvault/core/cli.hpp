#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace chunkvault::core {

// Parsed form of: chunkvault [global options] <command> [command args...]
struct Invocation {
    std::string config_path = "chunkvault.conf";
    std::optional<std::string> data_dir;
    bool verbose = false;
    bool show_help = false;
    bool show_version = false;

    // Ordered key=value pairs from --set; applied after the config file.
    std::vector<std::pair<std::string, std::string>> overrides;

    // Empty when no command was given. args[0] is the command name itself,
    // matching what CommandHandler::execute receives.
    std::string command;
    std::vector<std::string> args;
};

class CommandLine {
public:
    // Global options are only recognised before the command name; everything
    // from the command onwards is passed through untouched. Throws
    // ValidationError for unknown options, a missing value, or a --set
    // argument without '='.
    static Invocation parse(const std::vector<std::string>& argv);
    static Invocation parse(int argc, char* argv[]);

    static void print_usage(std::ostream& out, const std::string& program_name = "chunkvault");
    static void print_version(std::ostream& out);
};

}
