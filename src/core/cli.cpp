#include "chunkvault/core/cli.hpp"
#include "chunkvault/core/errors.hpp"
#include "chunkvault/core/utils.hpp"
#include <cstddef>
#include <iomanip>

namespace chunkvault::core {

namespace {

enum class GlobalOption { Config, DataDir, Set, Verbose, Help, Version };

struct OptionSpec {
    const char* short_name;
    const char* long_name;
    GlobalOption id;
    bool takes_value;
    const char* description;
};

constexpr OptionSpec kOptions[] = {
    {"-c", "--config", GlobalOption::Config, true, "Configuration file (default: chunkvault.conf)"},
    {"-d", "--data-dir", GlobalOption::DataDir, true, "Storage base directory, overrides storage.base_dir"},
    {"-s", "--set", GlobalOption::Set, true, "Override one setting, e.g. -s upload.max_chunk_size=1048576"},
    {"", "--verbose", GlobalOption::Verbose, false, "Log at debug level"},
    {"-h", "--help", GlobalOption::Help, false, "Show this help message"},
    {"-V", "--version", GlobalOption::Version, false, "Show version information"},
};

const OptionSpec* find_option(const std::string& name) {
    for (const auto& spec : kOptions) {
        if (name == spec.long_name || (spec.short_name[0] != '\0' && name == spec.short_name)) {
            return &spec;
        }
    }
    return nullptr;
}

std::pair<std::string, std::string> split_assignment(const std::string& text) {
    auto eq_pos = text.find('=');
    if (eq_pos == std::string::npos) {
        throw ValidationError("Expected key=value for --set, got '" + text + "'");
    }

    auto key = utils::StringUtils::trim(text.substr(0, eq_pos));
    if (key.empty()) {
        throw ValidationError("Empty key in --set " + text);
    }
    return {key, utils::StringUtils::trim(text.substr(eq_pos + 1))};
}

}

Invocation CommandLine::parse(const std::vector<std::string>& argv) {
    Invocation result;

    size_t i = 0;
    for (; i < argv.size(); ++i) {
        const auto& arg = argv[i];
        if (arg.size() < 2 || arg[0] != '-') {
            break;
        }

        std::string name = arg;
        std::optional<std::string> inline_value;
        if (arg.starts_with("--")) {
            auto eq_pos = arg.find('=');
            if (eq_pos != std::string::npos) {
                name = arg.substr(0, eq_pos);
                inline_value = arg.substr(eq_pos + 1);
            }
        }

        const auto* spec = find_option(name);
        if (spec == nullptr) {
            throw ValidationError("Unknown option: " + name);
        }

        std::string value;
        if (spec->takes_value) {
            if (inline_value) {
                value = *inline_value;
            } else if (i + 1 < argv.size()) {
                value = argv[++i];
            } else {
                throw ValidationError("Option " + name + " requires a value");
            }
        } else if (inline_value) {
            throw ValidationError("Option " + name + " does not take a value");
        }

        switch (spec->id) {
        case GlobalOption::Config:  result.config_path = value; break;
        case GlobalOption::DataDir: result.data_dir = value; break;
        case GlobalOption::Set:     result.overrides.push_back(split_assignment(value)); break;
        case GlobalOption::Verbose: result.verbose = true; break;
        case GlobalOption::Help:    result.show_help = true; break;
        case GlobalOption::Version: result.show_version = true; break;
        }
    }

    if (i < argv.size()) {
        result.command = argv[i];
        result.args.assign(argv.begin() + static_cast<std::ptrdiff_t>(i), argv.end());
    }

    return result;
}

Invocation CommandLine::parse(int argc, char* argv[]) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return parse(args);
}

void CommandLine::print_usage(std::ostream& out, const std::string& program_name) {
    out << "Usage: " << program_name << " [options] <command> [args...]\n\n";
    out << "Options:\n";

    for (const auto& spec : kOptions) {
        std::string flags = spec.short_name[0] != '\0'
            ? std::string(spec.short_name) + ", " + spec.long_name
            : std::string("    ") + spec.long_name;
        if (spec.takes_value) {
            flags += " <value>";
        }
        out << "  " << std::left << std::setw(26) << flags << spec.description << "\n";
    }
}

void CommandLine::print_version(std::ostream& out) {
    out << "chunkvault version 1.0.0\n";
    out << "Chunked ingestion and atomic commit for large files\n";
}

}
