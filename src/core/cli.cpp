#include "chunkflow/core/cli.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <iostream>
#include <stdexcept>

namespace chunkflow::core {

namespace {

bool is_unsigned_number(const std::string& value) {
    return !value.empty() &&
           std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c); });
}

} // anonymous namespace

CommandLineParser::CommandLineParser(const std::string& program_name)
    : program_name_(program_name) {
    add_option('h', "help", "Show this help message");
    add_option('v', "version", "Show version information");
    add_option('c', "config", "Configuration file path", OptionKind::Text, "~/.chunkflow.conf");
    add_option('\0', "verbose", "Enable debug logging");
    add_option('r', "rate", "Send rate limit in bytes per second", OptionKind::Number);
    add_option('p', "priority", "Transfer priority, 0 (highest) to 10 (lowest)", OptionKind::Number);
}

void CommandLineParser::add_option(char short_name, const std::string& long_name,
                                   const std::string& description, OptionKind kind,
                                   const std::string& default_value) {
    options_[long_name] = Option{short_name, description, kind, default_value};
    if (short_name != '\0') {
        short_to_long_[short_name] = long_name;
    }
}

bool CommandLineParser::parse(int argc, char* argv[]) {
    positional_args_.clear();
    parsed_options_.clear();
    error_.clear();

    bool options_done = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (options_done || arg == "-" || !arg.starts_with("-")) {
            positional_args_.push_back(arg);
        } else if (arg == "--") {
            options_done = true;
        } else if (arg.starts_with("--")) {
            if (!parse_long(arg, i, argc, argv)) return false;
        } else if (!parse_short_group(arg, i, argc, argv)) {
            return false;
        }
    }

    return true;
}

bool CommandLineParser::parse_long(const std::string& arg, int& i, int argc, char* argv[]) {
    auto eq_pos = arg.find('=');
    std::string name = arg.substr(2, eq_pos == std::string::npos ? std::string::npos : eq_pos - 2);

    auto it = options_.find(name);
    if (it == options_.end()) {
        error_ = "Unknown option: --" + name;
        return false;
    }

    if (it->second.kind == OptionKind::Flag) {
        if (eq_pos != std::string::npos) {
            error_ = "Option --" + name + " does not take a value";
            return false;
        }
        return assign(name, "true");
    }

    if (eq_pos != std::string::npos) {
        return assign(name, arg.substr(eq_pos + 1));
    }
    if (i + 1 >= argc) {
        error_ = "Option --" + name + " requires a value";
        return false;
    }
    return assign(name, argv[++i]);
}

// -vc file, -r500000 and -c file are all accepted.
bool CommandLineParser::parse_short_group(const std::string& arg, int& i, int argc, char* argv[]) {
    for (size_t j = 1; j < arg.length(); ++j) {
        auto long_it = short_to_long_.find(arg[j]);
        if (long_it == short_to_long_.end()) {
            error_ = std::string("Unknown option: -") + arg[j];
            return false;
        }

        const auto& name = long_it->second;
        if (options_.at(name).kind == OptionKind::Flag) {
            if (!assign(name, "true")) return false;
            continue;
        }

        if (j + 1 < arg.length()) {
            return assign(name, arg.substr(j + 1));
        }
        if (i + 1 >= argc) {
            error_ = std::string("Option -") + arg[j] + " requires a value";
            return false;
        }
        return assign(name, argv[++i]);
    }
    return true;
}

bool CommandLineParser::assign(const std::string& long_name, const std::string& value) {
    if (options_.at(long_name).kind == OptionKind::Number && !is_unsigned_number(value)) {
        error_ = "Option --" + long_name + " expects a non-negative integer, got '" + value + "'";
        return false;
    }
    parsed_options_[long_name] = value;
    return true;
}

bool CommandLineParser::has_option(const std::string& name) const {
    return parsed_options_.count(resolve(name)) > 0;
}

std::string CommandLineParser::get_option(const std::string& name, const std::string& default_value) const {
    auto key = resolve(name);
    if (auto it = parsed_options_.find(key); it != parsed_options_.end()) {
        return it->second;
    }
    if (auto opt = options_.find(key); opt != options_.end() && !opt->second.default_value.empty()) {
        return opt->second.default_value;
    }
    return default_value;
}

std::optional<std::uint64_t> CommandLineParser::get_uint64_option(const std::string& name) const {
    auto value = get_option(name);
    if (!is_unsigned_number(value)) {
        return std::nullopt;
    }
    try {
        return std::stoull(value);
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

void CommandLineParser::print_help() const {
    std::cout << "Usage: " << program_name_ << " [options] <command> [args...]\n\n";
    std::cout << "Options:\n";

    for (const auto& [name, option] : options_) {
        std::string label = option.short_name != '\0'
            ? std::string("-") + option.short_name + ", --" + name
            : "    --" + name;
        if (option.kind != OptionKind::Flag) {
            label += " <value>";
        }

        std::cout << "  " << std::left << std::setw(24) << label << option.description;
        if (!option.default_value.empty()) {
            std::cout << " (default: " << option.default_value << ")";
        }
        std::cout << "\n";
    }

    std::cout << "\nCommands:\n";
    std::cout << "  send <file> [output]   Stream a file through the rate limiter\n";
    std::cout << "  info <file>            Show chunk layout and checksum of a file\n";
}

void CommandLineParser::print_version() const {
    std::cout << program_name_ << " 1.0.0 (C++20)\n";
}

std::string CommandLineParser::resolve(const std::string& name) const {
    if (name.size() == 1) {
        if (auto it = short_to_long_.find(name[0]); it != short_to_long_.end()) {
            return it->second;
        }
    }
    return name;
}

} // namespace chunkflow::core
