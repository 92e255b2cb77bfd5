#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace chunkflow::core {

enum class OptionKind {
    Flag,
    Text,
    Number
};

class CommandLineParser {
public:
    explicit CommandLineParser(const std::string& program_name);

    void add_option(char short_name, const std::string& long_name,
                    const std::string& description, OptionKind kind = OptionKind::Flag,
                    const std::string& default_value = "");

    // Number options are checked here so a bad --rate fails before any work starts.
    bool parse(int argc, char* argv[]);

    bool has_option(const std::string& name) const;
    std::string get_option(const std::string& name, const std::string& default_value = "") const;
    std::optional<std::uint64_t> get_uint64_option(const std::string& name) const;

    const std::vector<std::string>& get_positional_args() const { return positional_args_; }
    const std::string& get_error() const { return error_; }

    void print_help() const;
    void print_version() const;

private:
    struct Option {
        char short_name;
        std::string description;
        OptionKind kind;
        std::string default_value;
    };

    std::string program_name_;
    std::map<std::string, Option> options_;
    std::map<char, std::string> short_to_long_;
    std::map<std::string, std::string> parsed_options_;
    std::vector<std::string> positional_args_;
    std::string error_;

    bool assign(const std::string& long_name, const std::string& value);
    bool parse_long(const std::string& arg, int& i, int argc, char* argv[]);
    bool parse_short_group(const std::string& arg, int& i, int argc, char* argv[]);
    std::string resolve(const std::string& name) const;
};

} // namespace chunkflow::core
