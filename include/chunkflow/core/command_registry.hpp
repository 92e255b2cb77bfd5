#pragma once

#include "command_handler.hpp"
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <unordered_map>
#include <vector>

namespace chunkflow::core {

// Maps the first positional argument (or one of its aliases) to a handler.
// Help lists commands in registration order.
class CommandRegistry {
public:
    // Registers the built-in send and info commands.
    CommandRegistry();
    
    // Re-registering a name replaces its handler and aliases.
    void register_command(const std::string& name,
                          std::unique_ptr<CommandHandler> handler,
                          std::vector<std::string> aliases = {});
    
    // args[0] names the command; the handler sees the full list.
    CommandResult execute_command(const std::vector<std::string>& args);
    
    bool has_command(const std::string& command) const;
    std::optional<std::string> resolve(const std::string& command) const;
    const std::vector<std::string>& command_names() const { return order_; }
    
    void write_help(std::ostream& out) const;
    void print_help() const;

private:
    struct Entry {
        std::unique_ptr<CommandHandler> handler;
        std::vector<std::string> aliases;
    };
    
    std::unordered_map<std::string, Entry> commands_;
    std::unordered_map<std::string, std::string> aliases_;
    std::vector<std::string> order_;
};

} // namespace chunkflow::core
