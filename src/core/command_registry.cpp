#include "chunkflow/core/command_registry.hpp"
#include "chunkflow/core/logger.hpp"
#include <algorithm>
#include <iomanip>
#include <iostream>

namespace chunkflow::core {

namespace {

constexpr int USAGE_EXIT_CODE = 2;

std::string join(const std::vector<std::string>& parts, const char* separator) {
    std::string joined;
    for (const auto& part : parts) {
        if (!joined.empty()) {
            joined += separator;
        }
        joined += part;
    }
    return joined;
}

}

CommandRegistry::CommandRegistry() {
    register_command("send", std::make_unique<SendCommandHandler>(), {"stream"});
    register_command("info", std::make_unique<InfoCommandHandler>(), {"inspect"});
}

void CommandRegistry::register_command(const std::string& name,
                                       std::unique_ptr<CommandHandler> handler,
                                       std::vector<std::string> aliases) {
    auto existing = commands_.find(name);
    if (existing != commands_.end()) {
        for (const auto& alias : existing->second.aliases) {
            aliases_.erase(alias);
        }
    } else {
        order_.push_back(name);
    }
    
    for (const auto& alias : aliases) {
        auto owner = aliases_.find(alias);
        if (commands_.count(alias) > 0 || (owner != aliases_.end() && owner->second != name)) {
            LOG_WARN("Alias {} for {} is already taken, ignoring", alias, name);
            continue;
        }
        aliases_[alias] = name;
    }
    
    std::erase_if(aliases, [&](const std::string& alias) {
        auto it = aliases_.find(alias);
        return it == aliases_.end() || it->second != name;
    });
    commands_[name] = Entry{std::move(handler), std::move(aliases)};
}

std::optional<std::string> CommandRegistry::resolve(const std::string& command) const {
    if (commands_.count(command) > 0) {
        return command;
    }
    auto alias = aliases_.find(command);
    if (alias != aliases_.end()) {
        return alias->second;
    }
    return std::nullopt;
}

CommandResult CommandRegistry::execute_command(const std::vector<std::string>& args) {
    if (args.empty()) {
        return CommandResult::error("No command given", USAGE_EXIT_CODE);
    }
    
    auto name = resolve(args[0]);
    if (!name) {
        return CommandResult::error("Unknown command: " + args[0], USAGE_EXIT_CODE);
    }
    
    LOG_DEBUG("Running command {}", *name);
    return commands_.at(*name).handler->execute(args);
}

bool CommandRegistry::has_command(const std::string& command) const {
    return resolve(command).has_value();
}

void CommandRegistry::write_help(std::ostream& out) const {
    size_t width = 0;
    for (const auto& name : order_) {
        width = std::max(width, name.size());
    }
    width += 2;
    
    for (const auto& name : order_) {
        const auto& entry = commands_.at(name);
        out << "  " << std::left << std::setw(static_cast<int>(width)) << name
            << entry.handler->get_description() << "\n";
        out << "  " << std::setw(static_cast<int>(width)) << ""
            << "Usage: " << entry.handler->get_usage() << "\n";
        if (!entry.aliases.empty()) {
            out << "  " << std::setw(static_cast<int>(width)) << ""
                << "Aliases: " << join(entry.aliases, ", ") << "\n";
        }
    }
}

void CommandRegistry::print_help() const {
    write_help(std::cout);
}

} // namespace chunkflow::core
