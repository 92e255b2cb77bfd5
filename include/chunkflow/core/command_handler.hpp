#pragma once

#include <string>
#include <vector>

namespace chunkflow::core {

struct CommandResult {
    bool success;
    std::string message;
    int exit_code;
    
    static CommandResult ok(const std::string& msg = "") {
        return {true, msg, 0};
    }
    
    static CommandResult error(const std::string& msg, int code = 1) {
        return {false, msg, code};
    }
};

class CommandHandler {
public:
    virtual ~CommandHandler() = default;
    virtual CommandResult execute(const std::vector<std::string>& args) = 0;
    virtual std::string get_description() const = 0;
    virtual std::string get_usage() const = 0;
};

// Streams a file through the scheduler, reader and rate limiter into a local
// sink, then checks the received bytes against the source checksum.
class SendCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Stream a file through the rate limiter"; }
    std::string get_usage() const override { return "chunkflow send <file> [<output>]"; }
};

class InfoCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Show chunk layout and checksum of a file"; }
    std::string get_usage() const override { return "chunkflow info <file>"; }
};

} // namespace chunkflow::core
