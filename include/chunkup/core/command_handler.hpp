#pragma once

#include <string>
#include <vector>

namespace chunkup::core {

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

// Handlers read their settings from Config; args[0] is the command name.
class CommandHandler {
public:
    virtual ~CommandHandler() = default;
    virtual CommandResult execute(const std::vector<std::string>& args) = 0;
    virtual std::string get_description() const = 0;
    virtual std::string get_usage() const = 0;
};

class ServeCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Run the upload server"; }
    std::string get_usage() const override { return "chunkup serve [--host addr] [--port n]"; }
};

class UploadCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Upload a file in chunks"; }
    std::string get_usage() const override {
        return "chunkup upload <file> [--type mime] [--mode fast|balanced|precision]";
    }
};

class ResumeCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Resume a paused or interrupted upload"; }
    std::string get_usage() const override { return "chunkup resume <upload_id> <file>"; }
};

class ListCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "List resumable uploads"; }
    std::string get_usage() const override { return "chunkup list"; }
};

class CancelCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Discard a stored upload"; }
    std::string get_usage() const override { return "chunkup cancel <upload_id>"; }
};

class PurgeCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Delete expired upload sessions"; }
    std::string get_usage() const override { return "chunkup purge"; }
};

} // namespace chunkup::core
