#pragma once

#include <memory>
#include <string>
#include <vector>
#include "../storage/storage_config.hpp"

namespace chunkvault::upload {
class UploadService;
}

namespace chunkvault::core {

struct CommandResult {
    bool success = true;
    std::string message;
    int exit_code = 0;
    
    static CommandResult ok(const std::string& msg = "") {
        return CommandResult{true, msg, 0};
    }
    
    static CommandResult error(const std::string& msg, int code = 1) {
        return CommandResult{false, msg, code};
    }
};

// Shared by every command of one invocation. The service is opened on
// first use so that commands like --help never touch the data directory.
class ServiceContext {
public:
    explicit ServiceContext(const storage::StorageConfig& config);
    ~ServiceContext();
    
    upload::UploadService& service();
    const storage::StorageConfig& config() const { return config_; }

private:
    storage::StorageConfig config_;
    std::unique_ptr<upload::UploadService> service_;
};

class CommandHandler {
public:
    explicit CommandHandler(std::shared_ptr<ServiceContext> context) : context_(std::move(context)) {}
    virtual ~CommandHandler() = default;
    
    // args[0] is the command name.
    virtual CommandResult execute(const std::vector<std::string>& args) = 0;
    virtual std::string get_description() const = 0;
    virtual std::string get_usage() const = 0;

protected:
    std::shared_ptr<ServiceContext> context_;
};

class IngestCommandHandler : public CommandHandler {
public:
    static constexpr size_t DEFAULT_CHUNK_SIZE = 1024 * 1024;
    
    using CommandHandler::CommandHandler;
    
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Upload a local file in chunks and commit it"; }
    std::string get_usage() const override {
        return "chunkvault ingest <file> <module> <owner> [chunk_size] [key=value...]";
    }
};

class StatusCommandHandler : public CommandHandler {
public:
    using CommandHandler::CommandHandler;
    
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Show progress of one upload"; }
    std::string get_usage() const override { return "chunkvault status <file_id>"; }
};

class SessionsCommandHandler : public CommandHandler {
public:
    using CommandHandler::CommandHandler;
    
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "List upload sessions"; }
    std::string get_usage() const override { return "chunkvault sessions"; }
};

class CancelCommandHandler : public CommandHandler {
public:
    using CommandHandler::CommandHandler;
    
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Discard an upload and its temporary files"; }
    std::string get_usage() const override { return "chunkvault cancel <file_id>"; }
};

class SweepCommandHandler : public CommandHandler {
public:
    using CommandHandler::CommandHandler;
    
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Remove expired uploads now"; }
    std::string get_usage() const override { return "chunkvault sweep"; }
};

class ReconcileCommandHandler : public CommandHandler {
public:
    using CommandHandler::CommandHandler;
    
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Finish records left pending by a failed finalize"; }
    std::string get_usage() const override { return "chunkvault reconcile [record_id]"; }
};

class RecordsCommandHandler : public CommandHandler {
public:
    using CommandHandler::CommandHandler;
    
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "List committed records"; }
    std::string get_usage() const override { return "chunkvault records [module]"; }
};

}
