#include "chunkvault/core/command_registry.hpp"
#include <iostream>
#include <iomanip>

namespace chunkvault::core {

CommandRegistry::CommandRegistry(std::shared_ptr<ServiceContext> context) {
    register_command("ingest", std::make_unique<IngestCommandHandler>(context));
    register_command("status", std::make_unique<StatusCommandHandler>(context));
    register_command("sessions", std::make_unique<SessionsCommandHandler>(context));
    register_command("cancel", std::make_unique<CancelCommandHandler>(context));
    register_command("sweep", std::make_unique<SweepCommandHandler>(context));
    register_command("reconcile", std::make_unique<ReconcileCommandHandler>(context));
    register_command("records", std::make_unique<RecordsCommandHandler>(context));
}

void CommandRegistry::register_command(const std::string& name, std::unique_ptr<CommandHandler> handler) {
    handlers_[name] = std::move(handler);
}

CommandResult CommandRegistry::execute_command(const std::string& command, const std::vector<std::string>& args) {
    auto it = handlers_.find(command);
    if (it == handlers_.end()) {
        return CommandResult::error("Unknown command: " + command);
    }
    
    return it->second->execute(args);
}

bool CommandRegistry::has_command(const std::string& command) const {
    return handlers_.find(command) != handlers_.end();
}

void CommandRegistry::print_help() const {
    std::cout << "\nCommands:\n";
    
    for (const auto& [name, handler] : handlers_) {
        std::cout << "  " << std::left << std::setw(15) << name 
                  << handler->get_description() << "\n";
        std::cout << "  " << std::left << std::setw(15) << " " 
                  << "Usage: " << handler->get_usage() << "\n\n";
    }
}

}