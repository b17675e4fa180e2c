#include <evistore/cli/command_registry.h>
#include <evistore/cli/evistore_cli.h>

namespace evistore::cli {

// Factory functions from command implementations (in this namespace)
std::unique_ptr<ICommand> createSetupCommand();
std::unique_ptr<ICommand> createSearchCommand();
std::unique_ptr<ICommand> createEvidenceCommand();
std::unique_ptr<ICommand> createAskCommand();
std::unique_ptr<ICommand> createStatsCommand();

void CommandRegistry::registerAllCommands(EvistoreCLI* cli) {
    cli->registerCommand(CommandRegistry::createSetupCommand());
    cli->registerCommand(CommandRegistry::createSearchCommand());
    cli->registerCommand(CommandRegistry::createEvidenceCommand());
    cli->registerCommand(CommandRegistry::createAskCommand());
    cli->registerCommand(CommandRegistry::createStatsCommand());
}

std::unique_ptr<ICommand> CommandRegistry::createSetupCommand() {
    return ::evistore::cli::createSetupCommand();
}

std::unique_ptr<ICommand> CommandRegistry::createSearchCommand() {
    return ::evistore::cli::createSearchCommand();
}

std::unique_ptr<ICommand> CommandRegistry::createEvidenceCommand() {
    return ::evistore::cli::createEvidenceCommand();
}

std::unique_ptr<ICommand> CommandRegistry::createAskCommand() {
    return ::evistore::cli::createAskCommand();
}

std::unique_ptr<ICommand> CommandRegistry::createStatsCommand() {
    return ::evistore::cli::createStatsCommand();
}

} // namespace evistore::cli
