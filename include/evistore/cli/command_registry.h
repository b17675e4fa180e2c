#pragma once

#include <memory>
#include <evistore/cli/command.h>

namespace evistore::cli {

class EvistoreCLI;

/**
 * Registry of all available CLI commands
 */
class CommandRegistry {
public:
    static void registerAllCommands(EvistoreCLI* cli);

    /// Build the vector store from a CSV file
    static std::unique_ptr<ICommand> createSetupCommand();

    /// Nearest-neighbor lookup with distances
    static std::unique_ptr<ICommand> createSearchCommand();

    /// Fused vector + keyword evidence for an audience
    static std::unique_ptr<ICommand> createEvidenceCommand();

    /// Dry-run of the analysis pipeline
    static std::unique_ptr<ICommand> createAskCommand();

    static std::unique_ptr<ICommand> createStatsCommand();
};

} // namespace evistore::cli
