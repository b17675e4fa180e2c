#pragma once

#include <memory>
#include <string>
#include <CLI/CLI.hpp>
#include <evistore/core/types.h>

namespace evistore::cli {

class EvistoreCLI;

/**
 * Base interface for CLI commands
 */
class ICommand {
public:
    virtual ~ICommand() = default;

    /**
     * Get the command name (e.g., "setup", "search")
     */
    virtual std::string getName() const = 0;

    virtual std::string getDescription() const = 0;

    /**
     * Register this command with the CLI11 app. Parsing only records options;
     * execute() runs after global settings are resolved.
     */
    virtual void registerCommand(CLI::App& app, EvistoreCLI* cli) = 0;

    virtual Result<void> execute() = 0;
};

} // namespace evistore::cli
