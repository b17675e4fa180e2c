#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <CLI/CLI.hpp>
#include <spdlog/common.h>
#include <evistore/cli/command.h>
#include <evistore/config/evistore_config.h>
#include <evistore/search/csv_keyword_store.h>
#include <evistore/search/retrieval_engine.h>
#include <evistore/vector/embedder.h>
#include <evistore/vector/index_store.h>

namespace evistore::cli {

/**
 * Main CLI application class
 */
class EvistoreCLI {
public:
    EvistoreCLI();
    ~EvistoreCLI();

    /**
     * Run the CLI with given arguments; returns the process exit code
     */
    int run(int argc, char* argv[]);

    void registerCommand(std::unique_ptr<ICommand> command);

    /**
     * Called from a subcommand callback; the command runs once parsing and
     * configuration are complete.
     */
    void setPendingCommand(ICommand* cmd) { pendingCommand_ = cmd; }

    const config::EvistoreConfig& getConfig() const { return config_; }

    /// --store if given, else the configured store path
    std::filesystem::path getStorePath() const;

    std::shared_ptr<vector::IEmbedder> getEmbedder();

    /**
     * Open the store lazily on first access. Only writers take the store lock;
     * query commands open it read-only.
     */
    std::shared_ptr<vector::IndexStore> getIndexStore(bool writable = false);

    std::shared_ptr<search::RetrievalEngine> getRetrievalEngine();

    /// Load a CSV keyword store; an empty path means the configured csv_path
    Result<std::shared_ptr<search::CsvKeywordStore>>
    loadKeywordStore(const std::filesystem::path& csvPath = {});

    bool getVerbose() const { return verbose_; }

    /// "debug", "WARN", "err", ... -> spdlog level
    static std::optional<spdlog::level::level_enum> parseLogLevel(const std::string& s);

private:
    void applyLogLevel();

    std::unique_ptr<CLI::App> app_;
    std::vector<std::unique_ptr<ICommand>> commands_;
    ICommand* pendingCommand_ = nullptr;

    config::EvistoreConfig config_;
    std::string configPathOpt_;
    std::string storePathOpt_;
    std::string logLevelOpt_;
    bool verbose_ = false;

    std::shared_ptr<vector::IEmbedder> embedder_;
    std::shared_ptr<vector::IndexStore> indexStore_;
    bool indexStoreWritable_ = false;
    std::shared_ptr<search::RetrievalEngine> retrievalEngine_;
};

} // namespace evistore::cli
