#include <evistore/cli/command_registry.h>
#include <evistore/cli/evistore_cli.h>
#include <evistore/config/config_helpers.h>

#include <spdlog/spdlog.h>

#include <cctype>
#include <cstdlib>
#include <iostream>

namespace evistore::cli {

namespace fs = std::filesystem;

EvistoreCLI::EvistoreCLI() {
    // Conservative default; finalized after parsing flags in run()
    spdlog::set_level(spdlog::level::warn);

    app_ = std::make_unique<CLI::App>("Evidence retrieval store", "evistore");
    app_->require_subcommand(1);

    app_->add_option("--config", configPathOpt_, "Config file (default: XDG config dir)");
    app_->add_option("--store", storePathOpt_, "Vector store directory");
    app_->add_option("--log-level", logLevelOpt_,
                     "trace, debug, info, warn, error, critical or off");
    app_->add_flag("-v,--verbose", verbose_, "Enable verbose output");

    CommandRegistry::registerAllCommands(this);
}

EvistoreCLI::~EvistoreCLI() = default;

void EvistoreCLI::registerCommand(std::unique_ptr<ICommand> command) {
    command->registerCommand(*app_, this);
    commands_.push_back(std::move(command));
}

std::optional<spdlog::level::level_enum> EvistoreCLI::parseLogLevel(const std::string& s) {
    std::string v;
    v.reserve(s.size());
    for (char c : s)
        v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    config::trim(v);
    if (v == "trace")
        return spdlog::level::trace;
    if (v == "debug")
        return spdlog::level::debug;
    if (v == "info")
        return spdlog::level::info;
    if (v == "warn" || v == "warning")
        return spdlog::level::warn;
    if (v == "error" || v == "err")
        return spdlog::level::err;
    if (v == "critical" || v == "crit")
        return spdlog::level::critical;
    if (v == "off" || v == "none" || v == "silent")
        return spdlog::level::off;
    return std::nullopt;
}

// Precedence: env EVISTORE_LOG_LEVEL > --log-level > --verbose > config [log] level > warn
void EvistoreCLI::applyLogLevel() {
    if (auto env = config::env_value("EVISTORE_LOG_LEVEL")) {
        if (auto lvl = parseLogLevel(*env)) {
            spdlog::set_level(*lvl);
            return;
        }
    }
    if (!logLevelOpt_.empty()) {
        if (auto lvl = parseLogLevel(logLevelOpt_)) {
            spdlog::set_level(*lvl);
            return;
        }
        spdlog::warn("Unknown log level '{}'", logLevelOpt_);
    }
    if (verbose_) {
        spdlog::set_level(spdlog::level::debug);
        return;
    }
    spdlog::set_level(parseLogLevel(config_.logLevel).value_or(spdlog::level::warn));
}

int EvistoreCLI::run(int argc, char* argv[]) {
    try {
        try {
            app_->parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            return app_->exit(e);
        }

        auto loaded = config::EvistoreConfig::load(config::get_config_path(configPathOpt_));
        if (!loaded) {
            std::cerr << "Error: " << loaded.error().message << "\n";
            return 1;
        }
        config_ = std::move(loaded).value();
        applyLogLevel();

        spdlog::debug("Config: {} store: {}", config_.configPath.string(),
                      getStorePath().string());

        if (!pendingCommand_) {
            return 0;
        }

        auto result = pendingCommand_->execute();
        if (!result) {
            spdlog::error("{} failed: {}", pendingCommand_->getName(), result.error().message);
            std::cerr << "Error: " << result.error().message << "\n";
            return 1;
        }
        return 0;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

fs::path EvistoreCLI::getStorePath() const {
    if (!storePathOpt_.empty()) {
        return config::expand_tilde(storePathOpt_);
    }
    return config_.storePath;
}

std::shared_ptr<vector::IndexStore> EvistoreCLI::getIndexStore(bool writable) {
    if (indexStore_ && writable && !indexStoreWritable_) {
        // Reopen so the writer lock is taken; dependents are rebuilt on next access
        retrievalEngine_.reset();
        indexStore_.reset();
    }
    if (!indexStore_) {
        vector::IndexStoreOptions options;
        options.readOnly = !writable;
        indexStore_ = vector::IndexStore::open(getStorePath(), options);
        indexStoreWritable_ = writable;
    }
    return indexStore_;
}

std::shared_ptr<vector::IEmbedder> EvistoreCLI::getEmbedder() {
    if (!embedder_) {
        // An existing store dictates the dimension
        size_t dimension = getIndexStore()->dimension();
        if (dimension == 0) {
            dimension = config_.embeddingDimension;
        } else if (dimension != config_.embeddingDimension) {
            spdlog::info("Using store dimension {} instead of configured {}", dimension,
                         config_.embeddingDimension);
        }
        embedder_ = std::make_shared<vector::HashingEmbedder>(dimension);
    }
    return embedder_;
}

std::shared_ptr<search::RetrievalEngine> EvistoreCLI::getRetrievalEngine() {
    if (!retrievalEngine_) {
        search::RetrievalConfig rc;
        rc.batchSize = config_.batchSize;
        rc.embedTimeout = config_.embedTimeout;
        retrievalEngine_ =
            std::make_shared<search::RetrievalEngine>(getEmbedder(), getIndexStore(), rc);
    }
    return retrievalEngine_;
}

Result<std::shared_ptr<search::CsvKeywordStore>>
EvistoreCLI::loadKeywordStore(const fs::path& csvPath) {
    auto store = std::make_shared<search::CsvKeywordStore>(config_.keywordMaxResults);
    auto loaded = store->load(csvPath.empty() ? config_.csvPath : csvPath);
    if (!loaded) {
        return loaded.error();
    }
    return store;
}

} // namespace evistore::cli
