#include <evistore/cli/command.h>
#include <evistore/cli/evistore_cli.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <iostream>

namespace evistore::cli {

class SetupCommand : public ICommand {
public:
    std::string getName() const override { return "setup"; }

    std::string getDescription() const override {
        return "Render every CSV row and index it into the vector store";
    }

    void registerCommand(CLI::App& app, EvistoreCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("setup", getDescription());
        cmd->add_option("--csv", csvPath_, "CSV file (default: [keyword] csv_path)");
        cmd->add_option("--batch-size", batchSize_, "Texts embedded per batch")
            ->check(CLI::PositiveNumber);
        cmd->add_flag("--json", jsonOutput_, "Output in JSON format");

        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        auto keywords = cli_->loadKeywordStore(csvPath_);
        if (!keywords) {
            return keywords.error();
        }
        const auto& csv = *keywords.value();
        if (csv.empty()) {
            return Error{ErrorCode::InvalidArgument, "CSV data is empty"};
        }

        std::vector<std::string> texts;
        texts.reserve(csv.rowCount());
        for (auto& text : csv.renderAll()) {
            if (!text.empty()) {
                texts.push_back(std::move(text));
            }
        }
        spdlog::info("Prepared {} text entries for embedding", texts.size());

        const auto& cfg = cli_->getConfig();
        search::RetrievalConfig rc;
        rc.batchSize = batchSize_ > 0 ? batchSize_ : cfg.batchSize;
        rc.embedTimeout = cfg.embedTimeout;
        auto indexStore = cli_->getIndexStore(true);
        if (!indexStore->isWritable()) {
            return Error{ErrorCode::InvalidState,
                         fmt::format("vector store {} is in use by another writer",
                                     indexStore->directory().string())};
        }
        search::RetrievalEngine engine(cli_->getEmbedder(), indexStore, rc);

        auto report = engine.indexTexts(texts, [](size_t batch, size_t count) {
            spdlog::info("Processing batch {}/{}", batch + 1, count);
        });

        auto& store = engine.store();
        if (jsonOutput_) {
            nlohmann::json out;
            out["store"] = store.directory().string();
            out["batches"] = report.batches;
            out["failed_batches"] = report.failedBatches;
            out["indexed"] = report.indexed;
            out["failed"] = report.failed;
            out["total_entries"] = store.size();
            std::cout << out.dump(2) << std::endl;
        } else {
            std::cout << "Indexed " << report.indexed << " of " << texts.size() << " rows in "
                      << report.batches << " batches";
            if (report.failedBatches > 0) {
                std::cout << " (" << report.failedBatches << " failed)";
            }
            std::cout << "\nVector store: " << store.directory().string() << " ("
                      << store.size() << " entries)\n";
        }

        if (!report.errors.empty()) {
            return report.errors.front();
        }
        return {};
    }

private:
    EvistoreCLI* cli_ = nullptr;
    std::string csvPath_;
    size_t batchSize_ = 0;
    bool jsonOutput_ = false;
};

// Factory function
std::unique_ptr<ICommand> createSetupCommand() {
    return std::make_unique<SetupCommand>();
}

} // namespace evistore::cli
