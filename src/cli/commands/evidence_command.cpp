#include <evistore/cli/command.h>
#include <evistore/cli/evistore_cli.h>
#include <evistore/search/evidence_fusion.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <iostream>

namespace evistore::cli {

class EvidenceCommand : public ICommand {
public:
    std::string getName() const override { return "evidence"; }

    std::string getDescription() const override {
        return "Gather deduplicated vector and keyword evidence for an audience";
    }

    void registerCommand(CLI::App& app, EvistoreCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("evidence", getDescription());
        cmd->add_option("-q,--audience", audience_, "Audience or product")->required();
        cmd->add_option("--csv", csvPath_, "CSV file for keyword matches");
        cmd->add_option("--vector-limit", vectorLimit_, "Nearest neighbors requested")
            ->check(CLI::PositiveNumber);
        cmd->add_option("--max", maxEvidence_, "Maximum evidence items")
            ->check(CLI::PositiveNumber);
        cmd->add_flag("--json", jsonOutput_, "Output in JSON format");

        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        const auto& cfg = cli_->getConfig();

        std::shared_ptr<search::IKeywordStore> keywords;
        if (auto loaded = cli_->loadKeywordStore(csvPath_)) {
            keywords = loaded.value();
        } else {
            // Keyword source is optional; continue with vector evidence only
            spdlog::warn("Keyword store unavailable: {}", loaded.error().message);
        }

        search::FusionConfig fc;
        fc.vectorLimit = vectorLimit_ > 0 ? vectorLimit_ : cfg.vectorLimit;
        fc.maxEvidence = maxEvidence_ > 0 ? maxEvidence_ : cfg.maxEvidence;
        fc.parallelSources = cfg.parallelSources;

        search::EvidenceFusion fusion(cli_->getRetrievalEngine(), keywords, fc);
        auto evidence = fusion.gather(audience_);

        if (jsonOutput_) {
            nlohmann::json out;
            out["audience"] = audience_;
            out["count"] = evidence.size();
            out["evidence"] = evidence;
            std::cout << out.dump(2) << std::endl;
            return {};
        }

        std::cout << evidence.size() << " evidence items for '" << audience_ << "'\n";
        for (size_t i = 0; i < evidence.size(); ++i) {
            std::cout << (i + 1) << ". " << evidence[i] << "\n";
        }
        return {};
    }

private:
    EvistoreCLI* cli_ = nullptr;
    std::string audience_;
    std::string csvPath_;
    size_t vectorLimit_ = 0; // 0: configured value
    size_t maxEvidence_ = 0;
    bool jsonOutput_ = false;
};

// Factory function
std::unique_ptr<ICommand> createEvidenceCommand() {
    return std::make_unique<EvidenceCommand>();
}

} // namespace evistore::cli
