#include <evistore/cli/command.h>
#include <evistore/cli/evistore_cli.h>
#include <evistore/search/evidence_fusion.h>
#include <evistore/workflow/pipeline.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <iostream>

namespace evistore::cli {

/**
 * Runs the analysis pipeline without a model client: the output is the prompt
 * the selected agent would send, grounded in the gathered evidence.
 */
class AskCommand : public ICommand {
public:
    std::string getName() const override { return "ask"; }

    std::string getDescription() const override {
        return "Route a question, gather evidence and show the analysis prompt (dry run)";
    }

    void registerCommand(CLI::App& app, EvistoreCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("ask", getDescription());
        cmd->add_option("-q,--question", question_, "Question about an audience or product")
            ->required();
        cmd->add_option("--csv", csvPath_, "CSV file for keyword matches");
        cmd->add_flag("--json", jsonOutput_, "Output in JSON format");

        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        const auto& cfg = cli_->getConfig();

        std::shared_ptr<search::IKeywordStore> keywords;
        if (auto loaded = cli_->loadKeywordStore(csvPath_)) {
            keywords = loaded.value();
        } else {
            spdlog::warn("Keyword store unavailable: {}", loaded.error().message);
        }

        search::FusionConfig fc;
        fc.vectorLimit = cfg.vectorLimit;
        fc.maxEvidence = cfg.maxEvidence;
        fc.parallelSources = cfg.parallelSources;
        auto fusion =
            std::make_shared<search::EvidenceFusion>(cli_->getRetrievalEngine(), keywords, fc);

        auto registry =
            std::make_shared<workflow::AgentRegistry>(workflow::makeDefaultRegistry(nullptr));
        auto pipeline = workflow::makeAnalysisPipeline(fusion, registry, nullptr);
        auto state = pipeline.run(question_);

        const char* category = state.category ? workflow::toString(*state.category) : "";
        if (jsonOutput_) {
            nlohmann::json out;
            out["question"] = state.question;
            out["audience"] =
                state.audience ? nlohmann::json(*state.audience) : nlohmann::json(nullptr);
            out["category"] = category;
            out["evidence_count"] = state.evidence.size();
            out["output"] = state.formattedOutput;
            std::cout << out.dump(2) << std::endl;
            return {};
        }

        std::cout << "Audience: " << state.audience.value_or("(none)") << "\n"
                  << "Category: " << category << "\n"
                  << "Evidence: " << state.evidence.size() << " items\n\n"
                  << state.formattedOutput << "\n";
        return {};
    }

private:
    EvistoreCLI* cli_ = nullptr;
    std::string question_;
    std::string csvPath_;
    bool jsonOutput_ = false;
};

// Factory function
std::unique_ptr<ICommand> createAskCommand() {
    return std::make_unique<AskCommand>();
}

} // namespace evistore::cli
