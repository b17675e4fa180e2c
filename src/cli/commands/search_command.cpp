#include <evistore/cli/command.h>
#include <evistore/cli/evistore_cli.h>

#include <nlohmann/json.hpp>
#include <fmt/format.h>

#include <iostream>

namespace evistore::cli {

class SearchCommand : public ICommand {
public:
    std::string getName() const override { return "search"; }

    std::string getDescription() const override {
        return "Find the stored texts nearest to a query";
    }

    void registerCommand(CLI::App& app, EvistoreCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("search", getDescription());
        cmd->add_option("-q,--query", query_, "Query text")->required();
        cmd->add_option("-k,--limit", limit_, "Number of results")->default_val(10);
        cmd->add_flag("--json", jsonOutput_, "Output in JSON format");

        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        auto engine = cli_->getRetrievalEngine();
        auto result = engine->queryWithDistances(query_, limit_);
        if (!result) {
            return result.error();
        }
        const auto& neighbors = result.value();

        if (jsonOutput_) {
            nlohmann::json out;
            out["query"] = query_;
            out["results"] = nlohmann::json::array();
            for (const auto& n : neighbors) {
                out["results"].push_back(
                    {{"ordinal", n.ordinal}, {"distance", n.distance}, {"text", n.text}});
            }
            std::cout << out.dump(2) << std::endl;
            return {};
        }

        if (neighbors.empty()) {
            std::cout << "No results (store has " << engine->store().size() << " entries)\n";
            return {};
        }
        for (size_t i = 0; i < neighbors.size(); ++i) {
            std::cout << fmt::format("{:>3}. [{:.4f}] {}\n", i + 1, neighbors[i].distance,
                                     neighbors[i].text);
        }
        return {};
    }

private:
    EvistoreCLI* cli_ = nullptr;
    std::string query_;
    size_t limit_ = 10;
    bool jsonOutput_ = false;
};

// Factory function
std::unique_ptr<ICommand> createSearchCommand() {
    return std::make_unique<SearchCommand>();
}

} // namespace evistore::cli
