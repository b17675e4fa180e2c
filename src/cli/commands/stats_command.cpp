#include <evistore/cli/command.h>
#include <evistore/cli/evistore_cli.h>
#include <evistore/crypto/hasher.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <iostream>
#include <string>

namespace evistore::cli {

namespace {

uint64_t fileSizeOrZero(const std::filesystem::path& p) {
    std::error_code ec;
    auto size = std::filesystem::file_size(p, ec);
    return ec ? 0 : static_cast<uint64_t>(size);
}

// Empty when there is no index file yet
std::string indexDigest(const std::filesystem::path& p) {
    std::error_code ec;
    if (!std::filesystem::exists(p, ec)) {
        return {};
    }
    auto hasher = crypto::createSHA256Hasher();
    auto digest = hasher->hashFile(p);
    if (!digest) {
        spdlog::warn("Cannot hash {}: {}", p.string(), digest.error().message);
        return {};
    }
    return digest.value();
}

} // namespace

class StatsCommand : public ICommand {
public:
    std::string getName() const override { return "stats"; }

    std::string getDescription() const override { return "Show vector store statistics"; }

    void registerCommand(CLI::App& app, EvistoreCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("stats", getDescription());
        cmd->add_flag("--json", jsonOutput_, "Output in JSON format");

        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        auto store = cli_->getIndexStore();
        const auto indexBytes = fileSizeOrZero(store->indexPath());
        const auto textsBytes = fileSizeOrZero(store->textsPath());
        const auto digest = indexDigest(store->indexPath());

        if (jsonOutput_) {
            nlohmann::json out;
            out["directory"] = store->directory().string();
            out["entries"] = store->size();
            out["dimension"] = store->dimension();
            out["index_sha256"] = digest;
            out["index_bytes"] = indexBytes;
            out["texts_bytes"] = textsBytes;
            std::cout << out.dump(2) << std::endl;
            return {};
        }

        std::cout << "Store:      " << store->directory().string() << "\n"
                  << "Entries:    " << store->size() << "\n"
                  << "Dimension:  " << store->dimension() << "\n"
                  << "index.bin:  " << indexBytes << " bytes\n"
                  << "texts.dat:  " << textsBytes << " bytes\n"
                  << "SHA-256:    " << (digest.empty() ? "-" : digest) << "\n";
        return {};
    }

private:
    EvistoreCLI* cli_ = nullptr;
    bool jsonOutput_ = false;
};

// Factory function
std::unique_ptr<ICommand> createStatsCommand() {
    return std::make_unique<StatsCommand>();
}

} // namespace evistore::cli
