// Catch2 tests for the evistore command line front end

#include <catch2/catch_test_macros.hpp>

#include <cstddef>
#include <filesystem>
#include <iostream>
#include <span>
#include <sstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "../../common/test_helpers_catch2.h"
#include <evistore/cli/evistore_cli.h>
#include <evistore/crypto/hasher.h>
#include <evistore/vector/index_store.h>

using namespace evistore;
using evistore::cli::EvistoreCLI;
using evistore::test::ScopedEnvVar;
using evistore::test::TempDir;
using evistore::test::read_file;
using evistore::test::write_file;

namespace fs = std::filesystem;

namespace {

int runCli(EvistoreCLI& cli, std::vector<std::string> args) {
    args.insert(args.begin(), "evistore");
    std::vector<char*> argv;
    for (auto& a : args) {
        argv.push_back(a.data());
    }
    return cli.run(static_cast<int>(argv.size()), argv.data());
}

int runCli(std::vector<std::string> args) {
    EvistoreCLI cli;
    return runCli(cli, std::move(args));
}

// Redirects std::cout for the lifetime of the object
class CaptureStdout {
public:
    CaptureStdout() : previous_(std::cout.rdbuf(buffer_.rdbuf())) {}
    ~CaptureStdout() { std::cout.rdbuf(previous_); }

    CaptureStdout(const CaptureStdout&) = delete;
    CaptureStdout& operator=(const CaptureStdout&) = delete;

    std::string str() const { return buffer_.str(); }

private:
    std::ostringstream buffer_;
    std::streambuf* previous_;
};

struct CliFixture {
    ScopedEnvVar storeEnv{"EVISTORE_STORE_PATH", std::nullopt};
    ScopedEnvVar csvEnv{"EVISTORE_CSV_PATH", std::nullopt};
    ScopedEnvVar levelEnv{"EVISTORE_LOG_LEVEL", std::string("off")};
    ScopedEnvVar configEnv{"EVISTORE_CONFIG", std::nullopt};

    TempDir tmp{"evistore_cli_test_"};
    fs::path storeDir = tmp / "db";
    fs::path csvPath = write_file(tmp / "reviews.csv",
                                  "reviewer,review,rating\n"
                                  "Alice,Light laptop for students,5\n"
                                  "Bob,Phone battery is weak,2\n"
                                  "Carol,Students love the keyboard,4\n");
    fs::path configPath = write_file(tmp / "config.toml",
                                     "[store]\npath = \"" + storeDir.string() +
                                         "\"\n[keyword]\ncsv_path = \"" + csvPath.string() +
                                         "\"\n[embedding]\ndimension = 32\n[retrieval]\n"
                                         "batch_size = 2\n");

    ~CliFixture() { spdlog::set_level(spdlog::level::warn); }

    int run(std::vector<std::string> args) const {
        args.insert(args.begin(), {"--config", configPath.string()});
        return runCli(std::move(args));
    }

    int run(EvistoreCLI& cli, std::vector<std::string> args) const {
        args.insert(args.begin(), {"--config", configPath.string()});
        return runCli(cli, std::move(args));
    }
};

} // namespace

// ============================================================================
// Log level parsing
// ============================================================================

TEST_CASE("EvistoreCLI - log level names", "[cli][logging][catch2]") {
    CHECK(EvistoreCLI::parseLogLevel("debug") == spdlog::level::debug);
    CHECK(EvistoreCLI::parseLogLevel(" WARN ") == spdlog::level::warn);
    CHECK(EvistoreCLI::parseLogLevel("warning") == spdlog::level::warn);
    CHECK(EvistoreCLI::parseLogLevel("err") == spdlog::level::err);
    CHECK(EvistoreCLI::parseLogLevel("off") == spdlog::level::off);
    CHECK_FALSE(EvistoreCLI::parseLogLevel("loud").has_value());
}

TEST_CASE_METHOD(CliFixture, "EvistoreCLI - environment log level wins",
                 "[cli][logging][catch2]") {
    REQUIRE(run({"--log-level", "debug", "stats"}) == 0);
    CHECK(spdlog::get_level() == spdlog::level::off);
}

// ============================================================================
// Commands
// ============================================================================

TEST_CASE_METHOD(CliFixture, "EvistoreCLI - setup indexes every CSV row", "[cli][setup][catch2]") {
    REQUIRE(run({"setup"}) == 0);

    CHECK(fs::exists(storeDir / vector::IndexStore::kIndexFileName));
    CHECK(fs::exists(storeDir / vector::IndexStore::kTextsFileName));

    auto store = vector::IndexStore::open(storeDir);
    CHECK(store->size() == 3);
    CHECK(store->dimension() == 32);
    CHECK(store->texts()[0] == "Reviewer: Alice | Review: Light laptop for students | Rating: 5");

    SECTION("follow-up commands use the store") {
        store.reset();
        CHECK(run({"stats", "--json"}) == 0);
        CHECK(run({"search", "-q", "students laptop", "-k", "2"}) == 0);
        CHECK(run({"evidence", "-q", "students", "--max", "2"}) == 0);
        CHECK(run({"ask", "-q", "What are the interests of students?"}) == 0);
    }
    SECTION("setup again appends") {
        store.reset();
        REQUIRE(run({"setup", "--batch-size", "1"}) == 0);
        CHECK(vector::IndexStore::open(storeDir)->size() == 6);
    }
}

TEST_CASE_METHOD(CliFixture, "EvistoreCLI - --store overrides the configured path",
                 "[cli][setup][catch2]") {
    const auto other = tmp / "other-db";
    REQUIRE(run({"--store", other.string(), "setup"}) == 0);
    CHECK(vector::IndexStore::open(other)->size() == 3);
    CHECK_FALSE(fs::exists(storeDir / vector::IndexStore::kIndexFileName));
}

TEST_CASE_METHOD(CliFixture, "EvistoreCLI - failures return non-zero", "[cli][errors][catch2]") {
    SECTION("missing CSV") {
        CHECK(run({"setup", "--csv", (tmp / "absent.csv").string()}) == 1);
    }
    SECTION("missing required option") {
        CHECK(run({"search"}) != 0);
    }
    SECTION("no subcommand") {
        CHECK(run({}) != 0);
    }
    SECTION("invalid batch size") {
        CHECK(run({"setup", "--batch-size", "0"}) != 0);
    }
    SECTION("malformed config") {
        write_file(configPath, "[retrieval]\nbatch_size = lots\n");
        CHECK(run({"stats"}) == 1);
    }
}

TEST_CASE_METHOD(CliFixture, "EvistoreCLI - missing CSV does not stop evidence lookup",
                 "[cli][evidence][catch2]") {
    REQUIRE(run({"setup"}) == 0);
    CHECK(run({"evidence", "-q", "students", "--csv", (tmp / "absent.csv").string()}) == 0);
}

TEST_CASE_METHOD(CliFixture, "EvistoreCLI - stats reports the index digest", "[cli][stats][catch2]") {
    REQUIRE(run({"setup"}) == 0);

    std::string output;
    {
        CaptureStdout capture;
        REQUIRE(run({"stats", "--json"}) == 0);
        output = capture.str();
    }

    const auto stats = nlohmann::json::parse(output);
    CHECK(stats["entries"] == 3);
    CHECK(stats["dimension"] == 32);

    const auto indexBytes = read_file(storeDir / vector::IndexStore::kIndexFileName);
    CHECK(stats["index_sha256"] ==
          crypto::SHA256Hasher::hash(std::as_bytes(std::span(indexBytes.data(), indexBytes.size()))));
}

// ============================================================================
// Store locking
// ============================================================================

TEST_CASE_METHOD(CliFixture, "EvistoreCLI - query commands leave the store unlocked",
                 "[cli][locking][catch2]") {
    SECTION("stats on a missing store creates nothing") {
        REQUIRE(run({"stats"}) == 0);
        CHECK_FALSE(fs::exists(storeDir));
    }

    SECTION("setup runs while a reader holds the store open") {
        REQUIRE(run({"setup"}) == 0);

        for (const std::vector<std::string>& query :
             {std::vector<std::string>{"evidence", "-q", "students"},
              std::vector<std::string>{"search", "-q", "students"},
              std::vector<std::string>{"ask", "-q", "What do students like?"},
              std::vector<std::string>{"stats"}}) {
            EvistoreCLI reader;
            REQUIRE(run(reader, query) == 0);
            CHECK_FALSE(reader.getIndexStore()->isWritable());

            REQUIRE(run({"setup"}) == 0);
        }

        CHECK(vector::IndexStore::open(storeDir, vector::IndexStoreOptions{true})->size() == 15);
    }

    SECTION("setup fails while another writer holds the lock") {
        auto writer = vector::IndexStore::open(storeDir);
        REQUIRE(writer->isWritable());
        CHECK(run({"setup"}) == 1);
        CHECK(writer->size() == 0);
    }
}
