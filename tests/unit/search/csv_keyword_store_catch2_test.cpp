// Catch2 tests for CSV parsing and keyword search

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

#include "../../common/test_helpers_catch2.h"
#include <evistore/search/csv_keyword_store.h>

using namespace evistore;
using namespace evistore::search;

namespace {

constexpr const char* kReviewsCsv =
    "reviewer,review,rating,purchase_date,product_category\n"
    "Alice,\"Great for students, lightweight\",5,2024-01-02,laptops\n"
    "Bob,Battery died quickly,2,,phones\n"
    "Carol,\"She said \"\"best buy\"\" ever\",4,2024-03-09,Laptops\n";

} // namespace

// ============================================================================
// csv::parse
// ============================================================================

TEST_CASE("CsvParse - quoting rules", "[search][csv][catch2]") {
    auto parsed = csv::parse("a,\"b,c\",\"d \"\"e\"\"\"\r\n\"multi\nline\",,x\n");
    REQUIRE(parsed);
    const auto& records = parsed.value();
    REQUIRE(records.size() == 2);
    CHECK(records[0] == csv::Record{"a", "b,c", "d \"e\""});
    CHECK(records[1] == csv::Record{"multi\nline", "", "x"});
}

TEST_CASE("CsvParse - line endings and blank lines", "[search][csv][catch2]") {
    SECTION("no trailing newline") {
        auto parsed = csv::parse("h1,h2\n1,2");
        REQUIRE(parsed);
        CHECK(parsed.value().size() == 2);
    }
    SECTION("blank lines are skipped") {
        auto parsed = csv::parse("h1\n\n\r\nv\n\n");
        REQUIRE(parsed);
        CHECK(parsed.value() == std::vector<csv::Record>{{"h1"}, {"v"}});
    }
    SECTION("byte order mark is dropped") {
        auto parsed = csv::parse("\xEF\xBB\xBFname\nx\n");
        REQUIRE(parsed);
        CHECK(parsed.value()[0] == csv::Record{"name"});
    }
    SECTION("quoted empty field keeps the record") {
        auto parsed = csv::parse("\"\"\n");
        REQUIRE(parsed);
        CHECK(parsed.value() == std::vector<csv::Record>{{""}});
    }
}

TEST_CASE("CsvParse - unterminated quote", "[search][csv][catch2]") {
    auto parsed = csv::parse("a,\"open\nstill open");
    REQUIRE_FALSE(parsed);
    CHECK(parsed.error().code == ErrorCode::CorruptedData);
}

TEST_CASE("CsvParse - numeric detection", "[search][csv][catch2]") {
    CHECK(csv::looksNumeric("5"));
    CHECK(csv::looksNumeric("-3.25"));
    CHECK(csv::looksNumeric(".5"));
    CHECK(csv::looksNumeric("1e6"));
    CHECK(csv::looksNumeric(" 42 "));
    CHECK_FALSE(csv::looksNumeric(""));
    CHECK_FALSE(csv::looksNumeric("."));
    CHECK_FALSE(csv::looksNumeric("1e"));
    CHECK_FALSE(csv::looksNumeric("2024-01-02"));
    CHECK_FALSE(csv::looksNumeric("five"));
}

TEST_CASE("CsvParse - title-cased field names", "[search][csv][catch2]") {
    CHECK(csv::titleCaseField("purchase_date") == "Purchase Date");
    CHECK(csv::titleCaseField("AGE") == "Age");
    CHECK(csv::titleCaseField("zip2code") == "Zip2Code");
    CHECK(csv::titleCaseField("") == "");
}

// ============================================================================
// CsvKeywordStore
// ============================================================================

TEST_CASE("CsvKeywordStore - row rendering", "[search][csv][catch2]") {
    CsvKeywordStore store;
    REQUIRE(store.loadFromString(kReviewsCsv));
    REQUIRE(store.rowCount() == 3);
    CHECK(store.columns().size() == 5);

    const auto rendered = store.renderAll();
    CHECK(rendered[0] == "Reviewer: Alice | Review: Great for students, lightweight | Rating: 5 | "
                         "Purchase Date: 2024-01-02 | Product Category: laptops");
    // Empty cells are omitted
    CHECK(rendered[1] == "Reviewer: Bob | Review: Battery died quickly | Rating: 2 | "
                         "Product Category: phones");
}

TEST_CASE("CsvKeywordStore - formatRow without reviewer or review", "[search][csv][catch2]") {
    const std::vector<std::string> columns{"age", "comment", "city_name"};
    const CsvRow row{std::string("31"), std::nullopt, std::string("Oslo")};
    CHECK(CsvKeywordStore::formatRow(columns, row) == "Age: 31 | City Name: Oslo");
}

TEST_CASE("CsvKeywordStore - case-insensitive substring search", "[search][csv][catch2]") {
    CsvKeywordStore store;
    REQUIRE(store.loadFromString(kReviewsCsv));

    auto hits = store.search("LAPTOP");
    REQUIRE(hits.size() == 2);
    CHECK(hits[0].rfind("Reviewer: Alice", 0) == 0);
    CHECK(hits[1].rfind("Reviewer: Carol", 0) == 0);

    CHECK(store.search("best buy").size() == 1);
    CHECK(store.search("nothing like this").empty());
    CHECK(store.search("").empty());
}

TEST_CASE("CsvKeywordStore - numeric columns are not searched", "[search][csv][catch2]") {
    CsvKeywordStore store;
    REQUIRE(store.loadFromString("name,age\nDana,42\nEli,7\n"));

    CHECK(store.search("42").empty());
    CHECK(store.search("dan").size() == 1);
}

TEST_CASE("CsvKeywordStore - each row matches at most once", "[search][csv][catch2]") {
    CsvKeywordStore store;
    REQUIRE(store.loadFromString("review,notes\nfast shipping,fast again\n"));
    CHECK(store.search("fast").size() == 1);
}

TEST_CASE("CsvKeywordStore - result cap", "[search][csv][catch2]") {
    std::string csvText = "review\n";
    for (int i = 0; i < 10; ++i) {
        csvText += "match " + std::to_string(i) + "\n";
    }

    SECTION("capped in file order") {
        CsvKeywordStore store(3);
        REQUIRE(store.loadFromString(csvText));
        auto hits = store.search("match");
        REQUIRE(hits.size() == 3);
        CHECK(hits[0] == "Review: match 0");
        CHECK(hits[2] == "Review: match 2");
    }
    SECTION("zero means unlimited") {
        CsvKeywordStore store(0);
        REQUIRE(store.loadFromString(csvText));
        CHECK(store.search("match").size() == 10);
    }
}

TEST_CASE("CsvKeywordStore - ragged rows and invalid bytes", "[search][csv][catch2]") {
    CsvKeywordStore store;
    REQUIRE(store.loadFromString("review,city\nshort row\nfull,Bergen,extra\nbad \xFF byte,x\n"));
    REQUIRE(store.rowCount() == 3);

    CHECK(store.renderAll()[0] == "Review: short row");
    CHECK(store.renderAll()[1] == "Review: full | City: Bergen");
    CHECK(store.renderAll()[2] == "Review: bad ? byte | City: x");
}

TEST_CASE("CsvKeywordStore - load failures leave the store empty", "[search][csv][catch2]") {
    evistore::test::TempDir dir;
    CsvKeywordStore store;

    SECTION("missing file") {
        auto r = store.load(dir / "missing.csv");
        REQUIRE_FALSE(r);
        CHECK(r.error().code == ErrorCode::FileNotFound);
    }
    SECTION("malformed file replaces previous contents") {
        REQUIRE(store.loadFromString(kReviewsCsv));
        const auto path = evistore::test::write_file(dir / "bad.csv", "review\n\"never closed\n");
        auto r = store.load(path);
        REQUIRE_FALSE(r);
        CHECK(r.error().code == ErrorCode::CorruptedData);
    }
    SECTION("empty file") {
        const auto path = evistore::test::write_file(dir / "empty.csv", "");
        REQUIRE_FALSE(store.load(path));
    }

    CHECK(store.empty());
    CHECK(store.search("laptop").empty());
}

TEST_CASE("CsvKeywordStore - load from disk", "[search][csv][catch2]") {
    evistore::test::TempDir dir;
    const auto path = evistore::test::write_file(dir / "data.csv", kReviewsCsv);

    CsvKeywordStore store;
    REQUIRE(store.load(path));
    CHECK(store.rowCount() == 3);
    CHECK(store.search("battery").size() == 1);
}
