#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <evistore/core/types.h>
#include <evistore/search/keyword_store.h>

namespace evistore::search {

namespace csv {

using Record = std::vector<std::string>;

/**
 * Parse RFC 4180 CSV text: quoted fields, doubled quotes, separators and line
 * breaks inside quotes, CRLF or LF records. A trailing newline does not produce
 * an extra record. Unterminated quotes yield CorruptedData.
 */
Result<std::vector<Record>> parse(std::string_view text);

/// Optional sign, digits, optional fraction and exponent
bool looksNumeric(std::string_view cell);

/// "purchase_date" -> "Purchase Date"
std::string titleCaseField(std::string_view field);

} // namespace csv

using CsvCell = std::optional<std::string>;
using CsvRow = std::vector<CsvCell>;

/**
 * Case-insensitive substring search over the rows of a CSV file.
 *
 * The first record is the header; empty cells are null. A column is searched
 * when at least one of its non-null cells is not numeric. Matching rows are
 * rendered with formatRow() and returned in file order, each row at most once.
 */
class CsvKeywordStore : public IKeywordStore {
public:
    static constexpr size_t kDefaultMaxResults = 100;

    explicit CsvKeywordStore(size_t maxResults = kDefaultMaxResults);

    /// On failure the store is left empty and the error is logged
    Result<void> load(const std::filesystem::path& path);
    Result<void> loadFromString(std::string_view text);

    std::vector<std::string> search(const std::string& query) override;

    /// Every row rendered, in file order
    std::vector<std::string> renderAll() const;

    /**
     * Render a row as review-like text:
     * "Reviewer: <name> | Review: <text> | <Other Field>: <value> | ..."
     */
    static std::string formatRow(const std::vector<std::string>& columns, const CsvRow& row);

    const std::vector<std::string>& columns() const { return columns_; }
    const std::vector<CsvRow>& rows() const { return rows_; }
    size_t rowCount() const { return rows_.size(); }
    bool empty() const { return rows_.empty(); }
    size_t maxResults() const { return maxResults_; }

private:
    void clear();

    size_t maxResults_;
    std::vector<std::string> columns_;
    std::vector<CsvRow> rows_;
    std::vector<size_t> textualColumns_;
};

} // namespace evistore::search
