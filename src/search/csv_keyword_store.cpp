#include <evistore/common/utf8_utils.h>
#include <evistore/search/csv_keyword_store.h>

#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <array>
#include <fstream>
#include <sstream>

namespace evistore::search {

namespace {

constexpr std::array<std::string_view, 4> kReviewerFields = {"reviewer", "name", "user",
                                                             "author"};
constexpr std::array<std::string_view, 5> kReviewFields = {"review", "comment", "feedback", "text",
                                                           "description"};

std::string asciiLower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(c >= 'A' && c <= 'Z' ? c - 'A' + 'a' : c);
    });
    return out;
}

bool isReservedField(std::string_view field) {
    return std::find(kReviewerFields.begin(), kReviewerFields.end(), field) !=
               kReviewerFields.end() ||
           std::find(kReviewFields.begin(), kReviewFields.end(), field) != kReviewFields.end();
}

template <size_t N>
const std::string* firstPresent(const std::array<std::string_view, N>& candidates,
                                const std::vector<std::string>& columns, const CsvRow& row) {
    for (auto candidate : candidates) {
        for (size_t i = 0; i < columns.size() && i < row.size(); ++i) {
            if (columns[i] == candidate && row[i]) {
                return &*row[i];
            }
        }
    }
    return nullptr;
}

} // namespace

// ============================================================================
// CSV parsing
// ============================================================================

namespace csv {

Result<std::vector<Record>> parse(std::string_view text) {
    // UTF-8 byte order mark
    if (text.size() >= 3 && text.substr(0, 3) == "\xEF\xBB\xBF") {
        text.remove_prefix(3);
    }

    std::vector<Record> records;
    Record record;
    std::string field;
    bool inQuotes = false;
    bool fieldQuoted = false;

    auto endField = [&]() {
        record.push_back(std::move(field));
        field.clear();
        fieldQuoted = false;
    };
    auto endRecord = [&]() {
        const bool blankLine = record.empty() && field.empty() && !fieldQuoted;
        endField();
        if (!blankLine) {
            records.push_back(std::move(record));
        }
        record.clear();
    };

    for (size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (inQuotes) {
            if (c == '"') {
                if (i + 1 < text.size() && text[i + 1] == '"') {
                    field.push_back('"');
                    ++i;
                } else {
                    inQuotes = false;
                }
            } else {
                field.push_back(c);
            }
            continue;
        }

        switch (c) {
            case '"':
                if (field.empty() && !fieldQuoted) {
                    inQuotes = true;
                    fieldQuoted = true;
                } else {
                    field.push_back(c);
                }
                break;
            case ',':
                endField();
                break;
            case '\r':
                if (i + 1 < text.size() && text[i + 1] == '\n') {
                    ++i;
                }
                endRecord();
                break;
            case '\n':
                endRecord();
                break;
            default:
                field.push_back(c);
                break;
        }
    }

    if (inQuotes) {
        return Error{ErrorCode::CorruptedData, "unterminated quoted field"};
    }
    if (!field.empty() || fieldQuoted || !record.empty()) {
        endRecord();
    }
    return records;
}

bool looksNumeric(std::string_view cell) {
    size_t i = 0;
    const size_t n = cell.size();
    auto digits = [&]() {
        size_t start = i;
        while (i < n && cell[i] >= '0' && cell[i] <= '9')
            ++i;
        return i - start;
    };

    while (i < n && cell[i] == ' ')
        ++i;
    if (i < n && (cell[i] == '+' || cell[i] == '-'))
        ++i;
    size_t mantissa = digits();
    if (i < n && cell[i] == '.') {
        ++i;
        mantissa += digits();
    }
    if (mantissa == 0)
        return false;
    if (i < n && (cell[i] == 'e' || cell[i] == 'E')) {
        ++i;
        if (i < n && (cell[i] == '+' || cell[i] == '-'))
            ++i;
        if (digits() == 0)
            return false;
    }
    while (i < n && cell[i] == ' ')
        ++i;
    return i == n;
}

std::string titleCaseField(std::string_view field) {
    std::string out;
    out.reserve(field.size());
    bool prevLetter = false;
    for (char raw : field) {
        unsigned char c = static_cast<unsigned char>(raw == '_' ? ' ' : raw);
        const bool upper = c >= 'A' && c <= 'Z';
        const bool lower = c >= 'a' && c <= 'z';
        if (lower && !prevLetter) {
            c = static_cast<unsigned char>(c - 'a' + 'A');
        } else if (upper && prevLetter) {
            c = static_cast<unsigned char>(c - 'A' + 'a');
        }
        out.push_back(static_cast<char>(c));
        prevLetter = upper || lower;
    }
    return out;
}

} // namespace csv

// ============================================================================
// CsvKeywordStore
// ============================================================================

CsvKeywordStore::CsvKeywordStore(size_t maxResults) : maxResults_(maxResults) {}

void CsvKeywordStore::clear() {
    columns_.clear();
    rows_.clear();
    textualColumns_.clear();
}

Result<void> CsvKeywordStore::load(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        clear();
        spdlog::error("Error loading CSV file {}: cannot open", path.string());
        return Error{ErrorCode::FileNotFound, fmt::format("cannot open {}", path.string())};
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        clear();
        spdlog::error("Error loading CSV file {}: read failed", path.string());
        return Error{ErrorCode::IOError, fmt::format("read failed: {}", path.string())};
    }

    auto loaded = loadFromString(buffer.str());
    if (!loaded) {
        spdlog::error("Error loading CSV file {}: {}", path.string(), loaded.error().message);
        return loaded;
    }

    spdlog::info("Loaded CSV file with {} rows and {} columns", rows_.size(), columns_.size());
    return {};
}

Result<void> CsvKeywordStore::loadFromString(std::string_view text) {
    clear();

    auto parsed = csv::parse(text);
    if (!parsed) {
        return parsed.error();
    }

    auto& records = parsed.value();
    if (records.empty()) {
        return Error{ErrorCode::CorruptedData, "CSV has no header row"};
    }

    for (const auto& name : records.front()) {
        columns_.push_back(common::sanitizeUtf8(name));
    }

    rows_.reserve(records.size() - 1);
    for (size_t r = 1; r < records.size(); ++r) {
        const auto& record = records[r];
        if (record.size() != columns_.size()) {
            spdlog::debug("CSV row {} has {} fields, header has {}", r, record.size(),
                          columns_.size());
        }
        CsvRow row(columns_.size());
        for (size_t c = 0; c < columns_.size() && c < record.size(); ++c) {
            if (!record[c].empty()) {
                row[c] = common::sanitizeUtf8(record[c]);
            }
        }
        rows_.push_back(std::move(row));
    }

    for (size_t c = 0; c < columns_.size(); ++c) {
        for (const auto& row : rows_) {
            if (row[c] && !csv::looksNumeric(*row[c])) {
                textualColumns_.push_back(c);
                break;
            }
        }
    }

    spdlog::debug("CSV columns: {}; {} searchable", fmt::join(columns_, ", "),
                  textualColumns_.size());
    return {};
}

std::vector<std::string> CsvKeywordStore::search(const std::string& query) {
    std::vector<std::string> results;
    if (query.empty() || rows_.empty() || textualColumns_.empty()) {
        return results;
    }

    const std::string needle = asciiLower(query);
    for (const auto& row : rows_) {
        if (maxResults_ != 0 && results.size() >= maxResults_) {
            break;
        }
        const bool matched = std::any_of(textualColumns_.begin(), textualColumns_.end(),
                                         [&](size_t c) {
                                             return row[c] && asciiLower(*row[c]).find(needle) !=
                                                                  std::string::npos;
                                         });
        if (matched) {
            results.push_back(formatRow(columns_, row));
        }
    }

    spdlog::debug("Keyword search '{}' matched {} rows", query, results.size());
    return results;
}

std::vector<std::string> CsvKeywordStore::renderAll() const {
    std::vector<std::string> rendered;
    rendered.reserve(rows_.size());
    for (const auto& row : rows_) {
        rendered.push_back(formatRow(columns_, row));
    }
    return rendered;
}

std::string CsvKeywordStore::formatRow(const std::vector<std::string>& columns, const CsvRow& row) {
    std::vector<std::string> parts;

    if (const auto* reviewer = firstPresent(kReviewerFields, columns, row)) {
        parts.push_back(fmt::format("Reviewer: {}", *reviewer));
    }
    if (const auto* review = firstPresent(kReviewFields, columns, row)) {
        parts.push_back(fmt::format("Review: {}", *review));
    }

    for (size_t i = 0; i < columns.size() && i < row.size(); ++i) {
        if (row[i] && !isReservedField(columns[i])) {
            parts.push_back(fmt::format("{}: {}", csv::titleCaseField(columns[i]), *row[i]));
        }
    }

    return fmt::format("{}", fmt::join(parts, " | "));
}

} // namespace evistore::search
