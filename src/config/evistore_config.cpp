#include <evistore/config/config_helpers.h>
#include <evistore/config/evistore_config.h>

#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <charconv>
#include <system_error>

namespace evistore::config {

namespace {

Result<size_t> parseSize(const std::string& raw, std::string_view key) {
    size_t value = 0;
    const char* first = raw.data();
    const char* last = raw.data() + raw.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (raw.empty() || ec != std::errc{} || ptr != last) {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("invalid value for {}: '{}'", key, raw)};
    }
    return value;
}

Result<bool> parseBool(std::string raw, std::string_view key) {
    std::transform(raw.begin(), raw.end(), raw.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (raw == "true" || raw == "1" || raw == "yes" || raw == "on")
        return true;
    if (raw == "false" || raw == "0" || raw == "no" || raw == "off")
        return false;
    return Error{ErrorCode::InvalidArgument, fmt::format("invalid value for {}: '{}'", key, raw)};
}

} // namespace

EvistoreConfig EvistoreConfig::defaults() {
    EvistoreConfig cfg;
    cfg.storePath = get_data_dir() / "vector_db";
    return cfg;
}

Result<EvistoreConfig> EvistoreConfig::load(const std::filesystem::path& configPath) {
    EvistoreConfig cfg = defaults();
    cfg.configPath = configPath;

    std::error_code ec;
    const bool haveFile = !configPath.empty() && std::filesystem::is_regular_file(configPath, ec);
    if (!haveFile) {
        spdlog::debug("No config file at {}, using defaults", configPath.string());
    }

    auto fileValue = [&](const std::string& section, const std::string& key) -> std::string {
        return haveFile ? parse_config_value(configPath, section, key) : std::string{};
    };

    // Path-valued settings
    if (auto env = env_value("EVISTORE_STORE_PATH")) {
        cfg.storePath = expand_tilde(*env);
    } else if (auto v = fileValue("store", "path"); !v.empty()) {
        cfg.storePath = expand_tilde(v);
    }

    if (auto env = env_value("EVISTORE_CSV_PATH")) {
        cfg.csvPath = expand_tilde(*env);
    } else if (auto v = fileValue("keyword", "csv_path"); !v.empty()) {
        cfg.csvPath = expand_tilde(v);
    }

    if (auto env = env_value("EVISTORE_LOG_LEVEL")) {
        cfg.logLevel = *env;
    } else if (auto v = fileValue("log", "level"); !v.empty()) {
        cfg.logLevel = v;
    }

    // Numeric settings
    struct SizeSetting {
        const char* section;
        const char* key;
        size_t* target;
    };
    const SizeSetting sizes[] = {
        {"keyword", "max_results", &cfg.keywordMaxResults},
        {"embedding", "dimension", &cfg.embeddingDimension},
        {"retrieval", "batch_size", &cfg.batchSize},
        {"retrieval", "vector_limit", &cfg.vectorLimit},
        {"retrieval", "max_evidence", &cfg.maxEvidence},
    };
    for (const auto& s : sizes) {
        auto raw = fileValue(s.section, s.key);
        if (raw.empty())
            continue;
        auto parsed = parseSize(raw, fmt::format("[{}] {}", s.section, s.key));
        if (!parsed)
            return parsed.error();
        *s.target = parsed.value();
    }

    if (cfg.embeddingDimension == 0) {
        return Error{ErrorCode::InvalidArgument, "[embedding] dimension must be positive"};
    }
    if (cfg.batchSize == 0) {
        return Error{ErrorCode::InvalidArgument, "[retrieval] batch_size must be positive"};
    }

    if (auto raw = fileValue("retrieval", "embed_timeout_ms"); !raw.empty()) {
        auto parsed = parseSize(raw, "[retrieval] embed_timeout_ms");
        if (!parsed)
            return parsed.error();
        cfg.embedTimeout = std::chrono::milliseconds(parsed.value());
    }

    if (auto raw = fileValue("retrieval", "parallel_sources"); !raw.empty()) {
        auto parsed = parseBool(raw, "[retrieval] parallel_sources");
        if (!parsed)
            return parsed.error();
        cfg.parallelSources = parsed.value();
    }

    return cfg;
}

} // namespace evistore::config
