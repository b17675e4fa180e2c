// Test helpers for Catch2 tests

#pragma once

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <random>
#include <string>
#include <string_view>

namespace evistore::test {

/**
 * @brief Creates a unique temporary directory with the given prefix.
 */
inline std::filesystem::path make_temp_dir(std::string_view prefix = "evistore_test_") {
    namespace fs = std::filesystem;
    const auto base = fs::temp_directory_path();
    std::uniform_int_distribution<int> dist(0, 9999);
    thread_local std::mt19937_64 rng{std::random_device{}()};
    for (int attempt = 0; attempt < 512; ++attempt) {
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        auto candidate =
            base / (std::string(prefix) + std::to_string(stamp) + "_" + std::to_string(dist(rng)));
        std::error_code ec;
        if (fs::create_directories(candidate, ec)) {
            return candidate;
        }
    }
    return base;
}

/**
 * @brief Temp directory removed on scope exit.
 */
class TempDir {
public:
    explicit TempDir(std::string_view prefix = "evistore_test_") : path_(make_temp_dir(prefix)) {}
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }
    std::filesystem::path operator/(std::string_view child) const { return path_ / child; }

private:
    std::filesystem::path path_;
};

/**
 * @brief Write data to a file, creating parent directories as needed.
 */
inline std::filesystem::path write_file(const std::filesystem::path& path, std::string_view data) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream stream(path, std::ios::binary);
    stream.write(data.data(), static_cast<std::streamsize>(data.size()));
    stream.close();
    return path;
}

inline std::string read_file(const std::filesystem::path& path) {
    std::ifstream stream(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(stream)), std::istreambuf_iterator<char>());
}

/**
 * @brief RAII helper to set an environment variable and restore it on scope exit.
 * A nullopt value unsets the variable for the scope.
 */
class ScopedEnvVar {
public:
    ScopedEnvVar(std::string key, std::optional<std::string> value)
        : key_(std::move(key)), previous_(get_env(key_)) {
        set_env(key_, std::move(value));
    }

    ScopedEnvVar(const ScopedEnvVar&) = delete;
    ScopedEnvVar& operator=(const ScopedEnvVar&) = delete;

    ~ScopedEnvVar() { set_env(key_, previous_); }

private:
    static std::optional<std::string> get_env(const std::string& key) {
        if (const auto* value = std::getenv(key.c_str()); value != nullptr) {
            return std::string(value);
        }
        return std::nullopt;
    }

    static void set_env(const std::string& key, const std::optional<std::string>& value) {
        if (value) {
            ::setenv(key.c_str(), value->c_str(), 1);
        } else {
            ::unsetenv(key.c_str());
        }
    }

    std::string key_;
    std::optional<std::string> previous_;
};

} // namespace evistore::test
