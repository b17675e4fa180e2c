#include <evistore/config/config_helpers.h>
#include <evistore/workflow/response_parsing.h>

#include <spdlog/spdlog.h>

#include <sstream>

namespace evistore::workflow {

namespace {
constexpr std::string_view kBullet = "\xE2\x80\xA2"; // U+2022
}

nlohmann::json extractJson(std::string_view response) {
    const auto open = response.find('{');
    const auto close = response.rfind('}');
    if (open == std::string_view::npos || close == std::string_view::npos || close < open) {
        return nlohmann::json::object();
    }

    auto parsed = nlohmann::json::parse(std::string(response.substr(open, close - open + 1)),
                                        nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        spdlog::debug("No JSON object in model response");
        return nlohmann::json::object();
    }
    return parsed;
}

std::string formatResponse(std::string_view response) {
    std::string text(response);
    config::rtrim(text);

    // Trailing ```json ... ``` fence
    if (text.size() >= 3 && text.compare(text.size() - 3, 3, "```") == 0) {
        if (auto fence = text.find("\n```json"); fence != std::string::npos) {
            text.erase(fence);
            config::rtrim(text);
        }
    }

    // Trailing raw JSON object starting on its own line
    if (!text.empty() && text.back() == '}') {
        if (auto brace = text.find("\n{"); brace != std::string::npos) {
            text.erase(brace);
        }
    }

    config::trim(text);
    return text;
}

std::vector<std::string> extractBullets(std::string_view response) {
    std::vector<std::string> bullets;
    std::istringstream lines{std::string(response)};
    std::string line;
    while (std::getline(lines, line)) {
        config::trim(line);
        if (line.rfind(kBullet, 0) == 0 || line.rfind('-', 0) == 0) {
            bullets.push_back(line);
        }
    }

    if (bullets.empty()) {
        std::string whole(response);
        config::trim(whole);
        if (!whole.empty()) {
            bullets.push_back(std::string(kBullet) + " " + whole);
        }
    }
    return bullets;
}

} // namespace evistore::workflow
