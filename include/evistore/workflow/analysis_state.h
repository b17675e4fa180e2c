#pragma once

#include <array>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace evistore::workflow {

enum class AnalysisCategory {
    Demographics,
    Interests,
    Keywords,
    Usage,
    Satisfaction,
    Purchase,
    Personality,
    Lifestyle,
    Values
};

inline constexpr std::array<AnalysisCategory, 9> kAllCategories = {
    AnalysisCategory::Demographics, AnalysisCategory::Interests,   AnalysisCategory::Keywords,
    AnalysisCategory::Usage,        AnalysisCategory::Satisfaction, AnalysisCategory::Purchase,
    AnalysisCategory::Personality,  AnalysisCategory::Lifestyle,    AnalysisCategory::Values};

const char* toString(AnalysisCategory category);

/// Case-insensitive, surrounding whitespace ignored
std::optional<AnalysisCategory> parseCategory(std::string_view name);

/// Lead-in line for the recommendations section
const char* recommendationIntroduction(AnalysisCategory category);

struct AnalysisResult {
    AnalysisCategory category = AnalysisCategory::Demographics;
    std::string audience;
    std::string output;            // display text
    nlohmann::json structured;     // JSON object found in the response, if any
    std::vector<std::string> recommendations;
    bool dryRun = false;           // output is the prompt, no model was called
};

struct AnalysisState {
    std::string question;
    std::optional<std::string> audience;
    std::vector<std::string> evidence;
    std::optional<AnalysisCategory> category;
    std::optional<AnalysisResult> result;
    std::string formattedOutput;
};

} // namespace evistore::workflow
