#include <evistore/config/config_helpers.h>
#include <evistore/workflow/analysis_state.h>

#include <algorithm>

namespace evistore::workflow {

const char* toString(AnalysisCategory category) {
    switch (category) {
        case AnalysisCategory::Demographics: return "demographics";
        case AnalysisCategory::Interests: return "interests";
        case AnalysisCategory::Keywords: return "keywords";
        case AnalysisCategory::Usage: return "usage";
        case AnalysisCategory::Satisfaction: return "satisfaction";
        case AnalysisCategory::Purchase: return "purchase";
        case AnalysisCategory::Personality: return "personality";
        case AnalysisCategory::Lifestyle: return "lifestyle";
        case AnalysisCategory::Values: return "values";
    }
    return "demographics";
}

std::optional<AnalysisCategory> parseCategory(std::string_view name) {
    std::string key(name);
    config::trim(key);
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (auto category : kAllCategories) {
        if (key == toString(category)) {
            return category;
        }
    }
    return std::nullopt;
}

const char* recommendationIntroduction(AnalysisCategory category) {
    switch (category) {
        case AnalysisCategory::Demographics:
            return "Based on demographic insights, here are targeted recommendations:";
        case AnalysisCategory::Interests:
            return "Based on user interest analysis, consider these actionable recommendations:";
        case AnalysisCategory::Keywords:
            return "Based on key feature insights, here are actionable recommendations:";
        case AnalysisCategory::Usage:
            return "Based on usage pattern analysis, consider implementing these recommendations:";
        case AnalysisCategory::Satisfaction:
            return "To improve customer satisfaction, consider these targeted recommendations:";
        case AnalysisCategory::Purchase:
            return "To optimize purchase behavior, consider these strategic recommendations:";
        case AnalysisCategory::Personality:
            return "Based on personality trait analysis, consider these tailored recommendations:";
        case AnalysisCategory::Lifestyle:
            return "To better align with user lifestyles, consider these recommendations:";
        case AnalysisCategory::Values:
            return "To better connect with user values, consider these recommendations:";
    }
    return "Based on these insights, consider these recommendations:";
}

} // namespace evistore::workflow
