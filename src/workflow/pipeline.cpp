#include <evistore/config/config_helpers.h>
#include <evistore/workflow/pipeline.h>
#include <evistore/workflow/response_parsing.h>

#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <algorithm>
#include <regex>
#include <utility>

namespace evistore::workflow {

// ============================================================================
// Pipeline
// ============================================================================

Pipeline& Pipeline::addStage(std::string name, Stage stage) {
    stages_.push_back(NamedStage{std::move(name), std::move(stage)});
    return *this;
}

AnalysisState Pipeline::run(const std::string& question) const {
    AnalysisState state;
    state.question = question;
    return run(std::move(state));
}

AnalysisState Pipeline::run(AnalysisState state) const {
    for (const auto& [name, stage] : stages_) {
        spdlog::debug("Pipeline stage: {}", name);
        try {
            state = stage(state);
        } catch (const std::exception& e) {
            spdlog::error("Stage {} failed: {}", name, e.what());
        }
    }
    return state;
}

std::vector<std::string> Pipeline::stageNames() const {
    std::vector<std::string> names;
    names.reserve(stages_.size());
    for (const auto& s : stages_) {
        names.push_back(s.name);
    }
    return names;
}

// ============================================================================
// Stages
// ============================================================================

namespace stages {

namespace {

std::string toLower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::vector<std::string> words(const std::string& lower) {
    std::vector<std::string> out;
    std::string current;
    for (unsigned char c : lower) {
        if (std::isalnum(c)) {
            current.push_back(static_cast<char>(c));
        } else if (!current.empty()) {
            out.push_back(std::move(current));
            current.clear();
        }
    }
    if (!current.empty()) {
        out.push_back(std::move(current));
    }
    return out;
}

struct RoutingRule {
    AnalysisCategory category;
    std::vector<std::string_view> cues; // phrases (with a space) or word prefixes
};

// First matching rule wins, so narrower categories come first
const std::vector<RoutingRule>& routingRules() {
    static const std::vector<RoutingRule> rules = {
        {AnalysisCategory::Personality, {"personalit", "trait", "character", "introvert",
                                         "extrovert"}},
        {AnalysisCategory::Lifestyle, {"lifestyle", "daily", "routine", "day to day", "way of life"}},
        {AnalysisCategory::Values, {"value", "priorit", "care about", "believe", "principle"}},
        {AnalysisCategory::Satisfaction, {"satisf", "happy", "unhappy", "sentiment", "complain",
                                          "rating", "love", "hate", "disappoint"}},
        {AnalysisCategory::Purchase, {"purchas", "buy", "bought", "price", "spend", "shopping",
                                      "when do"}},
        {AnalysisCategory::Keywords, {"keyword", "phrase", "feature", "aspect", "mention", "term"}},
        {AnalysisCategory::Interests, {"interest", "hobb", "prefer", "activit", "pastime",
                                       "enjoy"}},
        {AnalysisCategory::Demographics, {"demographic", "age", "gender", "location", "income",
                                          "education", "old"}},
        {AnalysisCategory::Usage, {"usage", "use", "using", "how often", "pattern"}},
    };
    return rules;
}

} // namespace

std::optional<std::string> findAudience(std::string_view question) {
    static const std::regex patterns[] = {
        std::regex(R"((?:about|for|of|who (?:use|buy|purchase)|regarding) ([^?.,]+))",
                   std::regex::icase),
        std::regex(R"(([^?.,]+) (?:users|customers|buyers|audience))", std::regex::icase),
        std::regex(R"(people (?:who|that) (?:use|buy|like) ([^?.,]+))", std::regex::icase),
    };
    static const std::regex filler(R"(\b(the|my|your|their|our)\b)", std::regex::icase);
    static const std::regex spaces(R"(\s+)");

    const std::string text(question);
    for (const auto& pattern : patterns) {
        std::smatch match;
        if (!std::regex_search(text, match, pattern)) {
            continue;
        }
        std::string audience = std::regex_replace(match[1].str(), filler, "");
        audience = std::regex_replace(audience, spaces, " ");
        config::trim(audience);
        if (!audience.empty()) {
            return audience;
        }
    }
    return std::nullopt;
}

AnalysisCategory classifyQuestion(std::string_view question) {
    const auto lower = toLower(question);
    const auto tokens = words(lower);

    for (const auto& rule : routingRules()) {
        for (auto cue : rule.cues) {
            const bool matched =
                cue.find(' ') != std::string_view::npos
                    ? lower.find(cue) != std::string::npos
                    : std::any_of(tokens.begin(), tokens.end(),
                                  [&](const std::string& w) { return w.rfind(cue, 0) == 0; });
            if (matched) {
                return rule.category;
            }
        }
    }
    return AnalysisCategory::Demographics;
}

AnalysisState extractAudience(AnalysisState state) {
    if (!state.audience || state.audience->empty()) {
        state.audience = findAudience(state.question);
    }
    if (state.audience) {
        spdlog::info("Audience: {}", *state.audience);
    } else {
        spdlog::info("No audience found in question");
    }
    return state;
}

AnalysisState fetchEvidence(const search::EvidenceFusion& fusion, AnalysisState state) {
    state.evidence = state.audience ? fusion.gather(*state.audience) : std::vector<std::string>{};
    return state;
}

AnalysisState routeQuestion(AnalysisState state) {
    if (!state.category) {
        state.category = classifyQuestion(state.question);
    }
    spdlog::info("Routing to {} analysis", toString(*state.category));
    return state;
}

AnalysisState runAnalysis(const AgentRegistry& registry, AnalysisState state) {
    if (!state.audience) {
        return state;
    }
    const auto category = state.category.value_or(AnalysisCategory::Demographics);
    auto* agent = registry.find(category);
    if (!agent) {
        spdlog::warn("No agent registered for {}", toString(category));
        return state;
    }

    auto result = agent->analyze(state);
    if (!result) {
        spdlog::error("Analysis failed: {}", result.error().message);
        return state;
    }
    state.result = std::move(result).value();
    return state;
}

AnalysisState generateRecommendations(ILlmClient* llm, AnalysisState state) {
    if (!state.result || !llm || state.result->dryRun) {
        return state;
    }

    auto& result = *state.result;
    const auto insights = result.structured.empty() ? result.output : result.structured.dump(2);
    const auto prompt = fmt::format(
        "Based on the following {} insights about {}, provide 3-5 concrete, actionable "
        "recommendations.\n\nInsights:\n{}\n\nFormat each recommendation as a bullet point "
        "starting with \"\xE2\x80\xA2\" followed by the recommendation.",
        toString(result.category), result.audience, insights);

    auto response = llm->complete(prompt);
    if (!response) {
        spdlog::warn("Recommendation request failed: {}", response.error().message);
        return state;
    }
    result.recommendations = extractBullets(response.value());
    return state;
}

AnalysisState formatOutput(AnalysisState state) {
    if (!state.audience) {
        state.formattedOutput = kClarificationMessage;
        return state;
    }
    if (!state.result) {
        state.formattedOutput = kAnalysisFailedMessage;
        return state;
    }

    const auto& result = *state.result;
    std::string out = result.output;
    out += "\n\n\xF0\x9F\x93\x8B **Recommendations**:\n";
    out += recommendationIntroduction(result.category);
    out += "\n\n";
    for (const auto& rec : result.recommendations) {
        out += rec;
        out += "\n";
    }
    state.formattedOutput = std::move(out);
    return state;
}

} // namespace stages

Pipeline makeAnalysisPipeline(std::shared_ptr<search::EvidenceFusion> fusion,
                              std::shared_ptr<AgentRegistry> registry,
                              std::shared_ptr<ILlmClient> llm) {
    Pipeline pipeline;
    pipeline.addStage("extract_audience", stages::extractAudience);
    pipeline.addStage("fetch_evidence", [fusion](AnalysisState state) {
        if (!fusion) {
            state.evidence.clear();
            return state;
        }
        return stages::fetchEvidence(*fusion, std::move(state));
    });
    pipeline.addStage("route_question", stages::routeQuestion);
    pipeline.addStage("run_analysis", [registry](AnalysisState state) {
        if (!registry) {
            return state;
        }
        return stages::runAnalysis(*registry, std::move(state));
    });
    pipeline.addStage("generate_recommendations", [llm](AnalysisState state) {
        return stages::generateRecommendations(llm.get(), std::move(state));
    });
    pipeline.addStage("format_output", stages::formatOutput);
    return pipeline;
}

} // namespace evistore::workflow
