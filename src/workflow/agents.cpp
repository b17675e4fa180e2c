#include <evistore/workflow/agents.h>
#include <evistore/workflow/response_parsing.h>

#include <spdlog/spdlog.h>
#include <fmt/format.h>

namespace evistore::workflow {

const char* analysisInstructions(AnalysisCategory category) {
    switch (category) {
        case AnalysisCategory::Demographics:
            return "Describe the demographics of these users: age, gender, location, income and "
                   "education.";
        case AnalysisCategory::Interests:
            return "Identify the interests, preferences, activities and pastimes of these users.";
        case AnalysisCategory::Keywords:
            return "List the key phrases, features and product aspects reviewers mention most.";
        case AnalysisCategory::Usage:
            return "Describe how these users use the product and their usage patterns.";
        case AnalysisCategory::Satisfaction:
            return "Assess customer satisfaction and overall sentiment in the reviews.";
        case AnalysisCategory::Purchase:
            return "Describe buying patterns, purchase motivations and purchase timing.";
        case AnalysisCategory::Personality:
            return "Infer the personality traits these reviewers display.";
        case AnalysisCategory::Lifestyle:
            return "Describe how the product fits into the daily routines and lifestyle of these "
                   "users.";
        case AnalysisCategory::Values:
            return "Identify the values and priorities these users express.";
    }
    return "";
}

// ============================================================================
// PromptAgent
// ============================================================================

PromptAgent::PromptAgent(AnalysisCategory category, std::shared_ptr<ILlmClient> llm)
    : category_(category), llm_(std::move(llm)) {}

std::string PromptAgent::buildPrompt(const AnalysisState& state) const {
    std::string prompt =
        fmt::format("You are analyzing product reviews for {} analysis.\n\nAudience: {}\n"
                    "Question: {}\n\n{}\n\nFor every point you make, cite at least one "
                    "reviewer name in brackets [name].\n\nReviews:\n",
                    toString(category_), state.audience.value_or(""), state.question,
                    analysisInstructions(category_));

    if (state.evidence.empty()) {
        prompt += "(no reviews found)\n";
    }
    for (size_t i = 0; i < state.evidence.size(); ++i) {
        prompt += fmt::format("{}. {}\n", i + 1, state.evidence[i]);
    }
    return prompt;
}

Result<AnalysisResult> PromptAgent::analyze(const AnalysisState& state) {
    if (!state.audience || state.audience->empty()) {
        return Error{ErrorCode::InvalidArgument, "analysis requires an audience"};
    }

    AnalysisResult result;
    result.category = category_;
    result.audience = *state.audience;

    const auto prompt = buildPrompt(state);
    if (!llm_) {
        spdlog::debug("No LLM client configured; returning {} prompt", toString(category_));
        result.output = prompt;
        result.structured = nlohmann::json::object();
        result.dryRun = true;
        return result;
    }

    auto response = llm_->complete(prompt);
    if (!response) {
        spdlog::error("{} analysis failed: {}", toString(category_), response.error().message);
        return response.error();
    }

    result.structured = extractJson(response.value());
    result.output = formatResponse(response.value());
    return result;
}

// ============================================================================
// AgentRegistry
// ============================================================================

void AgentRegistry::registerAgent(std::shared_ptr<IAnalysisAgent> agent) {
    if (!agent) {
        return;
    }
    const auto category = agent->category();
    agents_[category] = std::move(agent);
}

IAnalysisAgent* AgentRegistry::find(AnalysisCategory category) const {
    auto it = agents_.find(category);
    return it == agents_.end() ? nullptr : it->second.get();
}

AgentRegistry makeDefaultRegistry(std::shared_ptr<ILlmClient> llm) {
    AgentRegistry registry;
    for (auto category : kAllCategories) {
        registry.registerAgent(std::make_shared<PromptAgent>(category, llm));
    }
    return registry;
}

} // namespace evistore::workflow
