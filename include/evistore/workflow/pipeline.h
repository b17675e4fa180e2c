#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <evistore/search/evidence_fusion.h>
#include <evistore/workflow/agents.h>
#include <evistore/workflow/analysis_state.h>
#include <evistore/workflow/llm_client.h>

namespace evistore::workflow {

using Stage = std::function<AnalysisState(AnalysisState)>;

/**
 * Ordered list of named stages. run() threads one AnalysisState through them;
 * a stage that throws is logged and skipped, leaving the state as it was.
 */
class Pipeline {
public:
    Pipeline& addStage(std::string name, Stage stage);

    AnalysisState run(const std::string& question) const;
    AnalysisState run(AnalysisState state) const;

    std::vector<std::string> stageNames() const;

private:
    struct NamedStage {
        std::string name;
        Stage stage;
    };
    std::vector<NamedStage> stages_;
};

inline constexpr const char* kClarificationMessage =
    "I need to know what product or audience you're interested in learning about. "
    "Could you please clarify?";
inline constexpr const char* kAnalysisFailedMessage =
    "Sorry, I couldn't analyze your question. Please try again with a clearer question about a "
    "specific audience.";

namespace stages {

/// Pattern-based audience extraction; nullopt when nothing matches
std::optional<std::string> findAudience(std::string_view question);

/// Keyword routing; falls back to demographics
AnalysisCategory classifyQuestion(std::string_view question);

AnalysisState extractAudience(AnalysisState state);
AnalysisState fetchEvidence(const search::EvidenceFusion& fusion, AnalysisState state);
AnalysisState routeQuestion(AnalysisState state);
AnalysisState runAnalysis(const AgentRegistry& registry, AnalysisState state);
AnalysisState generateRecommendations(ILlmClient* llm, AnalysisState state);
AnalysisState formatOutput(AnalysisState state);

} // namespace stages

/**
 * extract_audience -> fetch_evidence -> route_question -> run_analysis ->
 * generate_recommendations -> format_output. `fusion` and `llm` may be null.
 */
Pipeline makeAnalysisPipeline(std::shared_ptr<search::EvidenceFusion> fusion,
                              std::shared_ptr<AgentRegistry> registry,
                              std::shared_ptr<ILlmClient> llm);

} // namespace evistore::workflow
