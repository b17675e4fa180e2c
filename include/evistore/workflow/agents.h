#pragma once

#include <map>
#include <memory>
#include <string>
#include <evistore/core/types.h>
#include <evistore/workflow/analysis_state.h>
#include <evistore/workflow/llm_client.h>

namespace evistore::workflow {

class IAnalysisAgent {
public:
    virtual ~IAnalysisAgent() = default;

    /// Requires state.audience; uses state.evidence as grounding
    virtual Result<AnalysisResult> analyze(const AnalysisState& state) = 0;
    virtual AnalysisCategory category() const = 0;
};

/**
 * Builds the category prompt from audience, question and numbered evidence and
 * sends it to the LLM client. Without a client the prompt itself is returned as
 * a dry-run result.
 */
class PromptAgent : public IAnalysisAgent {
public:
    PromptAgent(AnalysisCategory category, std::shared_ptr<ILlmClient> llm);

    Result<AnalysisResult> analyze(const AnalysisState& state) override;
    AnalysisCategory category() const override { return category_; }

    std::string buildPrompt(const AnalysisState& state) const;

private:
    AnalysisCategory category_;
    std::shared_ptr<ILlmClient> llm_;
};

/// Category -> agent table handed explicitly to the pipeline
class AgentRegistry {
public:
    void registerAgent(std::shared_ptr<IAnalysisAgent> agent);
    IAnalysisAgent* find(AnalysisCategory category) const;
    size_t size() const { return agents_.size(); }

private:
    std::map<AnalysisCategory, std::shared_ptr<IAnalysisAgent>> agents_;
};

/// One PromptAgent per category, all sharing `llm` (may be null for dry runs)
AgentRegistry makeDefaultRegistry(std::shared_ptr<ILlmClient> llm);

/// Instruction text for a category's analysis prompt
const char* analysisInstructions(AnalysisCategory category);

} // namespace evistore::workflow
