#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace evistore::workflow {

/// Outermost {...} span of a model response parsed as JSON; empty object if none parses
nlohmann::json extractJson(std::string_view response);

/// Response text with a trailing ```json fence or raw JSON object removed, trimmed
std::string formatResponse(std::string_view response);

/**
 * Lines starting with "•" or "-" (after trimming). When there are none the
 * whole trimmed response becomes a single "• " bullet; an empty response gives
 * no bullets.
 */
std::vector<std::string> extractBullets(std::string_view response);

} // namespace evistore::workflow
