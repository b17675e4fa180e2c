#pragma once

#include <string>
#include <vector>

namespace evistore::search {

/**
 * Keyword-matched evidence source.
 * Returns rendered rows matching `query`; an empty result means no match.
 */
class IKeywordStore {
public:
    virtual ~IKeywordStore() = default;

    virtual std::vector<std::string> search(const std::string& query) = 0;
};

} // namespace evistore::search
