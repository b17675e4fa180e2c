#pragma once

#include <string>
#include <evistore/core/types.h>

namespace evistore::workflow {

/**
 * Text completion backend. No implementation ships; callers inject their own.
 */
class ILlmClient {
public:
    virtual ~ILlmClient() = default;

    virtual Result<std::string> complete(const std::string& prompt) = 0;
};

} // namespace evistore::workflow
