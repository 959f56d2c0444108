#pragma once

#include "app/IEvalCacheRepository.hpp"
#include "app/IPositionEvaluator.hpp"

namespace repdag::app {

// Consults the local cache and the remote evaluator (if any) and returns the
// deeper result, preferring the local one on equal depth. A remote result that
// wins is written back to the cache.
class CachedEvaluator : public IPositionEvaluator {
public:
    CachedEvaluator(IEvalCacheRepository* cache, IPositionEvaluator* remote);

    std::optional<repdag::domain::EvalResult> evaluate(const std::string& fen) override;

    int cacheHits() const noexcept { return cacheHits_; }
    int remoteHits() const noexcept { return remoteHits_; }
    int misses() const noexcept { return misses_; }

private:
    IEvalCacheRepository* cache_;
    IPositionEvaluator*   remote_;
    int                   cacheHits_{0};
    int                   remoteHits_{0};
    int                   misses_{0};
};

} // namespace repdag::app
