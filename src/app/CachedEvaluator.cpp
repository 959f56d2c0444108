#include "app/CachedEvaluator.hpp"

#include <QDebug>

namespace repdag::app {

using repdag::domain::EvalResult;

CachedEvaluator::CachedEvaluator(IEvalCacheRepository* cache, IPositionEvaluator* remote)
    : cache_(cache)
    , remote_(remote) {
}

std::optional<EvalResult> CachedEvaluator::evaluate(const std::string& fen) {
    std::optional<EvalResult> local;
    if (cache_) {
        local = cache_->load(fen);
    }

    std::optional<EvalResult> cloud;
    if (remote_) {
        cloud = remote_->evaluate(fen);
    }

    // The deeper search wins; the local result on a tie.
    if (local && (!cloud || local->depth >= cloud->depth)) {
        ++cacheHits_;
        return local;
    }

    if (cloud) {
        ++remoteHits_;
        if (cache_ && !cache_->save(fen, *cloud)) {
            qDebug() << "Could not cache evaluation for" << QString::fromStdString(fen);
        }
        return cloud;
    }

    ++misses_;
    qDebug() << "No evaluation for" << QString::fromStdString(fen);
    return std::nullopt;
}

} // namespace repdag::app
