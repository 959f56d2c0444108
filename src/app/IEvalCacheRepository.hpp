#pragma once

#include <optional>
#include <string>

#include "domain/domain_model.hpp"

namespace repdag::app {

// Port for persisted evaluations keyed by FEN.
// Implementations live in infra (e.g. SQLite).
class IEvalCacheRepository {
public:
    virtual ~IEvalCacheRepository() = default;

    virtual std::optional<repdag::domain::EvalResult> load(const std::string& fen) const = 0;
    virtual bool save(const std::string& fen, const repdag::domain::EvalResult& result) = 0;
};

} // namespace repdag::app
