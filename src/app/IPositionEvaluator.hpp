#pragma once

#include <optional>
#include <string>

#include "domain/domain_model.hpp"

namespace repdag::app {

// Port for engine evaluations. nullopt means "no annotation"; implementations
// report their own failures and never throw.
class IPositionEvaluator {
public:
    virtual ~IPositionEvaluator() = default;

    virtual std::optional<repdag::domain::EvalResult> evaluate(const std::string& fen) = 0;
};

} // namespace repdag::app
