#pragma once

#include <stdexcept>
#include <string>

namespace repdag::app {

// Thrown when the DAG is fed inconsistent data (a malformed game, a
// parent/move pair resolving to two positions, a broken move-run set).
// Not meant to be caught inside the engine: continuing would corrupt output.
class DagContractError : public std::logic_error {
public:
    explicit DagContractError(const std::string& what)
        : std::logic_error(what) {
    }
};

} // namespace repdag::app
