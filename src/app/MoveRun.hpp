#pragma once

#include <string>
#include <vector>

#include "domain/domain_model.hpp"

namespace repdag::app {

// An unbranched sequence of SAN moves played from a fixed start position.
// fromRoot marks runs that start at the DAG root; those records carry no
// FEN/SetUp tags.
struct MoveRun {
    std::vector<std::string> moves;
    std::string              startFen;
    repdag::domain::Color    startTurn{repdag::domain::Color::White};
    int                      startMoveNum{1};
    bool                     fromRoot{false};

    // Copy with one more move appended.
    MoveRun extended(const std::string& san) const;

    // "1. e4 e5 2. Nf3", or "3... Nc6 4. Bb5" when Black moves first.
    std::string toString() const;
};

// Alternative runs recorded at one node, in discovery order.
class MoveRunSet {
public:
    void add(MoveRun run);
    void clear() { runs_.clear(); }

    const std::vector<MoveRun>& runs() const noexcept { return runs_; }
    bool empty() const noexcept { return runs_.empty(); }
    std::size_t size() const noexcept { return runs_.size(); }

    // True when every run starts from the same normalized FEN.
    bool allShareStart() const;

    // Main run with the others nested as variations after its first move:
    //   "1. e4 (1. d4 d5) 1... e5"
    // Throws DagContractError if the runs differ in start turn, move number,
    // normalized start FEN or length.
    std::string toString() const;

private:
    void checkInvariant() const;

    std::vector<MoveRun> runs_;
};

} // namespace repdag::app
