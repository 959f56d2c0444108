#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace repdag::app {

struct RepertoireMove {
    std::string san;
    std::string gameName;   // Event tag, "?" when absent
    std::string source;     // PGN file name
    int         gameNumber{0};
    int         hits{0};    // later sightings of the same position
};

struct MoveConflict {
    std::string    normalizedFen;
    RepertoireMove existing;
    RepertoireMove incoming;
};

// The repertoire side's chosen move per normalized FEN. The first move seen
// for a position wins; a different later move is kept as a conflict.
class RepertoireMoveIndex {
public:
    // Returns false when 'move' conflicts with the recorded one.
    bool record(const std::string& fen, RepertoireMove move);

    std::optional<RepertoireMove> moveFor(const std::string& fen) const;

    const std::vector<MoveConflict>& conflicts() const noexcept { return conflicts_; }
    std::size_t size() const noexcept { return moves_.size(); }

private:
    std::unordered_map<std::string, RepertoireMove> moves_;
    std::vector<MoveConflict>                       conflicts_;
};

} // namespace repdag::app
