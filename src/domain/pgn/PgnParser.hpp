#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace repdag::domain::pgn {

struct PgnGame {
    std::map<std::string, std::string> tags; // "Event", "FEN", ...
    std::string movetext;                   // raw, may contain comments and variations

    std::optional<std::string> tag(const std::string& key) const;
};

struct PgnParseResult {
    bool ok{false};
    std::string error;
    std::vector<PgnGame> games;
};

// Splits PGN text into games. A negative maxGames reads every game.
// Movetext lines are joined with single spaces; "%" escape lines are dropped.
PgnParseResult parsePgnText(const std::string& text, int maxGames = -1);

} // namespace repdag::domain::pgn
