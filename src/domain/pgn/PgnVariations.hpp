#pragma once

#include <string>
#include <vector>

namespace repdag::domain::pgn {

using SanLine = std::vector<std::string>;

// Expands movetext with recursive annotation variations into independent
// SAN lines. The mainline comes first; a variation yields the moves before
// the move it replaces followed by its own moves, nested ones recursively.
// Comments, NAGs, move numbers and result markers are dropped.
std::vector<SanLine> expandVariationLines(const std::string& movetext);

// Splits movetext into move tokens, "(" and ")". Exposed for tests.
std::vector<std::string> tokenizeMovetext(const std::string& movetext);

} // namespace repdag::domain::pgn
