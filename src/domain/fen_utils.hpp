#pragma once

#include <optional>
#include <string>
#include <vector>

#include "domain/domain_model.hpp"

namespace repdag::domain {

// Splits a FEN on single spaces. Returns an empty vector for an empty string.
std::vector<std::string> splitFenFields(const std::string& fen);

// Zeroes the halfmove clock and resets the fullmove number to 1.
// Board, side to move, castling rights and en-passant square pass through unchanged.
// Returns nullopt unless the input has exactly 6 space-separated fields.
std::optional<std::string> normalizeFen(const std::string& fen);

std::optional<Color> sideToMoveFromFen(const std::string& fen);

} // namespace repdag::domain
