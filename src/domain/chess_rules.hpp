#pragma once

#include <array>
#include <optional>
#include <string>
#include <vector>

#include "domain/domain_model.hpp"

namespace repdag::domain::chess {

enum class Piece {
    Empty,
    WP, WN, WB, WR, WQ, WK,
    BP, BN, BB, BR, BQ, BK
};

struct Move {
    int   from{-1};
    int   to{-1};
    Piece promotion{Piece::Empty};
    bool  isCapture{false};
    bool  isEnPassant{false};
    bool  isCastleKing{false};
    bool  isCastleQueen{false};
};

bool operator==(const Move& a, const Move& b);

// Mailbox position. Squares are 0..63, a1 = 0, h8 = 63.
//
// The en-passant target is only recorded when the side to move has a legal
// en-passant capture, so toFen() is an exact position key:
// two move orders reaching the same board, rights and counters produce the
// same string.
struct Position {
    std::array<Piece, 64> board{};
    Color stm{Color::White};
    bool wK{true}, wQ{true}, bK{true}, bQ{true};
    std::optional<int> epSq;
    int halfmove{0};
    int fullmove{1};

    static Position startpos();
    static std::optional<Position> fromFen(const std::string& fen);

    std::string toFen() const;

    bool squareAttackedBy(int sq, Color by) const;
    bool inCheck(Color c) const;

    std::vector<Move> legalMoves() const;

    // Applies a move produced by legalMoves(). Returns false if the move does
    // not fit the position (no piece of the side to move on 'from').
    bool applyMove(const Move& m);

private:
    std::optional<int> kingSquare(Color c) const;
    std::vector<Move> pseudoMoves() const;
    bool castlePathLegal(Color mover, bool kingSide) const;
    // True if the side to move can legally capture onto epTarget.
    bool epCaptureLegal(int epTarget) const;
};

// Returns the position after 'm', or nullopt if it cannot be applied.
std::optional<Position> playMove(const Position& pos, const Move& m);

// Resolves a SAN token ("Nbd7", "exd6", "O-O", "e8=Q+") against the legal
// moves of 'pos'. Trailing check/annotation marks are ignored.
std::optional<Move> parseSan(const Position& pos, const std::string& token,
                             std::string* errorOut = nullptr);

// Canonical SAN with minimal disambiguation and a "+"/"#" suffix.
std::string encodeSan(const Position& pos, const Move& m);

std::optional<Move> parseUci(const Position& pos, const std::string& uci);
std::string encodeUci(const Move& m);

struct LineReplayResult {
    bool ok{false};
    std::string error;
    std::vector<std::string> sans;   // canonical SAN, one per ply
    std::vector<Position> positions; // positions.size() == sans.size() + 1
};

// Replays SAN tokens from startFen (standard initial position by default).
LineReplayResult replaySanLine(const std::vector<std::string>& sans,
                               const std::optional<std::string>& startFen = std::nullopt);

} // namespace repdag::domain::chess
