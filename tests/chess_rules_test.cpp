#include <gtest/gtest.h>

#include "domain/chess_rules.hpp"

namespace chess = repdag::domain::chess;
using repdag::domain::Color;

namespace {

chess::Position fromFen(const std::string& fen) {
    const auto p = chess::Position::fromFen(fen);
    EXPECT_TRUE(p.has_value()) << fen;
    return p.value_or(chess::Position::startpos());
}

std::string sanOf(const chess::Position& pos, const std::string& token) {
    const auto mv = chess::parseSan(pos, token);
    EXPECT_TRUE(mv.has_value()) << token;
    return mv ? chess::encodeSan(pos, *mv) : std::string();
}

} // namespace

TEST(ChessRules, StartPosition) {
    const auto pos = chess::Position::startpos();
    EXPECT_EQ(pos.toFen(), "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0 1");
    EXPECT_EQ(pos.legalMoves().size(), 20u);
    EXPECT_FALSE(pos.inCheck(Color::White));
}

TEST(ChessRules, FenRoundTripAndRejects) {
    const std::string fen = "r3k2r/8/8/8/8/8/8/R3K2R b Kq - 4 17";
    EXPECT_EQ(fromFen(fen).toFen(), fen);
    EXPECT_FALSE(chess::Position::fromFen("rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP w KQkq - 0 1").has_value());
    EXPECT_FALSE(chess::Position::fromFen("rnbqkbnr/pppppppp/9/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0 1").has_value());
    EXPECT_FALSE(chess::Position::fromFen("rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR x KQkq - 0 1").has_value());
    EXPECT_FALSE(chess::Position::fromFen("rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq -").has_value());
}

TEST(ChessRules, DoublePushWithoutCapturerHasNoEnPassantSquare) {
    const auto r = chess::replaySanLine({"e4"});
    ASSERT_TRUE(r.ok) << r.error;
    EXPECT_EQ(r.positions.back().toFen(), "rnbqkbnr/pppppppp/8/8/4P3/8/PPPP1PPP/RNBQKBNR b KQkq - 0 1");
}

TEST(ChessRules, EnPassantSquareAndCapture) {
    const auto r = chess::replaySanLine({"e4", "Nf6", "e5", "d5"});
    ASSERT_TRUE(r.ok) << r.error;
    const auto& pos = r.positions.back();
    EXPECT_EQ(pos.toFen(), "rnbqkb1r/ppp1pppp/5n2/3pP3/8/8/PPPP1PPP/RNBQKBNR w KQkq d6 0 3");

    const auto mv = chess::parseSan(pos, "exd6");
    ASSERT_TRUE(mv.has_value());
    EXPECT_TRUE(mv->isEnPassant);
    const auto after = chess::playMove(pos, *mv);
    ASSERT_TRUE(after.has_value());
    EXPECT_EQ(after->toFen(), "rnbqkb1r/ppp1pppp/3P1n2/8/8/8/PPPP1PPP/RNBQKBNR b KQkq - 0 3");
}

TEST(ChessRules, PinnedCapturerLeavesNoEnPassantSquare) {
    // dxe3 would expose the a4 king to the h4 rook.
    const auto pos = fromFen("8/8/8/8/k2p3R/8/4P3/4K3 w - - 0 1");
    const auto mv = chess::parseSan(pos, "e4");
    ASSERT_TRUE(mv.has_value());
    const auto after = chess::playMove(pos, *mv);
    ASSERT_TRUE(after.has_value());
    EXPECT_EQ(after->toFen(), "8/8/8/8/k2pP2R/8/8/4K3 b - - 0 1");
    for (const auto& m : after->legalMoves()) {
        EXPECT_FALSE(m.isEnPassant);
    }
}

TEST(ChessRules, CastlingAndRights) {
    const auto pos = fromFen("r3k2r/8/8/8/8/8/8/R3K2R w KQkq - 0 1");
    EXPECT_EQ(sanOf(pos, "O-O"), "O-O");
    EXPECT_EQ(sanOf(pos, "0-0-0"), "O-O-O");

    const auto after = chess::playMove(pos, *chess::parseSan(pos, "O-O"));
    ASSERT_TRUE(after.has_value());
    EXPECT_EQ(after->toFen(), "r3k2r/8/8/8/8/8/8/R4RK1 b kq - 1 1");
}

TEST(ChessRules, NoCastlingThroughAttackedSquare) {
    const auto pos = fromFen("r3k2r/8/8/8/8/8/5r2/R3K2R w KQkq - 0 1");
    EXPECT_FALSE(chess::parseSan(pos, "O-O").has_value());
    EXPECT_TRUE(chess::parseSan(pos, "O-O-O").has_value());
}

TEST(ChessRules, RookMoveDropsCastlingRight) {
    const auto pos = fromFen("r3k2r/8/8/8/8/8/8/R3K2R w KQkq - 0 1");
    const auto after = chess::playMove(pos, *chess::parseSan(pos, "Rb1"));
    ASSERT_TRUE(after.has_value());
    EXPECT_EQ(after->toFen(), "r3k2r/8/8/8/8/8/8/1R2K2R b Kkq - 1 1");
}

TEST(ChessRules, FileAndRankDisambiguation) {
    const auto byFile = fromFen("4k3/8/8/8/8/8/4K3/R6R w - - 0 1");
    EXPECT_EQ(sanOf(byFile, "Rad1"), "Rad1");
    EXPECT_FALSE(chess::parseSan(byFile, "Rd1").has_value());

    const auto byRank = fromFen("4k3/8/8/8/R7/8/4K3/R7 w - - 0 1");
    EXPECT_EQ(sanOf(byRank, "R1a3"), "R1a3");
    EXPECT_EQ(sanOf(byRank, "R4a3"), "R4a3");
}

TEST(ChessRules, CheckAndMateSuffix) {
    const auto r = chess::replaySanLine({"e4", "e5", "Bc4", "Nc6", "Qh5", "Nf6", "Qxf7"});
    ASSERT_TRUE(r.ok) << r.error;
    EXPECT_EQ(r.sans.back(), "Qxf7#");
    EXPECT_TRUE(r.positions.back().legalMoves().empty());

    const auto pos = fromFen("8/P7/8/8/8/8/8/k6K w - - 0 1");
    EXPECT_EQ(sanOf(pos, "a8=Q"), "a8=Q+");
    EXPECT_EQ(sanOf(pos, "a8=N"), "a8=N");
}

TEST(ChessRules, SanTokenDecorationsAreIgnored) {
    const auto pos = chess::Position::startpos();
    EXPECT_EQ(sanOf(pos, "Nf3!?"), "Nf3");
    EXPECT_EQ(sanOf(pos, "e4!"), "e4");
}

TEST(ChessRules, UciConversion) {
    const auto pos = chess::Position::startpos();
    const auto mv = chess::parseUci(pos, "g1f3");
    ASSERT_TRUE(mv.has_value());
    EXPECT_EQ(chess::encodeSan(pos, *mv), "Nf3");
    EXPECT_EQ(chess::encodeUci(*mv), "g1f3");
    EXPECT_FALSE(chess::parseUci(pos, "e2e5").has_value());

    const auto promo = fromFen("8/P7/8/8/8/8/8/k6K w - - 0 1");
    const auto q = chess::parseUci(promo, "a7a8q");
    ASSERT_TRUE(q.has_value());
    EXPECT_EQ(chess::encodeUci(*q), "a7a8q");
}

TEST(ChessRules, ReplayReportsFailingPly) {
    const auto r = chess::replaySanLine({"e4", "e5", "Ke3"});
    EXPECT_FALSE(r.ok);
    EXPECT_NE(r.error.find("ply 3"), std::string::npos) << r.error;
}

TEST(ChessRules, ReplayFromFen) {
    const auto r = chess::replaySanLine({"Nc6"}, std::string("rnbqkbnr/pppp1ppp/8/4p3/4P3/5N2/PPPP1PPP/RNBQKB1R b KQkq - 1 2"));
    ASSERT_TRUE(r.ok) << r.error;
    ASSERT_EQ(r.positions.size(), 2u);
    EXPECT_EQ(r.positions.back().toFen(), "r1bqkbnr/pppp1ppp/2n5/4p3/4P3/5N2/PPPP1PPP/RNBQKB1R w KQkq - 2 3");
}
