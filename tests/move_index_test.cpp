#include <gtest/gtest.h>

#include "app/RepertoireMoveIndex.hpp"

using repdag::app::RepertoireMove;
using repdag::app::RepertoireMoveIndex;

namespace {

const std::string kAfterE4E5 = "rnbqkbnr/pppp1ppp/8/4p3/4P3/8/PPPP1PPP/RNBQKBNR w KQkq - 0 2";

RepertoireMove move(const std::string& san, int gameNumber) {
    return RepertoireMove{san, "Game " + std::to_string(gameNumber), "rep.pgn", gameNumber, 0};
}

} // namespace

TEST(RepertoireMoveIndex, FirstMoveIsRecorded) {
    RepertoireMoveIndex index;
    EXPECT_TRUE(index.record(kAfterE4E5, move("Nf3", 1)));
    EXPECT_EQ(index.size(), 1u);

    const auto m = index.moveFor(kAfterE4E5);
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->san, "Nf3");
    EXPECT_EQ(m->gameNumber, 1);
    EXPECT_EQ(m->hits, 0);
    EXPECT_FALSE(index.moveFor("8/8/8/8/8/8/8/K6k w - - 0 1").has_value());
}

TEST(RepertoireMoveIndex, RepeatsCountHitsAcrossCounters) {
    RepertoireMoveIndex index;
    index.record(kAfterE4E5, move("Nf3", 1));
    EXPECT_TRUE(index.record("rnbqkbnr/pppp1ppp/8/4p3/4P3/8/PPPP1PPP/RNBQKBNR w KQkq - 4 4", move("Nf3", 2)));

    EXPECT_EQ(index.size(), 1u);
    EXPECT_EQ(index.moveFor(kAfterE4E5)->hits, 1);
    EXPECT_TRUE(index.conflicts().empty());
}

TEST(RepertoireMoveIndex, ConflictKeepsFirstMove) {
    RepertoireMoveIndex index;
    index.record(kAfterE4E5, move("Nf3", 1));
    EXPECT_FALSE(index.record(kAfterE4E5, move("Bc4", 7)));

    EXPECT_EQ(index.moveFor(kAfterE4E5)->san, "Nf3");
    ASSERT_EQ(index.conflicts().size(), 1u);
    const auto& c = index.conflicts().front();
    EXPECT_EQ(c.normalizedFen, "rnbqkbnr/pppp1ppp/8/4p3/4P3/8/PPPP1PPP/RNBQKBNR w KQkq - 0 1");
    EXPECT_EQ(c.existing.san, "Nf3");
    EXPECT_EQ(c.incoming.san, "Bc4");
    EXPECT_EQ(c.incoming.gameNumber, 7);
}
