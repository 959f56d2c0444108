#include <gtest/gtest.h>

#include "app/RepertoireBuilder.hpp"
#include "test_support.hpp"

using repdag::app::LineKind;
using repdag::app::RepertoireBuilder;
using repdag::domain::BuildConfig;
using repdag::domain::Color;
using repdag::domain::OutputMode;
using repdag::test::FakeOpeningBook;
using repdag::test::fenAfter;

namespace {

constexpr const char* kItalian =
    "[Event \"Italian\"]\n"
    "[Result \"*\"]\n"
    "\n"
    "1. e4 e5 2. Nf3 (2. Bc4 Nf6) 2... Nc6 3. Bc4 *\n";

BuildConfig whiteConfig() {
    BuildConfig cfg;
    cfg.color = Color::White;
    cfg.colorSet = true;
    cfg.outputMode = OutputMode::Consolidated;
    cfg.outputModeSet = true;
    return cfg;
}

} // namespace

class RepertoireBuilderTest : public ::testing::Test {
protected:
    FakeOpeningBook book;
};

TEST_F(RepertoireBuilderTest, NewLinesExpandVariations) {
    RepertoireBuilder builder(whiteConfig(), book);
    const auto stats = builder.ingestPgnText(kItalian, "lines.pgn", LineKind::New);

    EXPECT_EQ(stats.games, 1);
    EXPECT_EQ(stats.lines, 2);
    EXPECT_EQ(stats.ingested, 2);
    EXPECT_EQ(stats.skipped, 0);

    // 2. Bc4 leaves the mainline's 2. Nf3, so the variation stops after 1... e5.
    EXPECT_EQ(stats.truncated, 1);
    EXPECT_EQ(builder.dag().nodeCount(), 6u);
    EXPECT_EQ(builder.dag().findNode(fenAfter({"e4", "e5", "Bc4"})), nullptr);
    EXPECT_TRUE(builder.moveIndex().conflicts().empty());
}

TEST_F(RepertoireBuilderTest, ExistingRepertoireMoveWins) {
    RepertoireBuilder builder(whiteConfig(), book);
    builder.ingestPgnText("[Event \"Current\"]\n\n1. e4 e5 2. Nf3 *\n", "current.pgn", LineKind::Existing);
    const auto stats = builder.ingestPgnText(
        "[Event \"Vienna\"]\n\n1. e4 e5 2. Nc3 Nf6 3. f4 *\n\n[Event \"Petrov\"]\n\n1. e4 e5 2. Nf3 Nf6 3. Nxe5 *\n",
        "lines.pgn", LineKind::New);

    EXPECT_EQ(stats.ingested, 2);
    EXPECT_EQ(stats.truncated, 1);
    EXPECT_EQ(builder.dag().findNode(fenAfter({"e4", "e5", "Nc3"})), nullptr);
    EXPECT_NE(builder.dag().findNode(fenAfter({"e4", "e5", "Nf3", "Nf6", "Nxe5"})), nullptr);
    EXPECT_EQ(builder.moveIndex().moveFor(fenAfter({"e4", "e5"}))->source, "current.pgn");
    EXPECT_TRUE(builder.moveIndex().conflicts().empty());
}

TEST_F(RepertoireBuilderTest, ExistingConflictsAreRecorded) {
    RepertoireBuilder builder(whiteConfig(), book);
    builder.ingestPgnText(kItalian, "current.pgn", LineKind::Existing);

    const auto& index = builder.moveIndex();
    EXPECT_EQ(index.size(), 3u);
    EXPECT_EQ(index.moveFor(fenAfter({"e4", "e5"}))->san, "Nf3");
    EXPECT_EQ(index.moveFor(fenAfter({"e4", "e5", "Nf3", "Nc6"}))->san, "Bc4");

    ASSERT_EQ(index.conflicts().size(), 1u);
    EXPECT_EQ(index.conflicts().front().incoming.san, "Bc4");
    EXPECT_EQ(index.conflicts().front().incoming.gameName, "Italian");
}

TEST_F(RepertoireBuilderTest, ForeignStartPositionIsSkipped) {
    RepertoireBuilder builder(whiteConfig(), book);
    const auto stats = builder.ingestPgnText(
        "[Event \"Endgame\"]\n[FEN \"8/8/8/8/8/8/8/K6k w - - 0 1\"]\n[SetUp \"1\"]\n\n1. Kb1 *\n",
        "endgames.pgn", LineKind::New);

    EXPECT_EQ(stats.games, 1);
    EXPECT_EQ(stats.lines, 1);
    EXPECT_EQ(stats.ingested, 0);
    EXPECT_EQ(stats.skipped, 1);
    EXPECT_EQ(builder.dag().nodeCount(), 1u);
}

TEST_F(RepertoireBuilderTest, IllegalLineIsSkipped) {
    RepertoireBuilder builder(whiteConfig(), book);
    const auto stats = builder.ingestPgnText(
        "[Event \"Broken\"]\n\n1. e4 e5 2. Ke3 *\n\n[Event \"Fine\"]\n\n1. d4 d5 *\n",
        "mixed.pgn", LineKind::New);

    EXPECT_EQ(stats.games, 2);
    EXPECT_EQ(stats.skipped, 1);
    EXPECT_EQ(stats.ingested, 1);
    EXPECT_EQ(builder.dag().findNode(fenAfter({"e4"})), nullptr);
    EXPECT_NE(builder.dag().findNode(fenAfter({"d4", "d5"})), nullptr);
}

TEST_F(RepertoireBuilderTest, ExistingLinesOnlyFillTheIndex) {
    RepertoireBuilder builder(whiteConfig(), book);
    const auto stats = builder.ingestPgnText(kItalian, "current.pgn", LineKind::Existing);

    EXPECT_EQ(stats.lines, 2);
    EXPECT_EQ(stats.ingested, 0);
    EXPECT_EQ(builder.dag().nodeCount(), 1u);
    EXPECT_EQ(builder.moveIndex().size(), 3u);
}

TEST_F(RepertoireBuilderTest, KeepExistingMergesIntoTheDag) {
    auto cfg = whiteConfig();
    cfg.keepExisting = true;
    RepertoireBuilder builder(cfg, book);
    const auto existing = builder.ingestPgnText(kItalian, "current.pgn", LineKind::Existing);
    EXPECT_EQ(existing.ingested, 2);
    EXPECT_EQ(builder.dag().nodeCount(), 8u);

    builder.ingestPgnText("[Event \"Philidor\"]\n\n1. e4 e5 2. Nf3 d6 3. d4 *\n", "lines.pgn", LineKind::New);

    EXPECT_EQ(builder.dag().nodeCount(), 10u);
    const auto* afterNf3 = builder.dag().findNode(fenAfter({"e4", "e5", "Nf3"}));
    ASSERT_NE(afterNf3, nullptr);
    EXPECT_EQ(afterNf3->children.size(), 2u);
}

TEST_F(RepertoireBuilderTest, MaxDepthTruncatesNewLines) {
    auto cfg = whiteConfig();
    cfg.maxDepth = 1;
    RepertoireBuilder builder(cfg, book);
    builder.ingestPgnText("[Event \"Ruy\"]\n\n1. e4 e5 2. Nf3 Nc6 3. Bb5 *\n", "lines.pgn", LineKind::New);

    EXPECT_EQ(builder.dag().nodeCount(), 3u);
    EXPECT_NE(builder.dag().findNode(fenAfter({"e4", "e5"})), nullptr);
    EXPECT_EQ(builder.dag().findNode(fenAfter({"e4", "e5", "Nf3"})), nullptr);
}

TEST_F(RepertoireBuilderTest, EmitWritesRecords) {
    RepertoireBuilder builder(whiteConfig(), book);
    builder.ingestPgnText("[Event \"Scotch\"]\n\n1. e4 e5 2. Nf3 Nc6 3. d4 *\n", "lines.pgn", LineKind::New);

    QString text;
    QTextStream out(&text);
    const int records = builder.emit(out);
    out.flush();

    EXPECT_EQ(records, 1);
    EXPECT_NE(text.indexOf(QStringLiteral("1. e4 e5 2. Nf3 Nc6 3. d4 *")), -1);
    EXPECT_NE(text.indexOf(QStringLiteral("[Annotator \"repdag\"]")), -1);
}
