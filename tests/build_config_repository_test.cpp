#include <gtest/gtest.h>

#include <QFile>
#include <QTemporaryDir>

#include "infra/BuildConfigRepository.hpp"

using repdag::domain::BuildConfig;
using repdag::domain::Color;
using repdag::domain::OutputMode;
using repdag::infra::BuildConfigRepository;

namespace {

void writeFile(const QString& path, const QByteArray& content) {
    QFile f(path);
    ASSERT_TRUE(f.open(QIODevice::WriteOnly | QIODevice::Truncate));
    f.write(content);
}

} // namespace

class BuildConfigRepositoryTest : public ::testing::Test {
protected:
    void SetUp() override { ASSERT_TRUE(dir.isValid()); }

    std::string path(const char* name) const { return dir.filePath(QString::fromLatin1(name)).toStdString(); }

    QTemporaryDir dir;
};

TEST_F(BuildConfigRepositoryTest, MissingFileGivesDefaults) {
    const BuildConfig cfg = BuildConfigRepository(path("absent.json")).load();
    EXPECT_FALSE(cfg.colorSet);
    EXPECT_FALSE(cfg.outputModeSet);
    EXPECT_EQ(cfg.maxDepth, 0);
    EXPECT_EQ(cfg.annotator, "repdag");
    EXPECT_TRUE(cfg.eval.enabled);
    EXPECT_TRUE(cfg.eval.cloud);
}

TEST_F(BuildConfigRepositoryTest, SaveThenLoad) {
    BuildConfig cfg;
    cfg.color = Color::Black;
    cfg.colorSet = true;
    cfg.outputMode = OutputMode::Flattened;
    cfg.outputModeSet = true;
    cfg.outputPath = "out.pgn";
    cfg.inputs = {"black.pgn"};
    cfg.lines = {"sicilian.pgn", "french.pgn"};
    cfg.keepExisting = true;
    cfg.maxDepth = 12;
    cfg.annotator = "me";
    cfg.eval.cloud = false;
    cfg.eval.timeoutMs = 2500;
    cfg.eval.cacheDbPath = "cache.sqlite";

    BuildConfigRepository repo(path("build.json"));
    ASSERT_TRUE(repo.save(cfg));

    const BuildConfig back = repo.load();
    EXPECT_EQ(back.color, Color::Black);
    EXPECT_TRUE(back.colorSet);
    EXPECT_EQ(back.outputMode, OutputMode::Flattened);
    EXPECT_EQ(back.outputPath, "out.pgn");
    EXPECT_EQ(back.inputs, cfg.inputs);
    EXPECT_EQ(back.lines, cfg.lines);
    EXPECT_TRUE(back.keepExisting);
    EXPECT_EQ(back.maxDepth, 12);
    EXPECT_EQ(back.annotator, "me");
    EXPECT_FALSE(back.eval.cloud);
    EXPECT_EQ(back.eval.timeoutMs, 2500);
    EXPECT_EQ(back.eval.cacheDbPath, "cache.sqlite");
}

TEST_F(BuildConfigRepositoryTest, InvalidJsonGivesDefaults) {
    writeFile(QString::fromStdString(path("broken.json")), "{ \"color\": ");
    const BuildConfig cfg = BuildConfigRepository(path("broken.json")).load();
    EXPECT_FALSE(cfg.colorSet);
    EXPECT_TRUE(cfg.lines.empty());
}

TEST_F(BuildConfigRepositoryTest, InvalidFieldsKeepDefaults) {
    writeFile(QString::fromStdString(path("partial.json")),
              R"({"color":"purple","format":"Consolidated","max_depth":-3,"lines":["a.pgn",7],"eval":{"timeout_ms":0}})");
    const BuildConfig cfg = BuildConfigRepository(path("partial.json")).load();
    EXPECT_FALSE(cfg.colorSet);
    EXPECT_TRUE(cfg.outputModeSet);
    EXPECT_EQ(cfg.outputMode, OutputMode::Consolidated);
    EXPECT_EQ(cfg.maxDepth, 0);
    EXPECT_EQ(cfg.lines, std::vector<std::string>{"a.pgn"});
    EXPECT_EQ(cfg.eval.timeoutMs, 5000);
}

TEST(BuildConfigParsing, ColorsAndModes) {
    EXPECT_EQ(BuildConfigRepository::parseColor(QStringLiteral("White")), Color::White);
    EXPECT_EQ(BuildConfigRepository::parseColor(QStringLiteral("w")), Color::White);
    EXPECT_EQ(BuildConfigRepository::parseColor(QStringLiteral(" BLACK ")), Color::Black);
    EXPECT_EQ(BuildConfigRepository::parseColor(QStringLiteral("b")), Color::Black);
    EXPECT_FALSE(BuildConfigRepository::parseColor(QStringLiteral("red")).has_value());

    EXPECT_EQ(BuildConfigRepository::parseOutputMode(QStringLiteral("flattened")), OutputMode::Flattened);
    EXPECT_FALSE(BuildConfigRepository::parseOutputMode(QStringLiteral("tree")).has_value());
}
