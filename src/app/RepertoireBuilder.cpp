#include "app/RepertoireBuilder.hpp"

#include <QDebug>

#include "domain/chess_rules.hpp"
#include "domain/pgn/PgnParser.hpp"
#include "domain/pgn/PgnVariations.hpp"

namespace repdag::app {

using repdag::domain::BuildConfig;
namespace chess = repdag::domain::chess;
namespace pgn = repdag::domain::pgn;

RepertoireBuilder::RepertoireBuilder(const BuildConfig& config,
                                     const IOpeningBook& book,
                                     IPositionEvaluator* evaluator)
    : config_(config)
    , dag_(config.color, config.outputMode, book, evaluator) {
    dag_.setAnnotator(config_.annotator);
}

RepertoireBuilder::LineOutcome RepertoireBuilder::ingestLine(const std::vector<std::string>& sans,
                                                             const std::optional<std::string>& startFen,
                                                             const std::string& sourceName,
                                                             const std::string& gameName,
                                                             int gameNumber,
                                                             LineKind kind) {
    auto replay = chess::replaySanLine(sans, startFen);
    if (!replay.ok) {
        qWarning().noquote() << QStringLiteral("%1 game #%2 (%3): %4, line skipped")
                                    .arg(QString::fromStdString(sourceName))
                                    .arg(gameNumber)
                                    .arg(QString::fromStdString(gameName),
                                         QString::fromStdString(replay.error));
        return LineOutcome::Skipped;
    }

    std::size_t keep = replay.sans.size();
    bool truncated = false;

    if (kind == LineKind::New) {
        if (config_.maxDepth > 0) {
            keep = 0;
            while (keep < replay.sans.size() && replay.positions[keep].fullmove <= config_.maxDepth) ++keep;
        }

        // The repertoire already answers this position; a different move ends the line.
        for (std::size_t i = 0; i < keep; ++i) {
            const auto& pos = replay.positions[i];
            if (pos.stm != config_.color) continue;
            const auto known = index_.moveFor(pos.toFen());
            if (known && known->san != replay.sans[i]) {
                qDebug().noquote() << QStringLiteral("%1 game #%2: %3 replaced by repertoire move %4 (%5 game #%6)")
                                          .arg(QString::fromStdString(sourceName))
                                          .arg(gameNumber)
                                          .arg(QString::fromStdString(replay.sans[i]),
                                               QString::fromStdString(known->san),
                                               QString::fromStdString(known->source))
                                          .arg(known->gameNumber);
                keep = i;
                truncated = true;
                break;
            }
        }
        replay.sans.resize(keep);
        replay.positions.resize(keep + 1);
    }

    for (std::size_t i = 0; i < replay.sans.size(); ++i) {
        const auto& pos = replay.positions[i];
        if (pos.stm != config_.color) continue;
        index_.record(pos.toFen(), RepertoireMove{replay.sans[i], gameName, sourceName, gameNumber, 0});
    }

    if (kind == LineKind::Existing && !config_.keepExisting) {
        return LineOutcome::Indexed;
    }
    dag_.addGame(replay.sans, replay.positions);
    return truncated ? LineOutcome::Truncated : LineOutcome::Ingested;
}

IngestStats RepertoireBuilder::ingestPgnText(const std::string& text, const std::string& sourceName, LineKind kind) {
    IngestStats stats;

    const auto parsed = pgn::parsePgnText(text);
    if (!parsed.ok) {
        qWarning().noquote() << QString::fromStdString(sourceName) << ":" << QString::fromStdString(parsed.error);
        return stats;
    }

    int gameNumber = 0;
    for (const auto& game : parsed.games) {
        ++gameNumber;
        ++stats.games;

        const std::string gameName = game.tag("Event").value_or("?");
        const auto lines = pgn::expandVariationLines(game.movetext);
        stats.lines += static_cast<int>(lines.size());

        const auto fen = game.tag("FEN");
        if (fen && *fen != dag_.root().fen) {
            qWarning().noquote() << QStringLiteral("%1 game #%2 starts from '%3', not the repertoire root, skipped")
                                        .arg(QString::fromStdString(sourceName))
                                        .arg(gameNumber)
                                        .arg(QString::fromStdString(*fen));
            stats.skipped += static_cast<int>(lines.size());
            continue;
        }

        for (const auto& line : lines) {
            switch (ingestLine(line, fen, sourceName, gameName, gameNumber, kind)) {
                case LineOutcome::Skipped:
                    ++stats.skipped;
                    break;
                case LineOutcome::Indexed:
                    break;
                case LineOutcome::Truncated:
                    ++stats.truncated;
                    ++stats.ingested;
                    break;
                case LineOutcome::Ingested:
                    ++stats.ingested;
                    break;
            }
        }
    }

    qDebug().noquote() << QStringLiteral("%1: %2 games, %3 lines, %4 ingested (%5 truncated), %6 skipped, DAG has %7 positions")
                              .arg(QString::fromStdString(sourceName))
                              .arg(stats.games)
                              .arg(stats.lines)
                              .arg(stats.ingested)
                              .arg(stats.truncated)
                              .arg(stats.skipped)
                              .arg(static_cast<qulonglong>(dag_.nodeCount()));
    return stats;
}

int RepertoireBuilder::emit(QTextStream& out) {
    if (!index_.conflicts().empty()) {
        qInfo() << static_cast<int>(index_.conflicts().size()) << "repertoire move conflicts, first move kept";
    }
    return dag_.emit(out);
}

} // namespace repdag::app
