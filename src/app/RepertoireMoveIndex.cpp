#include "app/RepertoireMoveIndex.hpp"

#include <QDebug>

#include "domain/fen_utils.hpp"

namespace repdag::app {

namespace {

std::string indexKey(const std::string& fen) {
    return repdag::domain::normalizeFen(fen).value_or(fen);
}

} // namespace

bool RepertoireMoveIndex::record(const std::string& fen, RepertoireMove move) {
    const std::string key = indexKey(fen);
    const auto it = moves_.find(key);
    if (it == moves_.end()) {
        move.hits = 0;
        moves_.emplace(key, std::move(move));
        return true;
    }

    RepertoireMove& known = it->second;
    ++known.hits;
    if (known.san == move.san) {
        return true;
    }

    qWarning().noquote() << QStringLiteral("Move %1 from game %2 (%3#%4) conflicts with move %5 from game %6 (%7#%8), keeping %5")
                                .arg(QString::fromStdString(move.san),
                                     QString::fromStdString(move.gameName),
                                     QString::fromStdString(move.source))
                                .arg(move.gameNumber)
                                .arg(QString::fromStdString(known.san),
                                     QString::fromStdString(known.gameName),
                                     QString::fromStdString(known.source))
                                .arg(known.gameNumber);

    conflicts_.push_back(MoveConflict{key, known, std::move(move)});
    return false;
}

std::optional<RepertoireMove> RepertoireMoveIndex::moveFor(const std::string& fen) const {
    const auto it = moves_.find(indexKey(fen));
    if (it == moves_.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace repdag::app
