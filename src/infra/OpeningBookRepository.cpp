#include "infra/OpeningBookRepository.hpp"

#include <QDebug>
#include <QFile>
#include <QStringList>
#include <QTextStream>

#include "domain/chess_rules.hpp"
#include "domain/fen_utils.hpp"
#include "domain/pgn/PgnVariations.hpp"

// Q_INIT_RESOURCE cannot be used inside a namespace.
static void initEmbeddedBook() {
    Q_INIT_RESOURCE(book);
}

namespace repdag::infra {

using repdag::domain::OpeningInfo;

OpeningBookRepository::OpeningBookRepository(QString path)
    : path_(path.isEmpty() ? QString::fromLatin1(kEmbeddedBook) : std::move(path)) {
}

OpeningBookRepository::OpeningBookRepository(const std::vector<OpeningBookRow>& rows) {
    std::call_once(loaded_, [&]() { insertRows(rows); });
}

namespace {

// "eco<TAB>name<TAB>1. e4 e5 2. Nf3" -> row keyed by the final position.
std::optional<OpeningBookRow> rowFromMoves(const QStringList& parts) {
    const std::string eco = parts[0].trimmed().toStdString();
    const std::string name = parts[1].trimmed().toStdString();
    if (name.empty()) return std::nullopt;

    const auto tokens = repdag::domain::pgn::tokenizeMovetext(parts[2].toStdString());
    if (tokens.empty()) return std::nullopt;

    const auto replay = repdag::domain::chess::replaySanLine(tokens);
    if (!replay.ok) {
        qDebug() << "Opening book row" << parts[1].trimmed() << ":" << QString::fromStdString(replay.error);
        return std::nullopt;
    }
    return OpeningBookRow{replay.positions.back().toFen(), eco, name};
}

} // namespace

std::vector<OpeningBookRow> OpeningBookRepository::parseRows(const QString& text, int* skipped) {
    std::vector<OpeningBookRow> rows;
    int bad = 0;

    const auto lines = text.split(QLatin1Char('\n'));
    for (const auto& raw : lines) {
        const QString line = raw.trimmed();
        if (line.isEmpty() || line.startsWith(QLatin1Char('#'))) continue;

        if (line.contains(QLatin1Char('\t'))) {
            const auto parts = line.split(QLatin1Char('\t'));
            if (parts.size() == 3 && parts[0].trimmed() == QLatin1String("eco")) continue; // header
            std::optional<OpeningBookRow> row;
            if (parts.size() == 3) row = rowFromMoves(parts);
            if (!row) {
                ++bad;
                continue;
            }
            rows.push_back(*row);
            continue;
        }

        const auto parts = line.split(QLatin1Char(';'));
        if (parts.size() != 3 || parts[0].trimmed().isEmpty() || parts[2].trimmed().isEmpty()) {
            ++bad;
            continue;
        }
        rows.push_back(OpeningBookRow{parts[0].trimmed().toStdString(),
                                      parts[1].trimmed().toStdString(),
                                      parts[2].trimmed().toStdString()});
    }

    if (skipped) *skipped = bad;
    return rows;
}

void OpeningBookRepository::insertRows(const std::vector<OpeningBookRow>& rows) const {
    // Also keyed by the normalized FEN so transposed move counters still match.
    for (const auto& r : rows) {
        byFen_[r.fen] = OpeningInfo{r.eco, r.name};
        if (const auto normalized = repdag::domain::normalizeFen(r.fen)) {
            byFen_.emplace(*normalized, OpeningInfo{r.eco, r.name});
        }
    }
}

void OpeningBookRepository::ensureLoaded() const {
    std::call_once(loaded_, [this]() {
        if (path_ == QLatin1String(kEmbeddedBook)) {
            initEmbeddedBook();
        }
        QFile file(path_);
        if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
            qWarning() << "Opening book not readable, names disabled:" << path_;
            return;
        }

        QTextStream in(&file);
        int skipped = 0;
        const auto rows = parseRows(in.readAll(), &skipped);
        if (skipped > 0) {
            qWarning() << "Opening book" << path_ << ": skipped" << skipped << "malformed lines";
        }
        insertRows(rows);
        qDebug() << "Opening book loaded:" << static_cast<int>(byFen_.size()) << "positions from" << path_;
    });
}

std::optional<OpeningInfo> OpeningBookRepository::lookup(const std::string& fen) const {
    ensureLoaded();

    auto it = byFen_.find(fen);
    if (it != byFen_.end()) {
        return it->second;
    }

    const auto normalized = repdag::domain::normalizeFen(fen);
    if (normalized && *normalized != fen) {
        it = byFen_.find(*normalized);
        if (it != byFen_.end()) {
            return it->second;
        }
    }
    return std::nullopt;
}

std::size_t OpeningBookRepository::size() const {
    ensureLoaded();
    return byFen_.size();
}

} // namespace repdag::infra
