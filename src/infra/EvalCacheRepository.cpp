#include "infra/EvalCacheRepository.hpp"

#include <QDateTime>
#include <QDebug>
#include <QJsonDocument>
#include <QJsonObject>
#include <QVariant>
#include <QtSql/QSqlError>
#include <QtSql/QSqlQuery>

#include "domain/fen_utils.hpp"

namespace repdag::infra {

using repdag::domain::EvalResult;
using repdag::domain::ScoreType;

EvalCacheRepository::EvalCacheRepository(const QString& dbPath, const QString& connectionName)
    : connName_(connectionName) {
    if (QSqlDatabase::contains(connName_)) {
        db_ = QSqlDatabase::database(connName_);
    } else {
        db_ = QSqlDatabase::addDatabase(QStringLiteral("QSQLITE"), connName_);
        db_.setDatabaseName(dbPath);
    }

    if (!db_.open()) {
        qWarning() << "Failed to open eval cache DB:" << db_.lastError().text();
        return;
    }

    initSchema();
}

EvalCacheRepository::~EvalCacheRepository() {
    db_.close();
    db_ = QSqlDatabase();
    QSqlDatabase::removeDatabase(connName_);
}

void EvalCacheRepository::initSchema() {
    QSqlQuery q(db_);
    if (!q.exec("CREATE TABLE IF NOT EXISTS evals ("
                "fen TEXT PRIMARY KEY,"
                "result_json TEXT,"
                "updated_at INTEGER)")) {
        qWarning() << "Failed to create eval cache schema:" << q.lastError().text();
        db_.close();
    }
}

QString EvalCacheRepository::resultToJson(const EvalResult& r) {
    QJsonObject o;
    if (r.score.type == ScoreType::Cp) {
        o.insert(QStringLiteral("score_cp"), r.score.value);
    } else if (r.score.type == ScoreType::Mate) {
        o.insert(QStringLiteral("score_mate"), r.score.value);
    }
    if (!r.bestMove.empty()) o.insert(QStringLiteral("bestmove"), QString::fromStdString(r.bestMove));
    if (r.depth > 0)         o.insert(QStringLiteral("depth"), r.depth);
    return QString::fromUtf8(QJsonDocument(o).toJson(QJsonDocument::Compact));
}

std::optional<EvalResult> EvalCacheRepository::resultFromJson(const QString& json) {
    QJsonParseError err{};
    const auto doc = QJsonDocument::fromJson(json.toUtf8(), &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject()) {
        return std::nullopt;
    }

    const auto o = doc.object();
    EvalResult r;
    if (o.contains(QStringLiteral("score_mate"))) {
        r.score.type = ScoreType::Mate;
        r.score.value = o.value(QStringLiteral("score_mate")).toInt();
    } else if (o.contains(QStringLiteral("score_cp"))) {
        r.score.type = ScoreType::Cp;
        r.score.value = o.value(QStringLiteral("score_cp")).toInt();
    } else {
        return std::nullopt;
    }
    r.bestMove = o.value(QStringLiteral("bestmove")).toString().toStdString();
    r.depth = o.value(QStringLiteral("depth")).toInt(0);
    r.source = "local cache";
    return r;
}

std::optional<EvalResult> EvalCacheRepository::loadRow(const std::string& key) const {
    QSqlQuery q(db_);
    q.prepare("SELECT result_json FROM evals WHERE fen = ?");
    q.addBindValue(QString::fromStdString(key));
    if (!q.exec()) {
        qWarning() << "Eval cache query failed:" << q.lastError().text();
        return std::nullopt;
    }
    if (!q.next()) {
        return std::nullopt;
    }
    return resultFromJson(q.value(0).toString());
}

std::optional<EvalResult> EvalCacheRepository::load(const std::string& fen) const {
    if (!db_.isOpen()) {
        return std::nullopt;
    }

    const auto normalized = repdag::domain::normalizeFen(fen);
    if (normalized) {
        if (auto hit = loadRow(*normalized)) return hit;
        if (*normalized == fen) return std::nullopt;
    }
    return loadRow(fen);
}

bool EvalCacheRepository::save(const std::string& fen, const EvalResult& result) {
    if (!db_.isOpen()) {
        return false;
    }

    const std::string key = repdag::domain::normalizeFen(fen).value_or(fen);

    QSqlQuery q(db_);
    q.prepare("INSERT OR REPLACE INTO evals (fen, result_json, updated_at) VALUES (?, ?, ?)");
    q.addBindValue(QString::fromStdString(key));
    q.addBindValue(resultToJson(result));
    q.addBindValue(QVariant(QDateTime::currentMSecsSinceEpoch()));
    if (!q.exec()) {
        qWarning() << "Failed to save evaluation:" << q.lastError().text();
        return false;
    }
    return true;
}

} // namespace repdag::infra
