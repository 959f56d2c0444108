#pragma once

#include <QString>
#include <QtSql/QSqlDatabase>

#include "app/IEvalCacheRepository.hpp"
#include "domain/domain_model.hpp"

namespace repdag::infra {

// Evaluation cache in SQLite, table `evals(fen, result_json, updated_at)`.
// Rows are stored under the normalized FEN; loads try normalized, then exact.
// If the database cannot be opened every load misses.
class EvalCacheRepository : public repdag::app::IEvalCacheRepository {
public:
    explicit EvalCacheRepository(const QString& dbPath, const QString& connectionName = QStringLiteral("evalcache"));
    ~EvalCacheRepository() override;

    std::optional<repdag::domain::EvalResult> load(const std::string& fen) const override;
    bool save(const std::string& fen, const repdag::domain::EvalResult& result) override;

    bool isOpen() const { return db_.isOpen(); }

    static QString resultToJson(const repdag::domain::EvalResult& r);
    static std::optional<repdag::domain::EvalResult> resultFromJson(const QString& json);

private:
    void initSchema();
    std::optional<repdag::domain::EvalResult> loadRow(const std::string& key) const;

    QString      connName_;
    QSqlDatabase db_;
};

} // namespace repdag::infra
