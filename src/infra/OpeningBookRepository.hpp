#pragma once

#include <QString>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "app/IOpeningBook.hpp"
#include "domain/domain_model.hpp"

namespace repdag::infra {

struct OpeningBookRow {
    std::string fen;
    std::string eco;
    std::string name;
};

// Opening names keyed by FEN. Rows are either "fen;eco;name" or an ECO
// table line "eco<TAB>name<TAB>movetext" whose moves are replayed from the
// initial position to find the FEN.
// The table is loaded on first lookup and immutable afterwards.
class OpeningBookRepository : public repdag::app::IOpeningBook {
public:
    static constexpr const char* kEmbeddedBook = ":/book/openings.tsv";

    // Empty path selects the embedded book.
    explicit OpeningBookRepository(QString path = QString());

    // Already-loaded book from in-memory rows.
    explicit OpeningBookRepository(const std::vector<OpeningBookRow>& rows);

    std::optional<repdag::domain::OpeningInfo> lookup(const std::string& fen) const override;

    // Lookup keys (exact and normalized FENs).
    std::size_t size() const;

    // Parses book text; malformed or unreplayable lines are skipped. Exposed for tests.
    static std::vector<OpeningBookRow> parseRows(const QString& text, int* skipped = nullptr);

private:
    void ensureLoaded() const;
    void insertRows(const std::vector<OpeningBookRow>& rows) const;

    QString                                                      path_;
    mutable std::once_flag                                       loaded_;
    mutable std::unordered_map<std::string, repdag::domain::OpeningInfo> byFen_;
};

} // namespace repdag::infra
