#pragma once

#include <QTextStream>
#include <optional>
#include <string>
#include <vector>

#include "app/OpeningDag.hpp"
#include "app/RepertoireMoveIndex.hpp"
#include "domain/domain_model.hpp"

namespace repdag::app {

class IOpeningBook;
class IPositionEvaluator;

enum class LineKind {
    Existing, // current repertoire file; enters the DAG only with keepExisting
    New       // newly built lines; truncated at maxDepth
};

struct IngestStats {
    int games{0};
    int lines{0};    // after variation expansion
    int ingested{0};  // added to the DAG
    int skipped{0};   // unreplayable or foreign start position
    int truncated{0}; // new lines cut where they leave the recorded repertoire move
};

// Feeds PGN files through the rules engine into the move index and the DAG.
class RepertoireBuilder {
public:
    RepertoireBuilder(const repdag::domain::BuildConfig& config,
                      const IOpeningBook& book,
                      IPositionEvaluator* evaluator = nullptr);

    IngestStats ingestPgnText(const std::string& text, const std::string& sourceName, LineKind kind);

    int emit(QTextStream& out);

    OpeningDag& dag() noexcept { return dag_; }
    const OpeningDag& dag() const noexcept { return dag_; }
    const RepertoireMoveIndex& moveIndex() const noexcept { return index_; }

private:
    enum class LineOutcome {
        Skipped,
        Indexed,   // existing line kept out of the DAG
        Ingested,
        Truncated  // ingested up to the first contradicting repertoire move
    };

    LineOutcome ingestLine(const std::vector<std::string>& sans,
                    const std::optional<std::string>& startFen,
                    const std::string& sourceName,
                    const std::string& gameName,
                    int gameNumber,
                    LineKind kind);

    repdag::domain::BuildConfig config_;
    RepertoireMoveIndex         index_;
    OpeningDag                  dag_;
};

} // namespace repdag::app
