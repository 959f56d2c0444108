#pragma once

#include <QDateTime>
#include <QTextStream>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "app/DagNode.hpp"
#include "app/MoveRun.hpp"
#include "app/OpeningNamer.hpp"
#include "app/PgnRecordWriter.hpp"
#include "domain/chess_rules.hpp"
#include "domain/domain_model.hpp"

namespace repdag::app {

class IOpeningBook;
class IPositionEvaluator;

// Deduplicated graph of the positions reached by all ingested lines.
//
// Ingest with addGame(), then emit() partitions every root-to-leaf path into
// move runs (phase 1) and writes one record per leaf, plus one per branch or
// transposition node in Consolidated mode (phase 2).
//
// Contract violations (malformed games, inconsistent edges, broken run sets)
// throw DagContractError.
class OpeningDag {
public:
    OpeningDag(repdag::domain::Color repertoireColor,
               repdag::domain::OutputMode outputMode,
               const IOpeningBook& book,
               IPositionEvaluator* evaluator = nullptr,
               const repdag::domain::chess::Position& root = repdag::domain::chess::Position::startpos());

    OpeningDag(const OpeningDag&) = delete;
    OpeningDag& operator=(const OpeningDag&) = delete;

    // Links parent --san--> position, creating the node on first sight.
    // A null parent only resolves the root.
    DagNode* upsert(DagNode* parent, const repdag::domain::chess::Position& position, const std::string& san);

    // positions[0] must be the root; positions[i + 1] follows moves[i].
    void addGame(const std::vector<std::string>& moves,
                 const std::vector<repdag::domain::chess::Position>& positions);

    // Returns the number of records written. Repeated calls produce the same text.
    int emit(QTextStream& out);

    const DagNode& root() const noexcept { return *root_; }
    std::size_t nodeCount() const noexcept { return nodes_.size(); }
    const DagNode* findNode(const std::string& fen) const;

    repdag::domain::OutputMode outputMode() const noexcept { return outputMode_; }
    repdag::domain::Color repertoireColor() const noexcept { return repColor_; }

    void setAnnotator(std::string annotator) { writer_.setAnnotator(std::move(annotator)); }
    void setTimestamp(const QDateTime& ts) { writer_.setTimestamp(ts); }

private:
    DagNode* createNode(const repdag::domain::chess::Position& position);
    bool isCutPoint(const DagNode& node) const;
    MoveRun runStartingAt(const DagNode& node) const;

    void resetTraversal();
    void computeMoveRuns(DagNode* node, const MoveRun& run);
    void emitNode(DagNode* node, QTextStream& out, int& records);
    void writeRecords(const DagNode& node, QTextStream& out, int& records);
    std::string evalCommentFor(const DagNode& node);

    repdag::domain::Color      repColor_;
    repdag::domain::OutputMode outputMode_;
    OpeningNamer               namer_;
    IPositionEvaluator*        evaluator_;
    PgnRecordWriter            writer_;

    std::vector<std::unique_ptr<DagNode>>      nodes_;   // owns, index == nodeId
    std::unordered_map<std::string, DagNode*> nodeMap_; // exact FEN -> node
    DagNode*                                   root_{nullptr};
};

} // namespace repdag::app
