#include "app/OpeningDag.hpp"

#include <QDebug>
#include <algorithm>

#include "app/DagContractError.hpp"
#include "app/IOpeningBook.hpp"
#include "app/IPositionEvaluator.hpp"

namespace repdag::app {

using repdag::domain::Color;
using repdag::domain::OpeningNameProvenance;
using repdag::domain::OutputMode;
using repdag::domain::chess::Position;

OpeningDag::OpeningDag(Color repertoireColor,
                       OutputMode outputMode,
                       const IOpeningBook& book,
                       IPositionEvaluator* evaluator,
                       const Position& root)
    : repColor_(repertoireColor)
    , outputMode_(outputMode)
    , namer_(book, repertoireColor)
    , evaluator_(evaluator) {
    root_ = createNode(root);
    root_->moveNum = root.fullmove;

    const auto label = namer_.labelRoot(root_->fen);
    root_->openingName = label.name;
    root_->eco = label.eco;
    root_->provenance = OpeningNameProvenance::Direct;
}

DagNode* OpeningDag::createNode(const Position& position) {
    auto node = std::make_unique<DagNode>();
    node->nodeId = static_cast<int>(nodes_.size());
    node->fen = position.toFen();
    node->sideToMove = position.stm;

    DagNode* raw = node.get();
    nodeMap_.emplace(raw->fen, raw);
    nodes_.push_back(std::move(node));
    return raw;
}

const DagNode* OpeningDag::findNode(const std::string& fen) const {
    const auto it = nodeMap_.find(fen);
    return it == nodeMap_.end() ? nullptr : it->second;
}

DagNode* OpeningDag::upsert(DagNode* parent, const Position& position, const std::string& san) {
    const std::string fen = position.toFen();
    const auto it = nodeMap_.find(fen);

    if (!parent) {
        if (it == nodeMap_.end() || it->second != root_) {
            throw DagContractError("upsert without parent for non-root position '" + fen + "'");
        }
        return root_;
    }
    if (san.empty()) {
        throw DagContractError("upsert with empty move label for '" + fen + "'");
    }

    DagNode* linked = parent->child(san);

    if (it == nodeMap_.end()) {
        if (linked) {
            throw DagContractError("move " + san + " from '" + parent->fen + "' already leads to '" +
                                   linked->fen + "', not '" + fen + "'");
        }
        const auto label = namer_.labelChild(*parent, fen, san);

        DagNode* node = createNode(position);
        node->numParents = 1;
        node->moveNum = parent->moveNum + (node->sideToMove == Color::White ? 1 : 0);
        node->openingName = label.name;
        node->eco = label.eco;
        node->provenance = label.provenance;

        parent->children.push_back(DagEdge{san, node});
        return node;
    }

    DagNode* node = it->second;
    if (linked) {
        if (linked != node) {
            throw DagContractError("move " + san + " from '" + parent->fen + "' resolves to two positions: '" +
                                   linked->fen + "' and '" + fen + "'");
        }
        return node;
    }

    parent->children.push_back(DagEdge{san, node});
    ++node->numParents;

    // A transposition may arrive through a lineage with a more specific name.
    if (node->provenance != OpeningNameProvenance::Direct) {
        const auto label = namer_.labelChild(*parent, fen, san);
        if (label.provenance < node->provenance) {
            node->openingName = label.name;
            node->provenance = label.provenance;
        }
    }
    return node;
}

void OpeningDag::addGame(const std::vector<std::string>& moves, const std::vector<Position>& positions) {
    if (moves.size() > positions.size()) {
        throw DagContractError("game has " + std::to_string(moves.size()) + " moves but only " +
                               std::to_string(positions.size()) + " positions");
    }
    if (positions.empty()) {
        return;
    }

    DagNode* node = upsert(nullptr, positions.front(), std::string());
    const std::size_t plies = std::min(moves.size(), positions.size() - 1);
    for (std::size_t i = 0; i < plies; ++i) {
        node = upsert(node, positions[i + 1], moves[i]);
    }
}

bool OpeningDag::isCutPoint(const DagNode& node) const {
    return outputMode_ == OutputMode::Consolidated && &node != root_ && node.isBranchOrMerge();
}

MoveRun OpeningDag::runStartingAt(const DagNode& node) const {
    MoveRun run;
    run.startFen = node.fen;
    run.startTurn = node.sideToMove;
    run.startMoveNum = node.moveNum;
    run.fromRoot = (&node == root_);
    return run;
}

void OpeningDag::resetTraversal() {
    for (auto& n : nodes_) {
        n->moveRunSet.clear();
        n->childrenComputed = false;
        n->emitted = false;
    }
}

void OpeningDag::computeMoveRuns(DagNode* node, const MoveRun& run) {
    if (node->isLeaf()) {
        node->moveRunSet.add(run);
        return;
    }

    MoveRun current = run;
    if (outputMode_ == OutputMode::Consolidated && node != root_) {
        if (node->isBranchOrMerge() || node->childrenComputed) {
            node->moveRunSet.add(run);
            current = runStartingAt(*node);
        }
        // Children were already partitioned through another parent.
        if (node->childrenComputed) {
            return;
        }
    }

    for (const auto& edge : node->children) {
        computeMoveRuns(edge.node, current.extended(edge.san));
    }
    node->childrenComputed = true;
}

std::string OpeningDag::evalCommentFor(const DagNode& node) {
    if (!evaluator_) {
        return {};
    }
    const auto eval = evaluator_->evaluate(node.fen);
    if (!eval) {
        return {};
    }
    return PgnRecordWriter::formatEvalComment(*eval);
}

void OpeningDag::writeRecords(const DagNode& node, QTextStream& out, int& records) {
    const MoveRunSet& set = node.moveRunSet;
    if (set.empty()) {
        return;
    }

    PgnRecord rec;
    rec.event = node.openingName;
    rec.eco = node.eco;
    rec.evalComment = evalCommentFor(node);

    if (outputMode_ == OutputMode::Consolidated && set.allShareStart()) {
        const MoveRun& main = set.runs().front();
        rec.startFen = main.fromRoot ? std::string() : main.startFen;
        rec.body = set.toString();
        writer_.write(out, rec);
        ++records;
        return;
    }

    for (const auto& run : set.runs()) {
        rec.startFen = run.fromRoot ? std::string() : run.startFen;
        rec.body = run.toString();
        writer_.write(out, rec);
        ++records;
    }
}

void OpeningDag::emitNode(DagNode* node, QTextStream& out, int& records) {
    if (node->emitted) {
        return;
    }
    node->emitted = true;

    if (node->isLeaf()) {
        writeRecords(*node, out, records);
        return;
    }
    if (isCutPoint(*node)) {
        writeRecords(*node, out, records);
    }

    for (const auto& edge : node->children) {
        emitNode(edge.node, out, records);
    }
}

int OpeningDag::emit(QTextStream& out) {
    if (root_->isLeaf()) {
        qDebug() << "Opening DAG is empty, nothing to emit";
        return 0;
    }

    resetTraversal();
    computeMoveRuns(root_, runStartingAt(*root_));

    int records = 0;
    emitNode(root_, out, records);

    qDebug() << "Emitted" << records << "records from" << nodes_.size() << "positions in"
             << QString::fromStdString(repdag::domain::to_string(outputMode_)) << "mode";
    return records;
}

} // namespace repdag::app
