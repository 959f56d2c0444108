#pragma once

#include <string>
#include <vector>

#include "app/MoveRun.hpp"
#include "domain/domain_model.hpp"

namespace repdag::app {

struct DagNode;

struct DagEdge {
    std::string san;
    DagNode*    node{nullptr};
};

// One distinct position of the opening DAG, keyed by its exact FEN.
// Nodes are owned by OpeningDag; edges are non-owning.
struct DagNode {
    int                   nodeId{0};
    std::string           fen;
    repdag::domain::Color sideToMove{repdag::domain::Color::White};
    int                   moveNum{1};

    std::vector<DagEdge> children; // insertion order
    int                  numParents{0};

    std::string                           openingName;
    repdag::domain::OpeningNameProvenance provenance{repdag::domain::OpeningNameProvenance::Direct};
    std::string                           eco;

    // Traversal state, rebuilt on every emit.
    MoveRunSet moveRunSet;
    bool       childrenComputed{false};
    bool       emitted{false};

    DagNode* child(const std::string& san) const {
        for (const auto& e : children) {
            if (e.san == san) return e.node;
        }
        return nullptr;
    }

    bool isLeaf() const noexcept { return children.empty(); }

    // Branch point or transposition target.
    bool isBranchOrMerge() const noexcept {
        return children.size() > 1 || numParents > 1;
    }
};

} // namespace repdag::app
