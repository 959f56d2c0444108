#include "app/OpeningNamer.hpp"

namespace repdag::app {

using repdag::domain::Color;
using repdag::domain::OpeningNameProvenance;

OpeningNamer::OpeningNamer(const IOpeningBook& book, Color repertoireColor)
    : book_(book)
    , repColor_(repertoireColor) {
}

std::string OpeningNamer::moveNumberPrefix(const DagNode& node) {
    return std::to_string(node.moveNum) + (node.sideToMove == Color::White ? "." : "...");
}

OpeningLabel OpeningNamer::labelRoot(const std::string& fen) const {
    OpeningLabel out;
    if (const auto hit = book_.lookup(fen)) {
        out.name = hit->name;
        out.eco = hit->eco;
    }
    return out;
}

OpeningLabel OpeningNamer::labelChild(const DagNode& parent, const std::string& fen, const std::string& san) const {
    OpeningLabel out;
    if (const auto hit = book_.lookup(fen)) {
        out.name = hit->name;
        out.eco = hit->eco;
        out.provenance = OpeningNameProvenance::Direct;
        return out;
    }

    out.eco = parent.eco;

    // Only one move suffix per name.
    if (parent.provenance != OpeningNameProvenance::Direct) {
        out.name = parent.openingName;
        out.provenance = OpeningNameProvenance::FromAncestor;
        return out;
    }

    if (parent.sideToMove != repColor_) {
        out.name = parent.openingName;
        out.provenance = OpeningNameProvenance::Direct;
        return out;
    }

    const std::string suffix = moveNumberPrefix(parent) + " " + san;
    out.name = parent.openingName.empty() ? suffix : parent.openingName + ", " + suffix;
    out.provenance = OpeningNameProvenance::FromParent;
    return out;
}

} // namespace repdag::app
