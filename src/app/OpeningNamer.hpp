#pragma once

#include <string>

#include "app/DagNode.hpp"
#include "app/IOpeningBook.hpp"
#include "domain/domain_model.hpp"

namespace repdag::app {

struct OpeningLabel {
    std::string                           name;
    std::string                           eco;
    repdag::domain::OpeningNameProvenance provenance{repdag::domain::OpeningNameProvenance::Direct};
};

// Names positions from the book, or derives a name from the parent:
//  - book hit: book name, Direct;
//  - parent already carries a suffix: parent name, FromAncestor;
//  - move by the side opposite to the repertoire: parent name, Direct;
//  - off-book repertoire move: "<parent>, 3. h3" or "<parent>, 3... h6", FromParent.
// ECO is the book's or the parent's, never suffixed.
class OpeningNamer {
public:
    OpeningNamer(const IOpeningBook& book, repdag::domain::Color repertoireColor);

    OpeningLabel labelRoot(const std::string& fen) const;
    OpeningLabel labelChild(const DagNode& parent, const std::string& fen, const std::string& san) const;

    // "3." for White to move, "3..." for Black.
    static std::string moveNumberPrefix(const DagNode& node);

private:
    const IOpeningBook&   book_;
    repdag::domain::Color repColor_;
};

} // namespace repdag::app
