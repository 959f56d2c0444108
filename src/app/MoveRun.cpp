#include "app/MoveRun.hpp"

#include "app/DagContractError.hpp"
#include "domain/fen_utils.hpp"

namespace repdag::app {

using repdag::domain::Color;
using repdag::domain::opposite;

namespace {

std::string startKey(const MoveRun& run) {
    return repdag::domain::normalizeFen(run.startFen).value_or(run.startFen);
}

} // namespace

MoveRun MoveRun::extended(const std::string& san) const {
    MoveRun out = *this;
    out.moves.push_back(san);
    return out;
}

std::string MoveRun::toString() const {
    std::string out;
    Color turn = startTurn;
    int moveNum = startMoveNum;

    for (std::size_t i = 0; i < moves.size(); ++i) {
        if (turn == Color::White) {
            if (i > 0) out.push_back(' ');
            out += std::to_string(moveNum) + ". " + moves[i];
        } else {
            if (i == 0) out += std::to_string(moveNum) + "... " + moves[i];
            else out += " " + moves[i];
            ++moveNum;
        }
        turn = opposite(turn);
    }
    return out;
}

void MoveRunSet::add(MoveRun run) {
    runs_.push_back(std::move(run));
}

bool MoveRunSet::allShareStart() const {
    if (runs_.empty()) {
        return true;
    }
    const std::string first = startKey(runs_.front());
    for (const auto& r : runs_) {
        if (startKey(r) != first) return false;
    }
    return true;
}

void MoveRunSet::checkInvariant() const {
    const MoveRun& main = runs_.front();
    const std::string mainKey = startKey(main);
    if (main.moves.empty()) {
        throw DagContractError("MoveRunSet: empty run among " + std::to_string(runs_.size()) + " alternatives");
    }

    for (std::size_t i = 1; i < runs_.size(); ++i) {
        const MoveRun& r = runs_[i];
        if (startKey(r) != mainKey) {
            throw DagContractError("MoveRunSet: start FEN mismatch '" + r.startFen + "' vs '" + main.startFen + "'");
        }
        if (r.startTurn != main.startTurn) {
            throw DagContractError("MoveRunSet: start turn mismatch at '" + main.startFen + "'");
        }
        if (r.startMoveNum != main.startMoveNum) {
            throw DagContractError("MoveRunSet: move number mismatch " + std::to_string(r.startMoveNum) +
                                   " vs " + std::to_string(main.startMoveNum));
        }
        if (r.moves.size() != main.moves.size()) {
            throw DagContractError("MoveRunSet: run length mismatch " + std::to_string(r.moves.size()) +
                                   " vs " + std::to_string(main.moves.size()));
        }
    }
}

std::string MoveRunSet::toString() const {
    if (runs_.empty()) {
        return {};
    }
    if (runs_.size() == 1) {
        return runs_.front().toString();
    }

    checkInvariant();

    const MoveRun& main = runs_.front();
    std::string out = std::to_string(main.startMoveNum) +
                      (main.startTurn == Color::White ? ". " : "... ") + main.moves.front();

    for (std::size_t i = 1; i < runs_.size(); ++i) {
        out += " (" + runs_[i].toString() + ")";
    }

    MoveRun rest;
    rest.moves.assign(main.moves.begin() + 1, main.moves.end());
    rest.startTurn = opposite(main.startTurn);
    rest.startMoveNum = main.startMoveNum + (rest.startTurn == Color::White ? 1 : 0);
    if (!rest.moves.empty()) {
        out += " " + rest.toString();
    }
    return out;
}

} // namespace repdag::app
