#pragma once

#include <gmock/gmock.h>

#include <QString>
#include <QTextStream>
#include <map>
#include <string>
#include <vector>

#include "app/IEvalCacheRepository.hpp"
#include "app/IOpeningBook.hpp"
#include "app/IPositionEvaluator.hpp"
#include "app/OpeningDag.hpp"
#include "domain/chess_rules.hpp"
#include "domain/fen_utils.hpp"

namespace repdag::test {

// Book keyed by normalized FEN, filled by replaying SAN lines.
class FakeOpeningBook : public repdag::app::IOpeningBook {
public:
    void add(const std::string& fen, const std::string& eco, const std::string& name) {
        entries_[repdag::domain::normalizeFen(fen).value_or(fen)] = repdag::domain::OpeningInfo{eco, name};
    }

    std::optional<repdag::domain::OpeningInfo> lookup(const std::string& fen) const override {
        const auto it = entries_.find(repdag::domain::normalizeFen(fen).value_or(fen));
        if (it == entries_.end()) return std::nullopt;
        return it->second;
    }

private:
    std::map<std::string, repdag::domain::OpeningInfo> entries_;
};

class MockEvaluator : public repdag::app::IPositionEvaluator {
public:
    MOCK_METHOD(std::optional<repdag::domain::EvalResult>, evaluate, (const std::string& fen), (override));
};

class MockEvalCache : public repdag::app::IEvalCacheRepository {
public:
    MOCK_METHOD(std::optional<repdag::domain::EvalResult>, load, (const std::string& fen), (const, override));
    MOCK_METHOD(bool, save, (const std::string& fen, const repdag::domain::EvalResult& result), (override));
};

inline repdag::domain::chess::LineReplayResult replay(const std::vector<std::string>& sans) {
    auto r = repdag::domain::chess::replaySanLine(sans);
    EXPECT_TRUE(r.ok) << r.error;
    return r;
}

inline std::string fenAfter(const std::vector<std::string>& sans) {
    return replay(sans).positions.back().toFen();
}

inline void addLine(repdag::app::OpeningDag& dag, const std::vector<std::string>& sans) {
    const auto r = replay(sans);
    dag.addGame(r.sans, r.positions);
}

inline std::string emitToString(repdag::app::OpeningDag& dag, int* records = nullptr) {
    QString text;
    QTextStream out(&text);
    const int n = dag.emit(out);
    out.flush();
    if (records) *records = n;
    return text.toStdString();
}

// Movetext lines ("1. e4 e5 *") of every record, in output order.
inline std::vector<std::string> bodies(const std::string& pgn) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start < pgn.size()) {
        size_t end = pgn.find('\n', start);
        if (end == std::string::npos) end = pgn.size();
        const std::string line = pgn.substr(start, end - start);
        if (!line.empty() && line.front() != '[') out.push_back(line);
        start = end + 1;
    }
    return out;
}

} // namespace repdag::test
