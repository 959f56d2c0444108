#pragma once

#include <QDateTime>
#include <QString>
#include <QTextStream>
#include <string>

#include "domain/domain_model.hpp"

namespace repdag::app {

struct PgnRecord {
    std::string event;       // opening name
    std::string eco;
    std::string startFen;    // empty when the record starts at the root
    std::string body;        // numbered SAN, possibly with variations
    std::string evalComment; // "{ [%eval 0.25] }" or empty
};

// Writes repertoire records: Seven Tag Roster, UTC date/time, Variant, ECO,
// Annotator, FEN/SetUp for non-root starts, then "<body> [eval] *".
class PgnRecordWriter {
public:
    PgnRecordWriter();

    void setAnnotator(std::string annotator) { annotator_ = std::move(annotator); }
    void setTimestamp(const QDateTime& ts) { timestamp_ = ts; }

    const QDateTime& timestamp() const noexcept { return timestamp_; }

    void write(QTextStream& out, const PgnRecord& record) const;

    static std::string formatEvalComment(const repdag::domain::EvalResult& eval);

private:
    std::string annotator_{"repdag"};
    QDateTime   timestamp_;
};

} // namespace repdag::app
