#include "app/PgnRecordWriter.hpp"

namespace repdag::app {

using repdag::domain::EvalResult;
using repdag::domain::ScoreType;

namespace {

QString escapeTagValue(const std::string& v) {
    QString out = QString::fromStdString(v);
    out.replace(QLatin1Char('\\'), QStringLiteral("\\\\"));
    out.replace(QLatin1Char('"'), QStringLiteral("\\\""));
    return out;
}

void writeTag(QTextStream& out, const char* key, const QString& value) {
    out << '[' << key << " \"" << value << "\"]\n";
}

} // namespace

PgnRecordWriter::PgnRecordWriter()
    : timestamp_(QDateTime::currentDateTime()) {
}

std::string PgnRecordWriter::formatEvalComment(const EvalResult& eval) {
    switch (eval.score.type) {
        case ScoreType::Mate:
            return "{ [%eval #" + std::to_string(eval.score.value) + "] }";
        case ScoreType::Cp:
            return "{ [%eval " + QString::number(eval.score.value / 100.0, 'f', 2).toStdString() + "] }";
        case ScoreType::None:
            break;
    }
    return {};
}

void PgnRecordWriter::write(QTextStream& out, const PgnRecord& record) const {
    const QDateTime local = timestamp_.toLocalTime();
    const QDateTime utc = timestamp_.toUTC();

    // Seven Tag Roster first.
    writeTag(out, "Event", escapeTagValue(record.event));
    writeTag(out, "Site", QString());
    writeTag(out, "Date", local.date().toString(QStringLiteral("yyyy.MM.dd")));
    writeTag(out, "Round", QStringLiteral("1"));
    writeTag(out, "White", QString());
    writeTag(out, "Black", QString());
    writeTag(out, "Result", QStringLiteral("*"));

    writeTag(out, "UTCDate", utc.date().toString(QStringLiteral("yyyy.MM.dd")));
    writeTag(out, "UTCTime", utc.time().toString(QStringLiteral("HH:mm:ss")));
    writeTag(out, "Variant", QStringLiteral("Standard"));
    writeTag(out, "ECO", escapeTagValue(record.eco));
    writeTag(out, "Annotator", escapeTagValue(annotator_));
    if (!record.startFen.empty()) {
        writeTag(out, "FEN", QString::fromStdString(record.startFen));
        writeTag(out, "SetUp", QStringLiteral("1"));
    }

    out << '\n' << QString::fromStdString(record.body);
    if (!record.evalComment.empty()) {
        out << ' ' << QString::fromStdString(record.evalComment);
    }
    out << " *\n\n";
}

} // namespace repdag::app
