#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QFile>
#include <QLoggingCategory>
#include <QSaveFile>
#include <QString>
#include <QTextStream>
#include <memory>

#include "app/CachedEvaluator.hpp"
#include "app/DagContractError.hpp"
#include "app/RepertoireBuilder.hpp"
#include "infra/BuildConfigRepository.hpp"
#include "infra/EvalCacheRepository.hpp"
#include "infra/OpeningBookRepository.hpp"
#include "net/CloudEvalClient.hpp"

namespace {

using repdag::domain::BuildConfig;

bool readTextFile(const std::string& path, std::string& out) {
    QFile file(QString::fromStdString(path));
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        qCritical() << "Failed to open" << QString::fromStdString(path) << ":" << file.errorString();
        return false;
    }
    out = file.readAll().toStdString();
    return true;
}

std::vector<std::string> toStdList(const QStringList& list) {
    std::vector<std::string> out;
    out.reserve(static_cast<std::size_t>(list.size()));
    for (const auto& s : list) {
        out.push_back(s.toStdString());
    }
    return out;
}

} // namespace

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("repdag"));
    QCoreApplication::setApplicationVersion(QStringLiteral("1.0"));

    qSetMessagePattern(QStringLiteral("[%{type}] %{message}"));

    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("Merges repertoire PGN files into one deduplicated opening DAG and writes it back as PGN."));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption configOpt(QStringLiteral("config"), QStringLiteral("JSON build config."), QStringLiteral("file"));
    const QCommandLineOption colorOpt(QStringLiteral("color"), QStringLiteral("Repertoire color: white or black."), QStringLiteral("color"));
    const QCommandLineOption formatOpt(QStringLiteral("format"), QStringLiteral("Output format: flattened or consolidated."), QStringLiteral("format"));
    const QCommandLineOption inputOpt(QStringLiteral("input"), QStringLiteral("Existing repertoire PGN (repeatable)."), QStringLiteral("pgn"));
    const QCommandLineOption linesOpt(QStringLiteral("lines"), QStringLiteral("New repertoire lines PGN (repeatable)."), QStringLiteral("pgn"));
    const QCommandLineOption outputOpt(QStringLiteral("output"), QStringLiteral("Output PGN file."), QStringLiteral("file"));
    const QCommandLineOption keepOpt(QStringLiteral("keep-existing"), QStringLiteral("Also merge --input games into the output."));
    const QCommandLineOption depthOpt(QStringLiteral("max-depth"), QStringLiteral("Truncate --lines after this many full moves (0 = no limit)."), QStringLiteral("n"));
    const QCommandLineOption bookOpt(QStringLiteral("book"), QStringLiteral("Opening book TSV (fen;eco;name) instead of the embedded one."), QStringLiteral("tsv"));
    const QCommandLineOption cacheOpt(QStringLiteral("eval-cache"), QStringLiteral("SQLite evaluation cache."), QStringLiteral("sqlite"));
    const QCommandLineOption noCloudOpt(QStringLiteral("no-cloud-eval"), QStringLiteral("Do not query the Lichess cloud evaluation."));
    const QCommandLineOption noEvalOpt(QStringLiteral("no-eval"), QStringLiteral("Do not annotate records with evaluations."));
    const QCommandLineOption verboseOpt(QStringLiteral("verbose"), QStringLiteral("Print debug output."));

    parser.addOptions({configOpt, colorOpt, formatOpt, inputOpt, linesOpt, outputOpt, keepOpt,
                       depthOpt, bookOpt, cacheOpt, noCloudOpt, noEvalOpt, verboseOpt});
    parser.process(app);

    if (!parser.isSet(verboseOpt)) {
        QLoggingCategory::setFilterRules(QStringLiteral("*.debug=false"));
    }

    BuildConfig cfg;
    if (parser.isSet(configOpt)) {
        repdag::infra::BuildConfigRepository configRepo(parser.value(configOpt).toStdString());
        cfg = configRepo.load();
    }

    // Command line overrides the config file.
    if (parser.isSet(colorOpt)) {
        const auto c = repdag::infra::BuildConfigRepository::parseColor(parser.value(colorOpt));
        if (!c) {
            qCritical() << "Please specify --color <white|black>";
            return 1;
        }
        cfg.color = *c;
        cfg.colorSet = true;
    }
    if (parser.isSet(formatOpt)) {
        const auto m = repdag::infra::BuildConfigRepository::parseOutputMode(parser.value(formatOpt));
        if (!m) {
            qCritical() << "Please specify --format <flattened|consolidated>";
            return 1;
        }
        cfg.outputMode = *m;
        cfg.outputModeSet = true;
    }
    if (parser.isSet(inputOpt))   cfg.inputs = toStdList(parser.values(inputOpt));
    if (parser.isSet(linesOpt))   cfg.lines = toStdList(parser.values(linesOpt));
    if (parser.isSet(outputOpt))  cfg.outputPath = parser.value(outputOpt).toStdString();
    if (parser.isSet(keepOpt))    cfg.keepExisting = true;
    if (parser.isSet(bookOpt))    cfg.openingBookPath = parser.value(bookOpt).toStdString();
    if (parser.isSet(cacheOpt))   cfg.eval.cacheDbPath = parser.value(cacheOpt).toStdString();
    if (parser.isSet(noCloudOpt)) cfg.eval.cloud = false;
    if (parser.isSet(noEvalOpt))  cfg.eval.enabled = false;
    if (parser.isSet(depthOpt)) {
        bool ok = false;
        const int depth = parser.value(depthOpt).toInt(&ok);
        if (!ok || depth < 0) {
            qCritical() << "Invalid --max-depth:" << parser.value(depthOpt);
            return 1;
        }
        cfg.maxDepth = depth;
    }

    if (!cfg.colorSet) {
        qCritical() << "Please specify --color <white|black>";
        return 1;
    }
    if (!cfg.outputModeSet) {
        qCritical() << "Please specify --format <flattened|consolidated>";
        return 1;
    }
    if (cfg.outputPath.empty()) {
        qCritical() << "Please specify --output <file>";
        return 1;
    }

    repdag::infra::OpeningBookRepository book(QString::fromStdString(cfg.openingBookPath));

    std::unique_ptr<repdag::infra::EvalCacheRepository> evalCache;
    std::unique_ptr<repdag::net::CloudEvalClient> cloud;
    std::unique_ptr<repdag::app::CachedEvaluator> evaluator;
    if (cfg.eval.enabled) {
        evalCache = std::make_unique<repdag::infra::EvalCacheRepository>(QString::fromStdString(cfg.eval.cacheDbPath));
        if (cfg.eval.cloud) {
            cloud = std::make_unique<repdag::net::CloudEvalClient>(cfg.eval.timeoutMs);
        }
        evaluator = std::make_unique<repdag::app::CachedEvaluator>(evalCache.get(), cloud.get());
    }

    try {
        repdag::app::RepertoireBuilder builder(cfg, book, evaluator.get());

        for (const auto& path : cfg.inputs) {
            std::string text;
            if (!readTextFile(path, text)) return 1;
            const auto stats = builder.ingestPgnText(text, path, repdag::app::LineKind::Existing);
            qInfo().noquote() << QString::fromStdString(path) << ":" << stats.games << "games," << stats.lines << "lines";
        }
        for (const auto& path : cfg.lines) {
            std::string text;
            if (!readTextFile(path, text)) return 1;
            const auto stats = builder.ingestPgnText(text, path, repdag::app::LineKind::New);
            qInfo().noquote() << QString::fromStdString(path) << ":" << stats.games << "games," << stats.lines << "lines,"
                              << stats.truncated << "cut at a known repertoire move";
        }

        QSaveFile out(QString::fromStdString(cfg.outputPath));
        if (!out.open(QIODevice::WriteOnly | QIODevice::Text)) {
            qCritical() << "Failed to open output" << QString::fromStdString(cfg.outputPath) << ":" << out.errorString();
            return 1;
        }

        int records = 0;
        {
            QTextStream stream(&out);
            records = builder.emit(stream);
            stream.flush();
        }
        if (!out.commit()) {
            qCritical() << "Failed to write output" << QString::fromStdString(cfg.outputPath) << ":" << out.errorString();
            return 1;
        }

        qInfo().noquote() << "Wrote" << records << "records," << static_cast<int>(builder.dag().nodeCount())
                          << "positions, to" << QString::fromStdString(cfg.outputPath);
        if (evaluator) {
            qInfo() << "Evaluations:" << evaluator->cacheHits() << "cached," << evaluator->remoteHits()
                    << "cloud," << evaluator->misses() << "missing";
        }
    } catch (const repdag::app::DagContractError& e) {
        qCritical() << "Internal error while building the repertoire:" << e.what();
        return 2;
    }

    return 0;
}
