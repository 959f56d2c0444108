#include "infra/BuildConfigRepository.hpp"

#include <QDebug>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QSaveFile>

namespace repdag::infra {

using repdag::domain::BuildConfig;
using repdag::domain::Color;
using repdag::domain::OutputMode;

namespace {

std::vector<std::string> toStringList(const QJsonValue& v, const char* key) {
    std::vector<std::string> out;
    if (!v.isArray()) {
        qWarning() << "Build config:" << key << "is not an array, ignored";
        return out;
    }
    for (const auto& item : v.toArray()) {
        if (!item.isString() || item.toString().isEmpty()) {
            qWarning() << "Build config: non-string entry in" << key << "ignored";
            continue;
        }
        out.push_back(item.toString().toStdString());
    }
    return out;
}

QJsonArray fromStringList(const std::vector<std::string>& list) {
    QJsonArray arr;
    for (const auto& s : list) {
        arr.append(QString::fromStdString(s));
    }
    return arr;
}

} // namespace

BuildConfigRepository::BuildConfigRepository(std::string path)
    : path_(std::move(path)) {
}

std::optional<Color> BuildConfigRepository::parseColor(const QString& s) {
    const QString v = s.trimmed().toLower();
    if (v == QLatin1String("white") || v == QLatin1String("w")) return Color::White;
    if (v == QLatin1String("black") || v == QLatin1String("b")) return Color::Black;
    return std::nullopt;
}

std::optional<OutputMode> BuildConfigRepository::parseOutputMode(const QString& s) {
    const QString v = s.trimmed().toLower();
    if (v == QLatin1String("flattened")) return OutputMode::Flattened;
    if (v == QLatin1String("consolidated")) return OutputMode::Consolidated;
    return std::nullopt;
}

BuildConfig BuildConfigRepository::load() const {
    BuildConfig cfg;

    QFile file(QString::fromStdString(path_));
    if (!file.exists()) {
        qWarning() << "Build config not found, using defaults:" << QString::fromStdString(path_);
        return cfg;
    }
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        qWarning() << "Failed to open build config, using defaults:" << QString::fromStdString(path_);
        return cfg;
    }

    QJsonParseError parseErr{};
    const auto doc = QJsonDocument::fromJson(file.readAll(), &parseErr);
    if (parseErr.error != QJsonParseError::NoError || !doc.isObject()) {
        qWarning() << "Invalid build config, using defaults:" << parseErr.errorString();
        return cfg;
    }
    const auto o = doc.object();

    if (o.contains(QStringLiteral("color"))) {
        if (const auto c = parseColor(o.value(QStringLiteral("color")).toString())) {
            cfg.color = *c;
            cfg.colorSet = true;
        } else {
            qWarning() << "Build config: invalid 'color', ignored";
        }
    }
    if (o.contains(QStringLiteral("format"))) {
        if (const auto m = parseOutputMode(o.value(QStringLiteral("format")).toString())) {
            cfg.outputMode = *m;
            cfg.outputModeSet = true;
        } else {
            qWarning() << "Build config: invalid 'format', ignored";
        }
    }

    cfg.outputPath      = o.value(QStringLiteral("output")).toString().toStdString();
    cfg.openingBookPath = o.value(QStringLiteral("book")).toString().toStdString();
    cfg.keepExisting    = o.value(QStringLiteral("keep_existing")).toBool(false);

    if (o.contains(QStringLiteral("inputs"))) cfg.inputs = toStringList(o.value(QStringLiteral("inputs")), "inputs");
    if (o.contains(QStringLiteral("lines")))  cfg.lines  = toStringList(o.value(QStringLiteral("lines")), "lines");

    const int maxDepth = o.value(QStringLiteral("max_depth")).toInt(0);
    if (maxDepth < 0) {
        qWarning() << "Build config: negative 'max_depth', ignored";
    } else {
        cfg.maxDepth = maxDepth;
    }

    const QString annotator = o.value(QStringLiteral("annotator")).toString();
    if (!annotator.isEmpty()) cfg.annotator = annotator.toStdString();

    if (o.contains(QStringLiteral("eval"))) {
        const auto e = o.value(QStringLiteral("eval")).toObject();
        cfg.eval.enabled = e.value(QStringLiteral("enabled")).toBool(cfg.eval.enabled);
        cfg.eval.cloud   = e.value(QStringLiteral("cloud")).toBool(cfg.eval.cloud);

        const QString cache = e.value(QStringLiteral("cache")).toString();
        if (!cache.isEmpty()) cfg.eval.cacheDbPath = cache.toStdString();

        const int timeout = e.value(QStringLiteral("timeout_ms")).toInt(cfg.eval.timeoutMs);
        if (timeout <= 0) {
            qWarning() << "Build config: invalid 'eval.timeout_ms', ignored";
        } else {
            cfg.eval.timeoutMs = timeout;
        }
    }

    return cfg;
}

bool BuildConfigRepository::save(const BuildConfig& cfg) const {
    QJsonObject eval;
    eval.insert(QStringLiteral("enabled"),    cfg.eval.enabled);
    eval.insert(QStringLiteral("cache"),      QString::fromStdString(cfg.eval.cacheDbPath));
    eval.insert(QStringLiteral("cloud"),      cfg.eval.cloud);
    eval.insert(QStringLiteral("timeout_ms"), cfg.eval.timeoutMs);

    QJsonObject root;
    if (cfg.colorSet)      root.insert(QStringLiteral("color"),  QString::fromStdString(to_string(cfg.color)));
    if (cfg.outputModeSet) root.insert(QStringLiteral("format"), QString::fromStdString(to_string(cfg.outputMode)));
    root.insert(QStringLiteral("output"),        QString::fromStdString(cfg.outputPath));
    root.insert(QStringLiteral("inputs"),        fromStringList(cfg.inputs));
    root.insert(QStringLiteral("lines"),         fromStringList(cfg.lines));
    root.insert(QStringLiteral("keep_existing"), cfg.keepExisting);
    root.insert(QStringLiteral("max_depth"),     cfg.maxDepth);
    root.insert(QStringLiteral("book"),          QString::fromStdString(cfg.openingBookPath));
    root.insert(QStringLiteral("annotator"),     QString::fromStdString(cfg.annotator));
    root.insert(QStringLiteral("eval"),          eval);

    QSaveFile file(QString::fromStdString(path_));
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text)) {
        qWarning() << "Failed to write build config:" << QString::fromStdString(path_);
        return false;
    }
    file.write(QJsonDocument(root).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        qWarning() << "Failed to commit build config:" << file.errorString();
        return false;
    }
    return true;
}

} // namespace repdag::infra
