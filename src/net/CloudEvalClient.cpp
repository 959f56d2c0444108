#include "net/CloudEvalClient.hpp"

#include <QDebug>
#include <QEventLoop>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QTimer>
#include <QUrlQuery>

#include "domain/chess_rules.hpp"
#include "domain/fen_utils.hpp"

namespace repdag::net {

using repdag::domain::EvalResult;
using repdag::domain::ScoreType;
namespace chess = repdag::domain::chess;

CloudEvalClient::CloudEvalClient(int timeoutMs)
    : timeoutMs_(timeoutMs) {
}

QUrl CloudEvalClient::requestUrl(const std::string& fen) const {
    const std::string key = repdag::domain::normalizeFen(fen).value_or(fen);

    QUrlQuery query;
    query.addQueryItem(QStringLiteral("fen"), QString::fromStdString(key));
    query.addQueryItem(QStringLiteral("multiPv"), QStringLiteral("1"));

    QUrl url = endpoint_;
    url.setQuery(query);
    return url;
}

CloudEvalResult CloudEvalClient::parseResponse(const QByteArray& payload, const std::string& fen) {
    CloudEvalResult res;

    QJsonParseError err{};
    const auto doc = QJsonDocument::fromJson(payload, &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject()) {
        res.error = QStringLiteral("Invalid cloud-eval payload: ") + err.errorString();
        return res;
    }

    const auto o = doc.object();
    if (o.value(QStringLiteral("error")).toString() == QLatin1String("Not found")) {
        res.ok = true;
        return res;
    }

    const auto pvs = o.value(QStringLiteral("pvs")).toArray();
    if (pvs.isEmpty() || !pvs.first().isObject()) {
        res.error = QStringLiteral("Cloud-eval payload has no PV");
        return res;
    }
    const auto pv = pvs.first().toObject();

    EvalResult eval;
    if (pv.contains(QStringLiteral("mate"))) {
        eval.score.type = ScoreType::Mate;
        eval.score.value = pv.value(QStringLiteral("mate")).toInt();
    } else if (pv.contains(QStringLiteral("cp"))) {
        eval.score.type = ScoreType::Cp;
        eval.score.value = pv.value(QStringLiteral("cp")).toInt();
    } else {
        res.error = QStringLiteral("Cloud-eval PV has no score");
        return res;
    }
    eval.depth = o.value(QStringLiteral("depth")).toInt(0);
    eval.source = "cloud";

    const QString firstUci = pv.value(QStringLiteral("moves")).toString().section(QLatin1Char(' '), 0, 0);
    if (!firstUci.isEmpty()) {
        const auto pos = chess::Position::fromFen(fen);
        std::optional<chess::Move> mv;
        if (pos) mv = chess::parseUci(*pos, firstUci.toStdString());
        if (mv) {
            eval.bestMove = chess::encodeSan(*pos, *mv);
        } else {
            qDebug() << "Cloud-eval best move" << firstUci << "does not fit" << QString::fromStdString(fen);
        }
    }

    res.ok = true;
    res.found = true;
    res.eval = std::move(eval);
    return res;
}

CloudEvalResult CloudEvalClient::fetch(const std::string& fen) {
    QNetworkRequest req(requestUrl(fen));
    req.setRawHeader("Accept", "application/json");
    req.setAttribute(QNetworkRequest::CacheLoadControlAttribute, QNetworkRequest::AlwaysNetwork);

    QNetworkReply* reply = nam_.get(req);

    QEventLoop loop;
    QTimer timer;
    timer.setSingleShot(true);
    QObject::connect(&timer, &QTimer::timeout, &loop, &QEventLoop::quit);
    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    timer.start(timeoutMs_);
    loop.exec();

    CloudEvalResult res;
    if (!reply->isFinished()) {
        reply->abort();
        reply->deleteLater();
        res.error = QStringLiteral("Cloud-eval request timed out after %1 ms").arg(timeoutMs_);
        return res;
    }

    const int status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    const QByteArray payload = reply->readAll();
    const QString netError = reply->errorString();
    const bool netOk = (reply->error() == QNetworkReply::NoError);
    reply->deleteLater();

    if (status == 404) {
        res.ok = true; // position unknown to the service
        return res;
    }
    if (!netOk) {
        res.error = netError;
        return res;
    }
    return parseResponse(payload, fen);
}

std::optional<EvalResult> CloudEvalClient::evaluate(const std::string& fen) {
    const auto res = fetch(fen);
    if (!res.ok) {
        qWarning() << "Cloud evaluation failed:" << res.error;
        return std::nullopt;
    }
    if (!res.found) {
        return std::nullopt;
    }
    return res.eval;
}

} // namespace repdag::net
