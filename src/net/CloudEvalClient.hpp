#pragma once

#include <QByteArray>
#include <QNetworkAccessManager>
#include <QString>
#include <QUrl>
#include <string>

#include "app/IPositionEvaluator.hpp"
#include "domain/domain_model.hpp"

namespace repdag::net {

struct CloudEvalResult {
    bool ok{false};      // transport and payload were fine
    bool found{false};   // the service knows the position
    QString error;
    repdag::domain::EvalResult eval;
};

// Lichess cloud evaluation over HTTPS (GET /api/cloud-eval).
//
// Requests are synchronous: a local event loop runs until the reply
// finishes or the timeout fires. Needs a QCoreApplication.
class CloudEvalClient : public repdag::app::IPositionEvaluator {
public:
    explicit CloudEvalClient(int timeoutMs = 5000);

    void setEndpointUrl(const QUrl& url) { endpoint_ = url; }
    QUrl endpointUrl() const { return endpoint_; }

    QUrl requestUrl(const std::string& fen) const;

    CloudEvalResult fetch(const std::string& fen);

    // Failures are logged and reported as "no evaluation".
    std::optional<repdag::domain::EvalResult> evaluate(const std::string& fen) override;

    // Parses a cloud-eval JSON payload for 'fen'. The first PV's first move
    // is converted from UCI to SAN.
    static CloudEvalResult parseResponse(const QByteArray& payload, const std::string& fen);

private:
    QNetworkAccessManager nam_;
    QUrl                  endpoint_{QStringLiteral("https://lichess.org/api/cloud-eval")};
    int                   timeoutMs_;
};

} // namespace repdag::net
