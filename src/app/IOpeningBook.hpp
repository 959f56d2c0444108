#pragma once

#include <optional>
#include <string>

#include "domain/domain_model.hpp"

namespace repdag::app {

// Port for the opening name / ECO table.
// Implementations live in infra (embedded TSV resource, file).
class IOpeningBook {
public:
    virtual ~IOpeningBook() = default;

    // Exact FEN first, then the normalized FEN.
    virtual std::optional<repdag::domain::OpeningInfo> lookup(const std::string& fen) const = 0;
};

} // namespace repdag::app
