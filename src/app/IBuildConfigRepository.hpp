#pragma once

#include "domain/domain_model.hpp"

namespace repdag::app {

// Port/interface for reading/writing the build configuration.
// Implementations live in infra (e.g. JSON file).
class IBuildConfigRepository {
public:
    virtual ~IBuildConfigRepository() = default;

    virtual repdag::domain::BuildConfig load() const = 0;
    virtual bool save(const repdag::domain::BuildConfig& config) const = 0;
};

} // namespace repdag::app
