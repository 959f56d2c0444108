#pragma once

#include <QString>
#include <optional>
#include <string>

#include "app/IBuildConfigRepository.hpp"
#include "domain/domain_model.hpp"

namespace repdag::infra {

class BuildConfigRepository : public repdag::app::IBuildConfigRepository {
public:
    explicit BuildConfigRepository(std::string path);

    // Loads the build configuration from a JSON file.
    // A missing or invalid file yields defaults; an invalid field keeps its
    // default. Both log a warning.
    repdag::domain::BuildConfig load() const override;

    bool save(const repdag::domain::BuildConfig& config) const override;

    // Parses "white"/"w"/"black"/"b" and "flattened"/"consolidated", any case.
    static std::optional<repdag::domain::Color> parseColor(const QString& s);
    static std::optional<repdag::domain::OutputMode> parseOutputMode(const QString& s);

private:
    std::string path_;
};

} // namespace repdag::infra
