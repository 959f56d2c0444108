#include "domain/fen_utils.hpp"

namespace repdag::domain {

std::vector<std::string> splitFenFields(const std::string& fen) {
    std::vector<std::string> out;
    if (fen.empty()) {
        return out;
    }

    size_t start = 0;
    while (true) {
        const size_t sp = fen.find(' ', start);
        if (sp == std::string::npos) {
            out.push_back(fen.substr(start));
            break;
        }
        out.push_back(fen.substr(start, sp - start));
        start = sp + 1;
    }
    return out;
}

std::optional<std::string> normalizeFen(const std::string& fen) {
    const auto fields = splitFenFields(fen);
    if (fields.size() != 6) {
        return std::nullopt;
    }

    return fields[0] + ' ' + fields[1] + ' ' + fields[2] + ' ' + fields[3] + " 0 1";
}

std::optional<Color> sideToMoveFromFen(const std::string& fen) {
    const auto fields = splitFenFields(fen);
    if (fields.size() < 2) {
        return std::nullopt;
    }
    if (fields[1] == "w") return Color::White;
    if (fields[1] == "b") return Color::Black;
    return std::nullopt;
}

} // namespace repdag::domain
