#pragma once

#include <string>
#include <vector>

namespace repdag::domain {

// --- Sides & output ---------------------------------------------------------

enum class Color {
    White = 0,
    Black = 1
};

inline Color opposite(Color c) {
    return (c == Color::White) ? Color::Black : Color::White;
}

enum class OutputMode {
    Flattened    = 0,
    Consolidated = 1
};

// --- Opening annotation -----------------------------------------------------

// Ordered from most to least specific; a smaller value ranks higher.
enum class OpeningNameProvenance {
    Direct       = 0,
    FromParent   = 1,
    FromAncestor = 2
};

struct OpeningInfo {
    std::string eco;
    std::string name;
};

// --- Score & evaluation -----------------------------------------------------

enum class ScoreType {
    None = 0,
    Cp   = 1,
    Mate = 2
};

struct Score {
    ScoreType type{ScoreType::None};
    int       value{0}; // centipawns or mate in N, White's point of view
};

struct EvalResult {
    Score       score;
    std::string bestMove; // SAN
    int         depth{0};
    std::string source;   // "local cache", "cloud", ...
};

// --- Build configuration ----------------------------------------------------

struct EvalSettings {
    bool        enabled{true};
    std::string cacheDbPath{"evalcache.sqlite"};
    bool        cloud{true};
    int         timeoutMs{5000};
};

struct BuildConfig {
    Color                    color{Color::White};
    bool                     colorSet{false};
    OutputMode               outputMode{OutputMode::Consolidated};
    bool                     outputModeSet{false};
    std::string              outputPath;
    std::vector<std::string> inputs; // existing repertoire
    std::vector<std::string> lines;  // new repertoire lines
    bool                     keepExisting{false};
    int                      maxDepth{0}; // full moves, 0 = unlimited
    std::string              openingBookPath;
    std::string              annotator{"repdag"};
    EvalSettings             eval;
};

// --- Helpers ----------------------------------------------------------------

inline std::string to_string(Color c) {
    switch (c) {
        case Color::White: return "white";
        case Color::Black: return "black";
    }
    return "white";
}

inline std::string to_string(OutputMode m) {
    switch (m) {
        case OutputMode::Flattened:    return "flattened";
        case OutputMode::Consolidated: return "consolidated";
    }
    return "consolidated";
}

inline std::string to_string(OpeningNameProvenance p) {
    switch (p) {
        case OpeningNameProvenance::Direct:       return "Direct";
        case OpeningNameProvenance::FromParent:   return "FromParent";
        case OpeningNameProvenance::FromAncestor: return "FromAncestor";
    }
    return "Direct";
}

inline std::string to_string(const Score& s) {
    switch (s.type) {
        case ScoreType::None:
            return "";
        case ScoreType::Cp:
            return std::to_string(s.value) + " cp";
        case ScoreType::Mate:
            return "M" + std::to_string(s.value);
    }
    return "";
}

} // namespace repdag::domain
