#include "domain/pgn/PgnVariations.hpp"

#include <cctype>

namespace repdag::domain::pgn {

namespace {

bool isResult(const std::string& t) {
    return t == "1-0" || t == "0-1" || t == "1/2-1/2" || t == "*";
}

bool isCastle(const std::string& t) {
    return t.rfind("O-O", 0) == 0 || t.rfind("0-0", 0) == 0;
}

bool isGlyphOnly(const std::string& t) {
    for (char c : t) {
        if (c != '!' && c != '?') return false;
    }
    return true;
}

// "12." / "12..." / "12.e4" -> "" / "" / "e4"
std::string stripMoveNumber(const std::string& t) {
    size_t i = 0;
    while (i < t.size() && std::isdigit(static_cast<unsigned char>(t[i]))) ++i;
    if (i == t.size()) return {};          // bare number
    if (i == 0 || t[i] != '.') return t;    // not a move number
    while (i < t.size() && t[i] == '.') ++i;
    return t.substr(i);
}

struct Cursor {
    const std::vector<std::string>& tokens;
    size_t pos{0};
};

// Reads one move sequence up to a closing ")" or the end, starting from
// 'base'. The sequence's own line is emitted before its variations.
void expandSequence(Cursor& cur, const SanLine& base, std::vector<SanLine>& out) {
    SanLine line = base;
    SanLine beforeLast = base;
    std::vector<SanLine> variations;

    while (cur.pos < cur.tokens.size()) {
        const std::string& t = cur.tokens[cur.pos++];
        if (t == ")") break;
        if (t == "(") {
            expandSequence(cur, beforeLast, variations);
            continue;
        }
        beforeLast = line;
        line.push_back(t);
    }

    if (line.size() > base.size()) {
        out.push_back(std::move(line));
    }
    for (auto& v : variations) {
        out.push_back(std::move(v));
    }
}

} // namespace

std::vector<std::string> tokenizeMovetext(const std::string& movetext) {
    std::vector<std::string> tokens;
    std::string word;

    auto flush = [&]() {
        if (word.empty()) return;
        std::string t;
        if (isResult(word)) {
            t.clear();
        } else if (isCastle(word)) {
            t = word;
            while (!t.empty() && (t.back() == '!' || t.back() == '?')) t.pop_back();
        } else if (word.front() == '$') {
            t.clear(); // NAG
        } else {
            t = stripMoveNumber(word);
            if (isGlyphOnly(t)) t.clear();
            while (!t.empty() && (t.back() == '!' || t.back() == '?')) t.pop_back();
        }
        if (!t.empty()) tokens.push_back(std::move(t));
        word.clear();
    };

    for (size_t i = 0; i < movetext.size(); ++i) {
        const char c = movetext[i];
        if (c == '{') {
            flush();
            const size_t close = movetext.find('}', i + 1);
            if (close == std::string::npos) break;
            i = close;
            continue;
        }
        if (c == ';') {
            flush();
            const size_t nl = movetext.find('\n', i + 1);
            if (nl == std::string::npos) break;
            i = nl;
            continue;
        }
        if (c == '(' || c == ')') {
            flush();
            tokens.emplace_back(1, c);
            continue;
        }
        if (std::isspace(static_cast<unsigned char>(c))) {
            flush();
            continue;
        }
        word.push_back(c);
    }
    flush();
    return tokens;
}

std::vector<SanLine> expandVariationLines(const std::string& movetext) {
    const auto tokens = tokenizeMovetext(movetext);
    std::vector<SanLine> out;
    Cursor cur{tokens};
    while (cur.pos < cur.tokens.size()) {
        // An unbalanced ")" ends a sequence early; keep reading what follows.
        expandSequence(cur, SanLine{}, out);
    }
    return out;
}

} // namespace repdag::domain::pgn
