#include "domain/pgn/PgnParser.hpp"

#include <cctype>
#include <string_view>

namespace repdag::domain::pgn {

namespace {

std::string_view trimmed(std::string_view v) {
    size_t b = 0;
    while (b < v.size() && std::isspace(static_cast<unsigned char>(v[b]))) ++b;
    size_t e = v.size();
    while (e > b && std::isspace(static_cast<unsigned char>(v[e - 1]))) --e;
    return v.substr(b, e - b);
}

bool hasBom(std::string_view v) {
    return v.size() >= 3 && static_cast<unsigned char>(v[0]) == 0xEF &&
           static_cast<unsigned char>(v[1]) == 0xBB && static_cast<unsigned char>(v[2]) == 0xBF;
}

// [Key "Value"] with \" and \\ escapes inside the value.
bool parseTagPair(std::string_view line, std::string& key, std::string& value) {
    if (line.size() < 4 || line.front() != '[' || line.back() != ']') return false;

    const std::string_view body = line.substr(1, line.size() - 2);
    size_t k = 0;
    while (k < body.size() && !std::isspace(static_cast<unsigned char>(body[k]))) ++k;
    if (k == 0 || k >= body.size()) return false;

    const size_t open = body.find('"', k);
    if (open == std::string_view::npos) return false;

    std::string v;
    bool closed = false;
    for (size_t i = open + 1; i < body.size(); ++i) {
        const char c = body[i];
        if (c == '\\' && i + 1 < body.size() && (body[i + 1] == '"' || body[i + 1] == '\\')) {
            v.push_back(body[++i]);
            continue;
        }
        if (c == '"') {
            closed = true;
            break;
        }
        v.push_back(c);
    }
    if (!closed) return false;

    key.assign(body.substr(0, k));
    value = std::move(v);
    return true;
}

class GameCollector {
public:
    explicit GameCollector(int maxGames) : maxGames_(maxGames) {}

    bool full() const {
        return maxGames_ >= 0 && static_cast<int>(games_.size()) >= maxGames_;
    }

    bool hasMovetext() const { return !cur_.movetext.empty(); }
    bool inComment() const { return inBrace_; }

    void addTag(std::string key, std::string value) {
        cur_.tags[std::move(key)] = std::move(value);
    }

    // Drops a ";" rest-of-line comment unless it sits inside a {} comment.
    void addMovetext(std::string_view line) {
        size_t end = line.size();
        for (size_t i = 0; i < line.size(); ++i) {
            const char c = line[i];
            if (c == '{') inBrace_ = true;
            else if (c == '}') inBrace_ = false;
            else if (c == ';' && !inBrace_) {
                end = i;
                break;
            }
        }
        const std::string_view kept = trimmed(line.substr(0, end));
        if (kept.empty()) return;
        if (!cur_.movetext.empty()) cur_.movetext.push_back(' ');
        cur_.movetext.append(kept);
    }

    void finish() {
        if ((!cur_.tags.empty() || !cur_.movetext.empty()) && !full()) {
            games_.push_back(std::move(cur_));
        }
        cur_ = PgnGame{};
        inBrace_ = false;
    }

    std::vector<PgnGame> take() { return std::move(games_); }

private:
    int maxGames_;
    PgnGame cur_;
    bool inBrace_{false};
    std::vector<PgnGame> games_;
};

} // namespace

std::optional<std::string> PgnGame::tag(const std::string& key) const {
    const auto it = tags.find(key);
    if (it == tags.end()) return std::nullopt;
    return it->second;
}

PgnParseResult parsePgnText(const std::string& text, int maxGames) {
    PgnParseResult res;
    if (maxGames == 0) {
        res.ok = true;
        return res;
    }

    GameCollector games(maxGames);
    std::string_view rest(text);
    if (hasBom(rest)) rest.remove_prefix(3);

    while (!rest.empty() && !games.full()) {
        size_t eol = 0;
        while (eol < rest.size() && rest[eol] != '\n' && rest[eol] != '\r') ++eol;
        const std::string_view raw = rest.substr(0, eol);
        if (eol < rest.size() && rest[eol] == '\r') ++eol;
        if (eol < rest.size() && rest[eol] == '\n') ++eol;
        rest.remove_prefix(eol);

        if (!raw.empty() && raw.front() == '%') continue;

        const std::string_view line = trimmed(raw);
        if (line.empty()) continue;

        if (line.front() == '[' && !games.inComment()) {
            // A tag after movetext starts the next game.
            if (games.hasMovetext()) games.finish();
            std::string k, v;
            if (parseTagPair(line, k, v)) games.addTag(std::move(k), std::move(v));
            continue;
        }
        games.addMovetext(line);
    }
    games.finish();

    res.games = games.take();
    if (res.games.empty()) {
        res.error = "No PGN games found";
        return res;
    }
    res.ok = true;
    return res;
}

} // namespace repdag::domain::pgn
