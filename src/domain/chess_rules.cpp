#include "domain/chess_rules.hpp"

#include <cctype>
#include <sstream>
#include <string_view>
#include <utility>

namespace repdag::domain::chess {

namespace {

// ------------------------------ Squares -----------------------------------

inline int fileOf(int sq) { return sq & 7; }
inline int rankOf(int sq) { return sq >> 3; }
inline bool onBoard(int f, int r) { return f >= 0 && f < 8 && r >= 0 && r < 8; }
inline int sqOf(int f, int r) { return (r << 3) | f; }

inline std::string sqToAlg(int sq) {
    std::string s;
    s.push_back(static_cast<char>('a' + fileOf(sq)));
    s.push_back(static_cast<char>('1' + rankOf(sq)));
    return s;
}

inline std::optional<int> algToSq(std::string_view sv) {
    if (sv.size() != 2) return std::nullopt;
    if (sv[0] < 'a' || sv[0] > 'h') return std::nullopt;
    if (sv[1] < '1' || sv[1] > '8') return std::nullopt;
    return sqOf(sv[0] - 'a', sv[1] - '1');
}

constexpr int kKnightSteps[8][2] = {{1, 2}, {2, 1}, {2, -1}, {1, -2}, {-1, -2}, {-2, -1}, {-2, 1}, {-1, 2}};
constexpr int kKingSteps[8][2]   = {{1, 0}, {1, 1}, {0, 1}, {-1, 1}, {-1, 0}, {-1, -1}, {0, -1}, {1, -1}};
constexpr int kDiagonals[4][2]   = {{1, 1}, {1, -1}, {-1, 1}, {-1, -1}};
constexpr int kOrthogonals[4][2] = {{1, 0}, {-1, 0}, {0, 1}, {0, -1}};

// ------------------------------ Pieces ------------------------------------

inline bool isWhite(Piece p) { return p >= Piece::WP && p <= Piece::WK; }
inline bool isBlack(Piece p) { return p >= Piece::BP && p <= Piece::BK; }
inline bool isEmpty(Piece p) { return p == Piece::Empty; }

inline bool isColor(Piece p, Color c) {
    return (c == Color::White) ? isWhite(p) : isBlack(p);
}

// Piece letter regardless of color: 'P', 'N', 'B', 'R', 'Q', 'K'.
inline char kindLetter(Piece p) {
    switch (p) {
        case Piece::WP: case Piece::BP: return 'P';
        case Piece::WN: case Piece::BN: return 'N';
        case Piece::WB: case Piece::BB: return 'B';
        case Piece::WR: case Piece::BR: return 'R';
        case Piece::WQ: case Piece::BQ: return 'Q';
        case Piece::WK: case Piece::BK: return 'K';
        default: return 0;
    }
}

inline Piece pieceOf(Color c, char kind) {
    const bool w = (c == Color::White);
    switch (kind) {
        case 'P': return w ? Piece::WP : Piece::BP;
        case 'N': return w ? Piece::WN : Piece::BN;
        case 'B': return w ? Piece::WB : Piece::BB;
        case 'R': return w ? Piece::WR : Piece::BR;
        case 'Q': return w ? Piece::WQ : Piece::BQ;
        case 'K': return w ? Piece::WK : Piece::BK;
        default: return Piece::Empty;
    }
}

inline char pieceToFenChar(Piece p) {
    const char k = kindLetter(p);
    if (!k) return 0;
    return isWhite(p) ? k : static_cast<char>(std::tolower(static_cast<unsigned char>(k)));
}

inline std::optional<Piece> fenCharToPiece(char c) {
    const char upper = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    const Color col = std::isupper(static_cast<unsigned char>(c)) ? Color::White : Color::Black;
    const Piece p = pieceOf(col, upper);
    if (isEmpty(p)) return std::nullopt;
    return p;
}

std::string stripSanDecorations(std::string s) {
    while (!s.empty()) {
        const char c = s.back();
        if (c == '+' || c == '#' || c == '!' || c == '?') {
            s.pop_back();
        } else {
            break;
        }
    }
    return s;
}

} // namespace

bool operator==(const Move& a, const Move& b) {
    return a.from == b.from && a.to == b.to && a.promotion == b.promotion &&
           a.isCastleKing == b.isCastleKing && a.isCastleQueen == b.isCastleQueen;
}

// ------------------------------ Position ----------------------------------

Position Position::startpos() {
    return *fromFen("rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0 1");
}

std::optional<Position> Position::fromFen(const std::string& fen) {
    std::istringstream in(fen);
    std::string placement, active, castling, ep;
    int half = 0, full = 1;
    if (!(in >> placement >> active >> castling >> ep >> half >> full)) {
        return std::nullopt;
    }

    Position p;
    p.board.fill(Piece::Empty);

    int r = 7;
    int f = 0;
    for (char c : placement) {
        if (c == '/') {
            if (f != 8) return std::nullopt;
            --r;
            f = 0;
            continue;
        }
        if (std::isdigit(static_cast<unsigned char>(c))) {
            f += (c - '0');
            if (f > 8) return std::nullopt;
            continue;
        }
        const auto pc = fenCharToPiece(c);
        if (!pc || !onBoard(f, r)) return std::nullopt;
        p.board[sqOf(f, r)] = *pc;
        ++f;
    }
    if (r != 0 || f != 8) {
        return std::nullopt;
    }

    if (active == "w") p.stm = Color::White;
    else if (active == "b") p.stm = Color::Black;
    else return std::nullopt;

    p.wK = p.wQ = p.bK = p.bQ = false;
    if (castling != "-") {
        for (char c : castling) {
            if (c == 'K') p.wK = true;
            else if (c == 'Q') p.wQ = true;
            else if (c == 'k') p.bK = true;
            else if (c == 'q') p.bQ = true;
            else return std::nullopt;
        }
    }

    if (ep != "-") {
        const auto sq = algToSq(ep);
        if (!sq) return std::nullopt;
        p.epSq = *sq;
    }

    if (half < 0 || full < 1) {
        return std::nullopt;
    }
    p.halfmove = half;
    p.fullmove = full;
    return p;
}

std::string Position::toFen() const {
    std::string placement;
    placement.reserve(80);
    for (int r = 7; r >= 0; --r) {
        int emptyRun = 0;
        for (int f = 0; f < 8; ++f) {
            const Piece p = board[sqOf(f, r)];
            if (isEmpty(p)) {
                ++emptyRun;
                continue;
            }
            if (emptyRun > 0) {
                placement.push_back(static_cast<char>('0' + emptyRun));
                emptyRun = 0;
            }
            placement.push_back(pieceToFenChar(p));
        }
        if (emptyRun > 0) placement.push_back(static_cast<char>('0' + emptyRun));
        if (r != 0) placement.push_back('/');
    }

    std::string cast;
    if (wK) cast.push_back('K');
    if (wQ) cast.push_back('Q');
    if (bK) cast.push_back('k');
    if (bQ) cast.push_back('q');
    if (cast.empty()) cast = "-";

    std::ostringstream out;
    out << placement << ' '
        << ((stm == Color::White) ? 'w' : 'b') << ' '
        << cast << ' '
        << (epSq ? sqToAlg(*epSq) : std::string("-")) << ' '
        << halfmove << ' '
        << fullmove;
    return out.str();
}

std::optional<int> Position::kingSquare(Color c) const {
    const Piece k = pieceOf(c, 'K');
    for (int i = 0; i < 64; ++i) {
        if (board[i] == k) return i;
    }
    return std::nullopt;
}

bool Position::squareAttackedBy(int sq, Color by) const {
    const int f = fileOf(sq);
    const int r = rankOf(sq);

    // Pawns attack diagonally forward, so look one rank behind the target.
    const int pr = (by == Color::White) ? r - 1 : r + 1;
    const Piece pawn = pieceOf(by, 'P');
    for (int df : {-1, +1}) {
        if (onBoard(f + df, pr) && board[sqOf(f + df, pr)] == pawn) return true;
    }

    const Piece knight = pieceOf(by, 'N');
    for (const auto& d : kKnightSteps) {
        if (onBoard(f + d[0], r + d[1]) && board[sqOf(f + d[0], r + d[1])] == knight) return true;
    }

    const Piece king = pieceOf(by, 'K');
    for (const auto& d : kKingSteps) {
        if (onBoard(f + d[0], r + d[1]) && board[sqOf(f + d[0], r + d[1])] == king) return true;
    }

    auto rayHits = [&](const int (&dirs)[4][2], Piece a, Piece b) {
        for (const auto& d : dirs) {
            int nf = f + d[0];
            int nr = r + d[1];
            while (onBoard(nf, nr)) {
                const Piece p = board[sqOf(nf, nr)];
                if (!isEmpty(p)) {
                    if (p == a || p == b) return true;
                    break;
                }
                nf += d[0];
                nr += d[1];
            }
        }
        return false;
    };

    const Piece queen = pieceOf(by, 'Q');
    return rayHits(kDiagonals, pieceOf(by, 'B'), queen) ||
           rayHits(kOrthogonals, pieceOf(by, 'R'), queen);
}

bool Position::inCheck(Color c) const {
    const auto ks = kingSquare(c);
    if (!ks) return true; // no king: treat as illegal
    return squareAttackedBy(*ks, opposite(c));
}

std::vector<Move> Position::pseudoMoves() const {
    std::vector<Move> moves;
    moves.reserve(64);

    const Color us = stm;
    const Color them = opposite(us);

    auto push = [&](int from, int to, bool capture) {
        Move m;
        m.from = from;
        m.to = to;
        m.isCapture = capture;
        moves.push_back(m);
    };

    auto pushPawn = [&](int from, int to, bool capture, bool ep, bool promo) {
        if (!promo) {
            Move m;
            m.from = from;
            m.to = to;
            m.isCapture = capture;
            m.isEnPassant = ep;
            moves.push_back(m);
            return;
        }
        for (char k : {'Q', 'R', 'B', 'N'}) {
            Move m;
            m.from = from;
            m.to = to;
            m.isCapture = capture;
            m.promotion = pieceOf(us, k);
            moves.push_back(m);
        }
    };

    auto slide = [&](int sq, const int (&dirs)[4][2]) {
        for (const auto& d : dirs) {
            int nf = fileOf(sq) + d[0];
            int nr = rankOf(sq) + d[1];
            while (onBoard(nf, nr)) {
                const int to = sqOf(nf, nr);
                if (isEmpty(board[to])) {
                    push(sq, to, false);
                } else {
                    if (isColor(board[to], them)) push(sq, to, true);
                    break;
                }
                nf += d[0];
                nr += d[1];
            }
        }
    };

    for (int sq = 0; sq < 64; ++sq) {
        const Piece p = board[sq];
        if (isEmpty(p) || !isColor(p, us)) continue;

        const int f = fileOf(sq);
        const int r = rankOf(sq);

        switch (kindLetter(p)) {
            case 'P': {
                const int dir = (us == Color::White) ? 1 : -1;
                const int startRank = (us == Color::White) ? 1 : 6;
                const int promoRank = (us == Color::White) ? 7 : 0;
                const int r1 = r + dir;
                if (!onBoard(f, r1)) break;

                if (isEmpty(board[sqOf(f, r1)])) {
                    pushPawn(sq, sqOf(f, r1), false, false, r1 == promoRank);
                    if (r == startRank && isEmpty(board[sqOf(f, r + 2 * dir)])) {
                        push(sq, sqOf(f, r + 2 * dir), false);
                    }
                }
                for (int df : {-1, +1}) {
                    if (!onBoard(f + df, r1)) continue;
                    const int to = sqOf(f + df, r1);
                    if (!isEmpty(board[to]) && isColor(board[to], them)) {
                        pushPawn(sq, to, true, false, r1 == promoRank);
                    } else if (epSq && *epSq == to) {
                        pushPawn(sq, to, true, true, false);
                    }
                }
                break;
            }
            case 'N':
                for (const auto& d : kKnightSteps) {
                    if (!onBoard(f + d[0], r + d[1])) continue;
                    const int to = sqOf(f + d[0], r + d[1]);
                    if (isEmpty(board[to])) push(sq, to, false);
                    else if (isColor(board[to], them)) push(sq, to, true);
                }
                break;
            case 'B':
                slide(sq, kDiagonals);
                break;
            case 'R':
                slide(sq, kOrthogonals);
                break;
            case 'Q':
                slide(sq, kDiagonals);
                slide(sq, kOrthogonals);
                break;
            case 'K': {
                for (const auto& d : kKingSteps) {
                    if (!onBoard(f + d[0], r + d[1])) continue;
                    const int to = sqOf(f + d[0], r + d[1]);
                    if (isEmpty(board[to])) push(sq, to, false);
                    else if (isColor(board[to], them)) push(sq, to, true);
                }

                const int home = (us == Color::White) ? 0 : 7;
                if (sq != sqOf(4, home)) break;
                const Piece rook = pieceOf(us, 'R');
                const bool canK = (us == Color::White) ? wK : bK;
                const bool canQ = (us == Color::White) ? wQ : bQ;
                if (canK && isEmpty(board[sqOf(5, home)]) && isEmpty(board[sqOf(6, home)]) &&
                    board[sqOf(7, home)] == rook) {
                    Move m;
                    m.from = sq;
                    m.to = sqOf(6, home);
                    m.isCastleKing = true;
                    moves.push_back(m);
                }
                if (canQ && isEmpty(board[sqOf(3, home)]) && isEmpty(board[sqOf(2, home)]) &&
                    isEmpty(board[sqOf(1, home)]) && board[sqOf(0, home)] == rook) {
                    Move m;
                    m.from = sq;
                    m.to = sqOf(2, home);
                    m.isCastleQueen = true;
                    moves.push_back(m);
                }
                break;
            }
            default:
                break;
        }
    }
    return moves;
}

bool Position::castlePathLegal(Color mover, bool kingSide) const {
    // Checked on the position before the move: the king may not castle out of,
    // through or into check (the landing square is covered by legalMoves()).
    const int home = (mover == Color::White) ? 0 : 7;
    if (inCheck(mover)) return false;
    const int passFile = kingSide ? 5 : 3;
    return !squareAttackedBy(sqOf(passFile, home), opposite(mover));
}

std::vector<Move> Position::legalMoves() const {
    std::vector<Move> out;
    out.reserve(48);
    for (const auto& m : pseudoMoves()) {
        Position copy = *this;
        if (!copy.applyMove(m)) continue;
        if (copy.inCheck(stm)) continue;
        if ((m.isCastleKing || m.isCastleQueen) && !castlePathLegal(stm, m.isCastleKing)) continue;
        out.push_back(m);
    }
    return out;
}

bool Position::epCaptureLegal(int epTarget) const {
    const int f = fileOf(epTarget);
    const int pawnRank = (stm == Color::White) ? rankOf(epTarget) - 1 : rankOf(epTarget) + 1;
    const Piece pawn = pieceOf(stm, 'P');
    for (int df : {-1, +1}) {
        if (!onBoard(f + df, pawnRank) || board[sqOf(f + df, pawnRank)] != pawn) continue;

        Move capture;
        capture.from = sqOf(f + df, pawnRank);
        capture.to = epTarget;
        capture.isCapture = true;
        capture.isEnPassant = true;

        Position copy = *this;
        if (copy.applyMove(capture) && !copy.inCheck(stm)) return true;
    }
    return false;
}

bool Position::applyMove(const Move& m) {
    if (m.from < 0 || m.from > 63 || m.to < 0 || m.to > 63) return false;
    const Piece moving = board[m.from];
    if (isEmpty(moving) || !isColor(moving, stm)) return false;

    const bool pawnMove = (kindLetter(moving) == 'P');
    bool didCapture = m.isCapture;
    epSq = std::nullopt;

    if (m.isCastleKing || m.isCastleQueen) {
        const int home = (stm == Color::White) ? 0 : 7;
        const int rookFrom = m.isCastleKing ? sqOf(7, home) : sqOf(0, home);
        const int rookTo   = m.isCastleKing ? sqOf(5, home) : sqOf(3, home);
        const int kingTo   = m.isCastleKing ? sqOf(6, home) : sqOf(2, home);
        const Piece rook = board[rookFrom];
        if (m.from != sqOf(4, home) || rook != pieceOf(stm, 'R')) return false;

        board[m.from] = Piece::Empty;
        board[rookFrom] = Piece::Empty;
        board[kingTo] = moving;
        board[rookTo] = rook;
        if (stm == Color::White) wK = wQ = false;
        else bK = bQ = false;

        halfmove += 1;
        if (stm == Color::Black) fullmove += 1;
        stm = opposite(stm);
        return true;
    }

    if (m.isEnPassant) {
        const int capSq = sqOf(fileOf(m.to), rankOf(m.from));
        board[capSq] = Piece::Empty;
        didCapture = true;
    }

    // Castling rights go with a king move, a rook move or a rook capture.
    auto dropRightsFor = [&](int sq) {
        if (sq == sqOf(0, 0)) wQ = false;
        if (sq == sqOf(7, 0)) wK = false;
        if (sq == sqOf(0, 7)) bQ = false;
        if (sq == sqOf(7, 7)) bK = false;
    };
    dropRightsFor(m.from);
    dropRightsFor(m.to);
    if (moving == Piece::WK) wK = wQ = false;
    if (moving == Piece::BK) bK = bQ = false;

    board[m.from] = Piece::Empty;
    board[m.to] = (m.promotion != Piece::Empty) ? m.promotion : moving;

    std::optional<int> pushedOver;
    if (pawnMove && (rankOf(m.to) - rankOf(m.from) == 2 || rankOf(m.from) - rankOf(m.to) == 2)) {
        pushedOver = sqOf(fileOf(m.from), (rankOf(m.from) + rankOf(m.to)) / 2);
    }

    if (pawnMove || didCapture) halfmove = 0;
    else halfmove += 1;

    if (stm == Color::Black) fullmove += 1;
    stm = opposite(stm);

    if (pushedOver && epCaptureLegal(*pushedOver)) epSq = pushedOver;
    return true;
}

std::optional<Position> playMove(const Position& pos, const Move& m) {
    Position next = pos;
    if (!next.applyMove(m)) {
        return std::nullopt;
    }
    return next;
}

// ------------------------------- SAN --------------------------------------

std::optional<Move> parseSan(const Position& pos, const std::string& token, std::string* errorOut) {
    auto fail = [&](const std::string& msg) -> std::optional<Move> {
        if (errorOut) *errorOut = msg + ": '" + token + "'";
        return std::nullopt;
    };

    const std::string t = stripSanDecorations(token);
    if (t.empty()) return fail("Empty SAN token");

    const auto legal = pos.legalMoves();

    if (t == "O-O" || t == "0-0" || t == "O-O-O" || t == "0-0-0") {
        const bool kingSide = (t.size() == 3);
        for (const auto& m : legal) {
            if (kingSide ? m.isCastleKing : m.isCastleQueen) return m;
        }
        return fail("Illegal castle");
    }

    char kind = 'P';
    size_t i = 0;
    if (t[0] == 'N' || t[0] == 'B' || t[0] == 'R' || t[0] == 'Q' || t[0] == 'K') {
        kind = t[0];
        i = 1;
    }

    std::string_view core(t);
    std::optional<char> promo;
    const size_t eq = t.find('=');
    if (eq != std::string::npos) {
        if (eq + 1 >= t.size()) return fail("Missing promotion piece");
        promo = t[eq + 1];
        if (*promo != 'Q' && *promo != 'R' && *promo != 'B' && *promo != 'N') {
            return fail("Bad promotion piece");
        }
        core = core.substr(0, eq);
    }

    if (core.size() < i + 2) return fail("Cannot parse SAN token");
    const auto to = algToSq(core.substr(core.size() - 2));
    if (!to) return fail("Bad destination square");

    std::string mods;
    bool capture = false;
    for (char c : core.substr(i, core.size() - 2 - i)) {
        if (c == 'x') capture = true;
        else mods.push_back(c);
    }

    std::optional<int> disFile;
    std::optional<int> disRank;
    for (char c : mods) {
        if (c >= 'a' && c <= 'h' && !disFile) disFile = c - 'a';
        else if (c >= '1' && c <= '8' && !disRank) disRank = c - '1';
        else return fail("Bad disambiguation");
    }
    if (kind == 'P' && disRank) return fail("Bad pawn move");

    const Piece want = pieceOf(pos.stm, kind);
    std::vector<Move> matches;
    for (const auto& m : legal) {
        if (m.isCastleKing || m.isCastleQueen) continue;
        if (m.to != *to || pos.board[m.from] != want) continue;
        if (capture != (m.isCapture || m.isEnPassant)) continue;
        if (disFile && fileOf(m.from) != *disFile) continue;
        if (disRank && rankOf(m.from) != *disRank) continue;
        if (promo) {
            if (kindLetter(m.promotion) != *promo) continue;
        } else if (m.promotion != Piece::Empty) {
            continue;
        }
        matches.push_back(m);
    }

    if (matches.empty()) return fail("No legal move matches SAN token");
    if (matches.size() > 1) return fail("Ambiguous SAN token (multiple legal moves match)");
    return matches.front();
}

std::string encodeSan(const Position& pos, const Move& m) {
    std::string san;

    if (m.isCastleKing) {
        san = "O-O";
    } else if (m.isCastleQueen) {
        san = "O-O-O";
    } else {
        const Piece moving = pos.board[m.from];
        const char kind = kindLetter(moving);
        const bool capture = m.isCapture || m.isEnPassant;

        if (kind == 'P') {
            if (capture) san.push_back(static_cast<char>('a' + fileOf(m.from)));
        } else {
            san.push_back(kind);

            bool ambiguous = false;
            bool sameFile = false;
            bool sameRank = false;
            for (const auto& other : pos.legalMoves()) {
                if (other.to != m.to || other.from == m.from) continue;
                if (pos.board[other.from] != moving) continue;
                ambiguous = true;
                if (fileOf(other.from) == fileOf(m.from)) sameFile = true;
                if (rankOf(other.from) == rankOf(m.from)) sameRank = true;
            }
            if (ambiguous) {
                if (!sameFile) {
                    san.push_back(static_cast<char>('a' + fileOf(m.from)));
                } else if (!sameRank) {
                    san.push_back(static_cast<char>('1' + rankOf(m.from)));
                } else {
                    san += sqToAlg(m.from);
                }
            }
        }

        if (capture) san.push_back('x');
        san += sqToAlg(m.to);

        if (m.promotion != Piece::Empty) {
            san.push_back('=');
            san.push_back(kindLetter(m.promotion));
        }
    }

    const auto after = playMove(pos, m);
    if (after && after->inCheck(after->stm)) {
        san.push_back(after->legalMoves().empty() ? '#' : '+');
    }
    return san;
}

// ------------------------------- UCI --------------------------------------

std::optional<Move> parseUci(const Position& pos, const std::string& uci) {
    if (uci.size() != 4 && uci.size() != 5) return std::nullopt;
    const auto from = algToSq(std::string_view(uci).substr(0, 2));
    const auto to = algToSq(std::string_view(uci).substr(2, 2));
    if (!from || !to) return std::nullopt;

    Piece promo = Piece::Empty;
    if (uci.size() == 5) {
        promo = pieceOf(pos.stm, static_cast<char>(std::toupper(static_cast<unsigned char>(uci[4]))));
        if (isEmpty(promo)) return std::nullopt;
    }

    for (const auto& m : pos.legalMoves()) {
        if (m.from == *from && m.to == *to && m.promotion == promo) return m;
    }
    return std::nullopt;
}

std::string encodeUci(const Move& m) {
    std::string out = sqToAlg(m.from) + sqToAlg(m.to);
    if (m.promotion != Piece::Empty) {
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(kindLetter(m.promotion)))));
    }
    return out;
}

// ------------------------------ Replay ------------------------------------

LineReplayResult replaySanLine(const std::vector<std::string>& sans,
                               const std::optional<std::string>& startFen) {
    LineReplayResult res;

    Position pos;
    if (startFen) {
        const auto p = Position::fromFen(*startFen);
        if (!p) {
            res.error = "Invalid start FEN";
            return res;
        }
        pos = *p;
    } else {
        pos = Position::startpos();
    }

    res.positions.reserve(sans.size() + 1);
    res.sans.reserve(sans.size());
    res.positions.push_back(pos);

    for (const auto& token : sans) {
        std::string err;
        const auto mv = parseSan(pos, token, &err);
        if (!mv) {
            res.error = err + " at ply " + std::to_string(res.sans.size() + 1);
            return res;
        }
        res.sans.push_back(encodeSan(pos, *mv));
        pos.applyMove(*mv);
        res.positions.push_back(pos);
    }

    res.ok = true;
    return res;
}

} // namespace repdag::domain::chess
