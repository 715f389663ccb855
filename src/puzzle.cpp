#include "puzzle.hpp"
#include "board.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <sstream>

namespace fenrom {

namespace {

std::vector<std::string> splitWhitespace(const std::string& text)
{
    std::vector<std::string> parts;
    std::istringstream stream(text);
    std::string part;
    while (stream >> part) parts.push_back(part);
    return parts;
}

// Themes are comma separated; the Lichess export separates them with spaces.
std::vector<std::string> splitThemes(const std::string& text)
{
    std::vector<std::string> themes;
    std::string current;
    auto flush = [&]() {
        if (!current.empty()) {
            themes.push_back(lowercase(current));
            current.clear();
        }
    };
    for (char c : text) {
        if (c == ',' || std::isspace(static_cast<unsigned char>(c))) {
            flush();
        } else {
            current.push_back(c);
        }
    }
    flush();
    return themes;
}

uint32_t parseRating(const std::string& text)
{
    uint32_t rating = 0;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, rating);
    if (text.empty() || ec != std::errc() || ptr != last) {
        throw RecordError("Invalid rating '" + text + "'");
    }
    return rating;
}

} // namespace

std::string Puzzle::board() const
{
    return boardField(fen);
}

Puzzle parsePuzzle(const std::vector<std::string>& fields)
{
    if (fields.size() < PUZZLE_FIELD_COUNT) {
        throw RecordError("Expected at least " + std::to_string(PUZZLE_FIELD_COUNT) +
                          " fields, got " + std::to_string(fields.size()));
    }

    Puzzle puzzle;
    puzzle.id = fields[0];
    puzzle.fen = fields[1];
    puzzle.moves = splitWhitespace(fields[2]);
    puzzle.rating = parseRating(fields[3]);
    puzzle.themes = splitThemes(fields[7]);

    auto fenParts = splitWhitespace(fields[1]);
    if (fenParts.size() > 1 && fenParts[1][0] == 'b') {
        puzzle.firstMove = Side::Black;
    }
    return puzzle;
}

bool PuzzleFilter::hasTheme(const Puzzle& puzzle) const
{
    const std::string& tag = *config.themeTag;
    return std::any_of(puzzle.themes.begin(), puzzle.themes.end(), [&](const std::string& theme) {
        return config.themeMatch == ThemeMatch::Exact ? theme == tag
                                                      : theme.find(tag) != std::string::npos;
    });
}

std::optional<char> PuzzleFilter::excludedPiece(const Puzzle& puzzle) const
{
    const std::string scanned = config.excludeScope == ExcludeScope::FullFen ? puzzle.fen : puzzle.board();
    for (char excluded : config.excludePieces) {
        for (char c : scanned) {
            if (std::isalpha(static_cast<unsigned char>(c)) &&
                std::tolower(static_cast<unsigned char>(c)) == std::tolower(static_cast<unsigned char>(excluded))) {
                return excluded;
            }
        }
    }
    return std::nullopt;
}

std::optional<std::string> PuzzleFilter::skipReason(const Puzzle& puzzle) const
{
    const size_t moveCount = puzzle.moves.size();

    if (moveCount == 0) {
        return "no moves";
    }
    if (moveCount > config.maxMoves) {
        return "move count " + std::to_string(moveCount) + " > max " + std::to_string(config.maxMoves);
    }
    if (moveCount < config.minMoves) {
        return "move count " + std::to_string(moveCount) + " < min " + std::to_string(config.minMoves);
    }
    if (puzzle.rating > config.maxRating) {
        return "rating " + std::to_string(puzzle.rating) + " > max " + std::to_string(config.maxRating);
    }
    if (puzzle.rating < config.minRating) {
        return "rating " + std::to_string(puzzle.rating) + " < min " + std::to_string(config.minRating);
    }
    if (auto piece = excludedPiece(puzzle)) {
        return std::string("contains excluded piece '") + *piece + "'";
    }
    if (config.themeTag && !hasTheme(puzzle)) {
        std::string has;
        for (size_t i = 0; i < puzzle.themes.size(); ++i) {
            if (i > 0) has += ", ";
            has += puzzle.themes[i];
        }
        return "missing required theme '" + *config.themeTag + "' (has: " + has + ")";
    }
    if (config.fromPuzzleId && puzzle.id < *config.fromPuzzleId) {
        return "ID " + puzzle.id + " < from ID " + *config.fromPuzzleId;
    }
    if (config.toPuzzleId && puzzle.id > *config.toPuzzleId) {
        return "ID " + puzzle.id + " > to ID " + *config.toPuzzleId;
    }
    return std::nullopt;
}

} // namespace fenrom
