#pragma once
#include "config.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace fenrom {

enum class Side {
    White,
    Black
};

struct Puzzle {
    std::string id;
    std::string fen;                 ///< Full FEN as given by the source
    std::vector<std::string> moves;  ///< Coordinate notation, in play order
    uint32_t rating = 0;
    std::vector<std::string> themes; ///< Lowercase
    Side firstMove = Side::White;    ///< FEN side-to-move

    // Piece placement field of the FEN.
    std::string board() const;
};

// Minimum number of fields a source row must carry.
constexpr size_t PUZZLE_FIELD_COUNT = 8;

/**
 * @brief Build a puzzle from one source row
 *
 * Field layout: 0 id, 1 FEN, 2 moves, 3 rating, 7 themes. Other fields are
 * ignored.
 *
 * @throws RecordError if fewer than 8 fields are present or the rating is not
 *         an unsigned decimal number
 */
Puzzle parsePuzzle(const std::vector<std::string>& fields);

/**
 * @brief Metadata predicate applied before any board work
 *
 * Checks run in a fixed order and the first failing check names the reason:
 * empty move list, move count, rating, excluded pieces, theme, id range.
 */
class PuzzleFilter
{
    const Config& config;

    bool hasTheme(const Puzzle& puzzle) const;
    std::optional<char> excludedPiece(const Puzzle& puzzle) const;

public:
    explicit PuzzleFilter(const Config& cfg) : config(cfg) {}

    // Reason the puzzle is rejected, or nullopt if it passes.
    std::optional<std::string> skipReason(const Puzzle& puzzle) const;

    bool accepts(const Puzzle& puzzle) const { return !skipReason(puzzle).has_value(); }
};

} // namespace fenrom
