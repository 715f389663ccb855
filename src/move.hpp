#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace fenrom {

/**
 * @brief A move in coordinate notation ("e2e4", "a7a8q") resolved to flat
 * board indices
 *
 * Moves are applied mechanically. Nothing here knows chess rules.
 */
struct Move {
    uint8_t from = 0;
    uint8_t to = 0;
    std::optional<char> promotion; ///< Piece letter as written; cased on application
};

/**
 * @brief Parse coordinate notation
 *
 * Characters 0-1 are the source square, 2-3 the destination, an optional
 * 5th character is the promotion piece.
 *
 * @throws MoveError if the text is shorter than 4 characters or a square is
 *         not a1..h8
 */
Move parseMove(std::string_view text);

// Result of applying a move to a compact board.
struct AppliedMove {
    std::string board; ///< Compact board after the move
    char movedPiece;   ///< Piece that stood on the source square, before any promotion
};

/**
 * @brief Apply a move to a compact board
 *
 * The source square is emptied and the destination receives the source
 * piece, or the promotion letter cased to the source piece's colour.
 *
 * @throws BoardError if the expanded board is too short to contain a square
 *         the move references (malformed FEN)
 */
AppliedMove applyMove(std::string_view compactBoard, const Move& move);

/**
 * @brief Device index pair for a move, formatted "FF,TT"
 *
 * Each index is zero-padded to two digits. With @p mirrored set, both indices
 * are point-reflected through the board centre, matching a mirrored board.
 *
 * @throws MoveError on malformed move text
 */
std::string indexMove(std::string_view text, bool mirrored);

} // namespace fenrom
