#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace fenrom {

constexpr size_t BOARD_SQUARES = 64;
constexpr size_t BOARD_FILES = 8;
constexpr char EMPTY_SQUARE = '1';
constexpr char RANK_SEPARATOR = '/';

// =============================================================================
// SQUARE COORDINATES
// =============================================================================

/**
 * @brief Flat index of a square given in coordinate notation
 *
 * Index 0 is a8 and index 63 is h1: ranks run 8 -> 1, files a -> h, the same
 * order the expanded board string uses.
 *
 * @return nullopt when the file is not a-h or the rank is not 1-8
 */
constexpr std::optional<uint8_t> squareIndex(char file, char rank) noexcept
{
    if (file < 'a' || file > 'h' || rank < '1' || rank > '8')
        return std::nullopt;
    return static_cast<uint8_t>((8 - (rank - '0')) * 8 + (file - 'a'));
}

/**
 * @brief Point reflection of a square through the centre of the board
 *
 * a8 <-> h1, e2 <-> d7. Equivalent to |index - 63| for indices in 0..63.
 */
constexpr uint8_t mirrorIndex(uint8_t index) noexcept
{
    return static_cast<uint8_t>(63 - index);
}

// =============================================================================
// BOARD CODEC
// =============================================================================

// Unrolls digits 1-8 into runs of EMPTY_SQUARE and drops the rank separators.
// The result is cut to 64 squares. Malformed input is not rejected here: it
// simply produces a short board, which move application reports.
std::string expandBoard(std::string_view compact);

// Inverse of expandBoard for any 64-square board. A separator is inserted
// every 8 squares before empty runs are counted, so no count exceeds 8.
std::string compressBoard(std::string_view expanded);

// Reverses the rank order and the squares within each rank, i.e. shows the
// compact board from the other side. Works directly on the compact form.
std::string mirrorBoard(std::string_view compact);

// First whitespace-separated token of a FEN (the piece placement field).
std::string boardField(std::string_view fen);

} // namespace fenrom
