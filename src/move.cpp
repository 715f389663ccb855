#include "move.hpp"
#include "board.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>

namespace fenrom {

namespace {

uint8_t parseSquare(std::string_view text, size_t offset)
{
    auto index = squareIndex(text[offset], text[offset + 1]);
    if (!index) {
        throw MoveError("Invalid square '" + std::string(text.substr(offset, 2)) +
                        "' in move '" + std::string(text) + "'");
    }
    return *index;
}

} // namespace

Move parseMove(std::string_view text)
{
    if (text.size() < 4) {
        throw MoveError("Move too short: '" + std::string(text) + "'");
    }

    Move move;
    move.from = parseSquare(text, 0);
    move.to = parseSquare(text, 2);
    if (text.size() > 4) {
        move.promotion = text[4];
    }
    return move;
}

AppliedMove applyMove(std::string_view compactBoard, const Move& move)
{
    std::string expanded = expandBoard(compactBoard);

    size_t highest = std::max(move.from, move.to);
    if (highest >= expanded.size()) {
        throw BoardError("Square " + std::to_string(highest) + " is outside board '" +
                         std::string(compactBoard) + "' (" + std::to_string(expanded.size()) + " squares)");
    }

    const char piece = expanded[move.from];
    char placed = piece;
    if (move.promotion) {
        const auto promotion = static_cast<unsigned char>(*move.promotion);
        placed = std::isupper(static_cast<unsigned char>(piece))
                     ? static_cast<char>(std::toupper(promotion))
                     : static_cast<char>(std::tolower(promotion));
    }

    expanded[move.from] = EMPTY_SQUARE;
    expanded[move.to] = placed;

    return {compressBoard(expanded), piece};
}

std::string indexMove(std::string_view text, bool mirrored)
{
    Move move = parseMove(text);
    uint8_t from = mirrored ? mirrorIndex(move.from) : move.from;
    uint8_t to = mirrored ? mirrorIndex(move.to) : move.to;

    char buffer[8];
    std::snprintf(buffer, sizeof(buffer), "%02u,%02u", static_cast<unsigned>(from), static_cast<unsigned>(to));
    return buffer;
}

} // namespace fenrom
