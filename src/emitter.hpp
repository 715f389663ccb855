#pragma once
#include "config.hpp"
#include "puzzle.hpp"
#include "sink.hpp"
#include <limits>
#include <string>
#include <vector>

namespace fenrom {

/**
 * @brief One emitted move: the position the device shows after the move
 *
 * Text form: id,board64,FF,TT,moveNumber,totalMoves
 */
struct MoveRecord {
    std::string puzzleId;
    std::string board;      ///< Expanded board after the move, device oriented
    std::string moveIndex;  ///< "FF,TT" from indexMove
    size_t moveNumber = 0;  ///< 1-based
    size_t totalMoves = 0;

    std::string text() const;
};

// Artifact name: puzzle-<id>-<rating>-<theme>-<NN>.txt
std::string recordName(const Puzzle& puzzle, const std::string& themeLabel, size_t moveNumber);

// Everything before the trailing move number of an artifact name. Records
// sharing a key belong to one puzzle.
std::string groupKey(const std::string& name);

struct EmitResult {
    bool accepted = false;    ///< False when the trailing-piece rule rejected the puzzle or it did not fit
    bool outOfRoom = false;   ///< Accepted by the rules, but more records than pages left
    size_t records = 0;       ///< Records persisted (or that would be, on a dry run)
    char lastMovedPiece = ' ';
};

/**
 * @brief Turns an accepted puzzle into per-move records
 *
 * All moves are validated against a scratch board before anything is built,
 * so a bad move never leaves part of a puzzle behind. A puzzle whose final
 * move was not made by one of the configured last-move pieces produces no
 * records at all.
 */
class PuzzleEmitter
{
    const Config& config;
    RecordSink* sink; // nullptr on a dry run

    bool lastPieceAllowed(char piece) const;
    void persist(const Puzzle& puzzle, const std::vector<MoveRecord>& records);

public:
    PuzzleEmitter(const Config& cfg, RecordSink* out) : config(cfg), sink(out) {}

    // Applies every move in order. Throws MoveError or BoardError on the first failure.
    void validate(const Puzzle& puzzle) const;

    // Replays the moves and builds one record per move.
    std::vector<MoveRecord> buildRecords(const Puzzle& puzzle, char& lastMovedPiece) const;

    // Persists the puzzle's records only when it passes the trailing-piece
    // rule and its record count fits in pagesAvailable.
    EmitResult emit(const Puzzle& puzzle, size_t pagesAvailable = std::numeric_limits<size_t>::max());
};

} // namespace fenrom
