#include "emitter.hpp"
#include "board.hpp"
#include "errors.hpp"
#include "move.hpp"
#include <cctype>
#include <cstdio>

namespace fenrom {

std::string MoveRecord::text() const
{
    return puzzleId + "," + board + "," + moveIndex + "," +
           std::to_string(moveNumber) + "," + std::to_string(totalMoves);
}

std::string recordName(const Puzzle& puzzle, const std::string& themeLabel, size_t moveNumber)
{
    char number[24];
    std::snprintf(number, sizeof(number), "%02zu", moveNumber);
    return "puzzle-" + puzzle.id + "-" + std::to_string(puzzle.rating) + "-" + themeLabel + "-" + number + ".txt";
}

std::string groupKey(const std::string& name)
{
    size_t hyphen = name.rfind('-');
    if (hyphen == std::string::npos) return name;
    return name.substr(0, hyphen);
}

bool PuzzleEmitter::lastPieceAllowed(char piece) const
{
    const char lowered = static_cast<char>(std::tolower(static_cast<unsigned char>(piece)));
    return config.lastMovePieces.find(lowered) != std::string::npos;
}

void PuzzleEmitter::validate(const Puzzle& puzzle) const
{
    std::string board = puzzle.board();
    for (const auto& text : puzzle.moves) {
        board = applyMove(board, parseMove(text)).board;
    }
}

std::vector<MoveRecord> PuzzleEmitter::buildRecords(const Puzzle& puzzle, char& lastMovedPiece) const
{
    // The device draws white at the bottom. A puzzle starting with white's
    // move is solved by black, so its positions are shown mirrored.
    const bool mirrored = puzzle.firstMove == Side::White;

    std::vector<MoveRecord> records;
    records.reserve(puzzle.moves.size());

    std::string board = puzzle.board();
    for (size_t i = 0; i < puzzle.moves.size(); ++i) {
        const std::string& text = puzzle.moves[i];
        AppliedMove applied = applyMove(board, parseMove(text));
        board = applied.board;
        lastMovedPiece = applied.movedPiece;

        MoveRecord record;
        record.puzzleId = puzzle.id;
        record.board = expandBoard(mirrored ? mirrorBoard(board) : board);
        record.moveIndex = indexMove(text, mirrored);
        record.moveNumber = i + 1;
        record.totalMoves = puzzle.moves.size();
        records.push_back(std::move(record));
    }
    return records;
}

void PuzzleEmitter::persist(const Puzzle& puzzle, const std::vector<MoveRecord>& records)
{
    const std::string theme = config.themeLabel();
    std::vector<std::string> written;
    written.reserve(records.size());

    try {
        for (const auto& record : records) {
            std::string name = recordName(puzzle, theme, record.moveNumber);
            sink->write(name, record.text());
            written.push_back(std::move(name));
        }
    } catch (const IoError& e) {
        // Never leave a partial puzzle behind; removal is best effort and the
        // write failure stays the reported cause.
        std::string leftover;
        for (const auto& name : written) {
            try {
                sink->remove(name);
            } catch (const IoError&) {
                leftover += " " + name;
            }
        }
        if (!leftover.empty()) {
            throw IoError(std::string(e.what()) + " (rollback could not remove:" + leftover + ")");
        }
        throw;
    }
}

EmitResult PuzzleEmitter::emit(const Puzzle& puzzle, size_t pagesAvailable)
{
    validate(puzzle);

    EmitResult result;
    std::vector<MoveRecord> records = buildRecords(puzzle, result.lastMovedPiece);

    if (!lastPieceAllowed(result.lastMovedPiece)) {
        return result;
    }
    if (records.size() > pagesAvailable) {
        result.outOfRoom = true;
        return result;
    }

    if (sink) {
        persist(puzzle, records);
    }
    result.accepted = true;
    result.records = records.size();
    return result;
}

} // namespace fenrom
