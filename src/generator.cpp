#include "generator.hpp"
#include "csv.hpp"
#include "errors.hpp"
#include "puzzle.hpp"

namespace fenrom {

void PuzzleGenerator::reportFailure(const Puzzle& puzzle, const Error& e)
{
    err << "Error processing puzzle " << puzzle.id << " (" << to_string(e.kind()) << "): " << e.what() << "\n";
}

bool PuzzleGenerator::processRow(const std::vector<std::string>& row, GeneratorStats& stats)
{
    Puzzle puzzle;
    try {
        puzzle = parsePuzzle(row);
    } catch (const RecordError& e) {
        if (config.verbose) {
            out << "Error parsing puzzle record: " << e.what() << "\n";
        }
        ++stats.failed;
        return true;
    }

    if (auto reason = filter.skipReason(puzzle)) {
        if (config.verbose) {
            out << "Skipping puzzle " << puzzle.id << ": " << *reason << "\n";
        }
        ++stats.skipped;
        return true;
    }

    try {
        const size_t maxPages = config.geometry.maxPages();
        const size_t pagesLeft = stats.pages < maxPages ? maxPages - stats.pages : 0;
        EmitResult result = emitter.emit(puzzle, pagesLeft);
        if (result.outOfRoom) {
            return false;
        }
        if (!result.accepted) {
            if (config.verbose) {
                out << "Dropping puzzle " << puzzle.id << ": last move made by '"
                    << result.lastMovedPiece << "'\n";
            }
            ++stats.rejected;
            return true;
        }
        stats.pages += result.records;
        ++stats.generated;
    } catch (const MoveError& e) {
        reportFailure(puzzle, e);
        ++stats.failed;
    } catch (const BoardError& e) {
        reportFailure(puzzle, e);
        ++stats.failed;
    }
    return true;
}

GeneratorStats PuzzleGenerator::run(std::istream& input)
{
    GeneratorStats stats;
    CsvReader reader(input);

    auto header = reader.next();
    if (!header) {
        return stats;
    }
    if (config.verbose) {
        out << "CSV Headers:";
        for (const auto& column : *header) out << " " << column;
        out << "\n";
    }

    while (auto row = reader.next()) {
        if (!processRow(*row, stats)) {
            stats.capacityReached = true;
            if (config.verbose || config.dryRun) {
                out << "ROM capacity reached (" << config.geometry.maxPages() << " pages)\n";
            }
            break;
        }
        ++stats.recordsRead;
    }
    return stats;
}

void printConfig(const Config& config, std::ostream& out)
{
    out << "Running with configuration:\n";
    out << "  Min rating: " << config.minRating << "\n";
    out << "  Max rating: " << config.maxRating << "\n";
    out << "  Min moves: " << config.minMoves << "\n";
    out << "  Max moves: " << config.maxMoves << "\n";
    if (config.themeTag) {
        out << "  Theme filter: " << *config.themeTag << " (" << to_string(config.themeMatch) << ")\n";
    }
    if (!config.excludePieces.empty()) {
        out << "  Excluding pieces: " << config.excludePieces << " (scan " << to_string(config.excludeScope) << ")\n";
    }
    out << "  Last move pieces: " << config.lastMovePieces << "\n";
    if (config.fromPuzzleId) {
        out << "  From puzzle ID: " << *config.fromPuzzleId << "\n";
    }
    if (config.toPuzzleId) {
        out << "  To puzzle ID: " << *config.toPuzzleId << "\n";
    }
    out << "  Output directory: " << config.outputDir.string() << "\n";
    out << "  ROM generation: " << (config.generateRom ? "enabled" : "disabled") << "\n";
    if (config.generateRom) {
        out << "  ROM file: " << config.romPath.string() << " (header counts " << to_string(config.headerCounts) << ")\n";
    }
}

void printSummary(const GeneratorStats& stats, std::ostream& out)
{
    out << "\nSummary:\n";
    out << "  Total puzzles processed: " << stats.recordsRead << "\n";
    out << "  Puzzles generated: " << stats.generated << "\n";
    out << "  Puzzles skipped: " << stats.skipped << "\n";
    out << "  Puzzles failed: " << stats.failed << "\n";
    out << "  Puzzles dropped by last move piece: " << stats.rejected << "\n";
    out << "  Total screens/pages: " << stats.pages << " (" << stats.pages * ROW_SIZE / 1024 << " KB)\n";
    if (stats.capacityReached) {
        out << "  Stopped early: ROM capacity reached\n";
    }
}

} // namespace fenrom
