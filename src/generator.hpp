#pragma once
#include "config.hpp"
#include "emitter.hpp"
#include "errors.hpp"
#include "sink.hpp"
#include <istream>
#include <ostream>

namespace fenrom {

struct GeneratorStats {
    size_t recordsRead = 0;     ///< Source rows handled, header excluded
    size_t generated = 0;       ///< Puzzles whose records were kept
    size_t skipped = 0;         ///< Rejected by the puzzle filter
    size_t failed = 0;          ///< Malformed row or a move that would not apply
    size_t rejected = 0;        ///< Dropped by the trailing-piece rule
    size_t pages = 0;           ///< Move records kept, one page each
    bool capacityReached = false;
};

/**
 * @brief Runs the puzzle source through filter and emitter
 *
 * Per-puzzle problems are counted and reported, never fatal. Running out of
 * ROM pages ends the run early but cleanly. I/O errors propagate.
 */
class PuzzleGenerator
{
    const Config& config;
    PuzzleEmitter emitter;
    PuzzleFilter filter;
    std::ostream& out;
    std::ostream& err;

    void reportFailure(const Puzzle& puzzle, const Error& e);

    // False when the puzzle would not fit in the remaining ROM pages.
    bool processRow(const std::vector<std::string>& row, GeneratorStats& stats);

public:
    PuzzleGenerator(const Config& cfg, RecordSink* sink, std::ostream& output, std::ostream& errors)
        : config(cfg), emitter(cfg, sink), filter(cfg), out(output), err(errors) {}

    GeneratorStats run(std::istream& input);
};

void printConfig(const Config& config, std::ostream& out);
void printSummary(const GeneratorStats& stats, std::ostream& out);

} // namespace fenrom
