#include "cli.hpp"
#include <string>

namespace fenrom {

void addArguments(argparse::ArgumentParser& program)
{
    program.add_description("Turns a chess puzzle CSV export into per-move board records and packs them into a flash ROM image.");

    program.add_argument("input")
        .help("Puzzle CSV file (default: standard input)")
        .default_value(std::string("-"))
        .nargs(argparse::nargs_pattern::optional);

    program.add_argument("-V", "--verbose")
        .help("Be verbose")
        .default_value(false)
        .implicit_value(true);

    program.add_argument("--dry-run")
        .help("Only count puzzles")
        .default_value(false)
        .implicit_value(true);

    program.add_argument("--max-moves")
        .help("Maximum moves in a puzzle")
        .default_value(10UL)
        .scan<'u', unsigned long>();

    program.add_argument("--min-moves")
        .help("Minimum moves in a puzzle")
        .default_value(1UL)
        .scan<'u', unsigned long>();

    program.add_argument("--theme-tag")
        .help("Only include puzzles with this theme tag (e.g. mate)");

    program.add_argument("--theme-match")
        .help("How the theme tag is compared: exact or substring")
        .default_value(std::string("exact"));

    program.add_argument("--max-rating")
        .help("Maximum puzzle rating")
        .default_value(3000UL)
        .scan<'u', unsigned long>();

    program.add_argument("--min-rating")
        .help("Minimum puzzle rating")
        .default_value(500UL)
        .scan<'u', unsigned long>();

    program.add_argument("--exclude-pieces")
        .help("Skip puzzles containing any of these pieces, case insensitive (e.g. QR)")
        .default_value(std::string(""));

    program.add_argument("--exclude-scope")
        .help("Where excluded pieces are looked for: fen (whole FEN) or board (placement only)")
        .default_value(std::string("fen"));

    program.add_argument("--last-move-pieces")
        .help("Only keep puzzles whose last move was made by one of these pieces, case insensitive")
        .default_value(std::string("prnbkq"));

    program.add_argument("--from-puzzle-id")
        .help("Skip puzzles with IDs lexicographically before this");

    program.add_argument("--to-puzzle-id")
        .help("Skip puzzles with IDs lexicographically after this");

    program.add_argument("--do-not-generate-rom")
        .help("Skip generating the ROM file")
        .default_value(false)
        .implicit_value(true);

    program.add_argument("--rom-only")
        .help("Do not read puzzles; build the ROM from records already in the output directory")
        .default_value(false)
        .implicit_value(true);

    program.add_argument("--header-counts")
        .help("Page count written to the ROM header: emitted (all kept records) or packed (records that fit)")
        .default_value(std::string("emitted"));

    program.add_argument("-o", "--output-dir")
        .help("Directory receiving one record file per move")
        .default_value(std::string("fenpuzzles"));

    program.add_argument("--rom")
        .help("ROM image file")
        .default_value(std::string("lightnote.rom"));

    program.add_argument("--clean")
        .help("Remove records left in the output directory by an earlier run")
        .default_value(false)
        .implicit_value(true);
}

Config buildConfig(const argparse::ArgumentParser& program)
{
    Config config;
    config.verbose = program.get<bool>("--verbose");
    config.dryRun = program.get<bool>("--dry-run");
    config.maxMoves = program.get<unsigned long>("--max-moves");
    config.minMoves = program.get<unsigned long>("--min-moves");
    config.maxRating = static_cast<uint32_t>(program.get<unsigned long>("--max-rating"));
    config.minRating = static_cast<uint32_t>(program.get<unsigned long>("--min-rating"));
    if (auto tag = program.present("--theme-tag")) {
        config.themeTag = lowercase(*tag);
    }
    config.themeMatch = parseThemeMatch(program.get<std::string>("--theme-match"));
    config.excludePieces = lowercase(program.get<std::string>("--exclude-pieces"));
    config.excludeScope = parseExcludeScope(program.get<std::string>("--exclude-scope"));
    config.lastMovePieces = lowercase(program.get<std::string>("--last-move-pieces"));
    config.fromPuzzleId = program.present("--from-puzzle-id");
    config.toPuzzleId = program.present("--to-puzzle-id");
    config.generateRom = !program.get<bool>("--do-not-generate-rom");
    config.romOnly = program.get<bool>("--rom-only");
    config.headerCounts = parseHeaderCounts(program.get<std::string>("--header-counts"));
    config.outputDir = program.get<std::string>("--output-dir");
    config.romPath = program.get<std::string>("--rom");
    config.clean = program.get<bool>("--clean");
    return config;
}

} // namespace fenrom
