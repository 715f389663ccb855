#pragma once
#include "rom_format.hpp"
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace fenrom {

// Which part of the FEN the excluded-piece scan looks at.
enum class ExcludeScope {
    FullFen, // every letter of the raw FEN, side-to-move and castling included
    Board    // piece placement field only
};

enum class ThemeMatch {
    Exact,
    Substring
};

// Where the ROM header takes its page count from.
enum class HeaderCounts {
    Emitted, // records accepted during emission
    Packed   // records that actually fit in the data region
};

struct Config {
    bool verbose = false;
    bool dryRun = false;

    // --- Puzzle filter ---
    size_t maxMoves = 10;
    size_t minMoves = 1;
    uint32_t maxRating = 3000;
    uint32_t minRating = 500;
    std::optional<std::string> themeTag;
    ThemeMatch themeMatch = ThemeMatch::Exact;
    std::string excludePieces;            // lowercase
    ExcludeScope excludeScope = ExcludeScope::FullFen;
    std::optional<std::string> fromPuzzleId;
    std::optional<std::string> toPuzzleId;

    // --- Emitter ---
    std::string lastMovePieces = "prnbkq"; // lowercase
    std::filesystem::path outputDir = "fenpuzzles";
    bool clean = false;

    // --- ROM ---
    bool generateRom = true;
    bool romOnly = false;
    HeaderCounts headerCounts = HeaderCounts::Emitted;
    std::filesystem::path romPath = "lightnote.rom";
    RomGeometry geometry;

    // Theme component of record names.
    std::string themeLabel() const { return themeTag.value_or("none"); }
};

const char* to_string(ExcludeScope scope);
const char* to_string(ThemeMatch match);
const char* to_string(HeaderCounts counts);

// Parsers for the enum-valued command line options. Throw std::invalid_argument.
ExcludeScope parseExcludeScope(const std::string& text);
ThemeMatch parseThemeMatch(const std::string& text);
HeaderCounts parseHeaderCounts(const std::string& text);

// ASCII lowercase copy, used for piece sets and theme tags ("pN" -> "pn").
std::string lowercase(const std::string& text);

} // namespace fenrom
