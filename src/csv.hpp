#pragma once
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace fenrom {

/**
 * @brief Row reader for comma separated puzzle exports
 *
 * Handles double-quoted fields (with "" as an escaped quote and embedded
 * line breaks) and both LF and CRLF line endings.
 */
class CsvReader
{
    std::istream& input;
    size_t lineNumber = 0;

public:
    explicit CsvReader(std::istream& in) : input(in) {}

    // Next row, or nullopt at end of input. Blank lines are skipped.
    std::optional<std::vector<std::string>> next();

    // Line on which the last returned row ended.
    size_t line() const { return lineNumber; }
};

} // namespace fenrom
