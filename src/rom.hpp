#pragma once
#include "rom_format.hpp"
#include "sink.hpp"
#include <cstdint>
#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace fenrom {

// Artifacts of one puzzle, in move order.
struct RecordGroup {
    std::string key;
    std::vector<std::string> names;
};

// Groups sorted artifact names by groupKey. Consecutive names with the same
// key form one group.
std::vector<RecordGroup> groupRecords(const std::vector<std::string>& sortedNames);

struct RomStats {
    size_t puzzlesPacked = 0;
    size_t recordsPacked = 0;
    size_t bytesUsed = 0;      ///< Data region bytes holding records
    size_t bytesFree = 0;      ///< Data region bytes left as padding
    bool capacityReached = false;
    uint32_t headerPages = 0;  ///< Page count written to the config sector
};

struct RomImage {
    std::vector<uint8_t> bytes;
    RomStats stats;
};

/**
 * @brief Packs persisted move records into a flash image
 *
 * Whole puzzle groups are appended in key order until the next group would
 * overflow the data region; the remaining groups are left out. The image is
 * always exactly geometry.flashSize bytes.
 */
class RomAssembler
{
    RomGeometry geometry;

public:
    explicit RomAssembler(RomGeometry geo = {}) : geometry(geo) {}

    /**
     * @param sink         Source of the move records
     * @param headerPages  Page count for the config sector; nullopt uses the
     *                     number of records actually packed
     * @throws RomError if a record does not fit in one row
     * @throws IoError  if a record cannot be read
     */
    RomImage assemble(const RecordSink& sink, std::optional<uint32_t> headerPages = std::nullopt) const;
};

void printRomStats(const RomStats& stats, std::ostream& out);

// Writes the image, replacing any existing file. Throws IoError.
void writeRom(const std::filesystem::path& path, const std::vector<uint8_t>& image);

} // namespace fenrom
