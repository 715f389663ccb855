#include "rom.hpp"
#include "emitter.hpp"
#include "errors.hpp"
#include <fstream>

namespace fenrom {

namespace {

// Artifacts may end with a newline when written by hand; rows never do.
std::string trimEnd(std::string text)
{
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r' ||
                             text.back() == ' ' || text.back() == '\t')) {
        text.pop_back();
    }
    return text;
}

} // namespace

std::vector<RecordGroup> groupRecords(const std::vector<std::string>& sortedNames)
{
    std::vector<RecordGroup> groups;
    for (const auto& name : sortedNames) {
        std::string key = groupKey(name);
        if (groups.empty() || groups.back().key != key) {
            groups.push_back({std::move(key), {}});
        }
        groups.back().names.push_back(name);
    }
    return groups;
}

RomImage RomAssembler::assemble(const RecordSink& sink, std::optional<uint32_t> headerPages) const
{
    const size_t capacity = geometry.dataRegionSize();
    const size_t rowSize = geometry.rowSize;

    RomImage image;
    image.bytes.reserve(geometry.flashSize);
    RomStats& stats = image.stats;

    for (const auto& group : groupRecords(sink.list())) {
        const size_t groupSize = group.names.size() * rowSize;
        if (image.bytes.size() + groupSize > capacity) {
            stats.capacityReached = true;
            break;
        }

        for (const auto& name : group.names) {
            const std::string row = trimEnd(sink.read(name));
            if (row.size() > rowSize) {
                throw RomError("Record " + name + " is " + std::to_string(row.size()) +
                               " bytes, rows hold " + std::to_string(rowSize));
            }
            image.bytes.insert(image.bytes.end(), row.begin(), row.end());
            image.bytes.resize(image.bytes.size() + (rowSize - row.size()), 0);
            ++stats.recordsPacked;
        }
        ++stats.puzzlesPacked;
    }

    stats.bytesUsed = image.bytes.size();
    stats.bytesFree = capacity - stats.bytesUsed;
    image.bytes.resize(capacity, 0);

    stats.headerPages = headerPages.value_or(static_cast<uint32_t>(stats.recordsPacked));
    const auto sector = ConfigSector::forPages(stats.headerPages, rowSize).encode(geometry.configSectorSize);
    image.bytes.insert(image.bytes.end(), sector.begin(), sector.end());

    return image;
}

void printRomStats(const RomStats& stats, std::ostream& out)
{
    if (stats.capacityReached) {
        out << "Stopping - next puzzle would exceed ROM capacity\n";
    }
    out << "Used " << stats.bytesUsed << " bytes (" << stats.bytesFree << " free)\n";
    out << stats.puzzlesPacked << " puzzles in " << stats.recordsPacked << " files...\n";
    out << "Header declares " << stats.headerPages << " pages\n";
}

void writeRom(const std::filesystem::path& path, const std::vector<uint8_t>& image)
{
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw IoError("Could not open file for writing: " + path.string());
    }
    out.write(reinterpret_cast<const char*>(image.data()), static_cast<std::streamsize>(image.size()));
    if (!out) {
        throw IoError("Could not write ROM image: " + path.string());
    }
}

} // namespace fenrom
