/**
 * @file rom_format.hpp
 * @brief Layout of the flash image consumed by the puzzle device
 *
 * The image is a fixed-size block:
 *
 *   [ data region: rows of ROW_SIZE bytes, zero padded ][ config sector ]
 *
 * Each row holds one move record as ASCII text followed by zero bytes. The
 * config sector at the end of flash describes the data region.
 */

#ifndef FENROM_ROM_FORMAT_HPP
#define FENROM_ROM_FORMAT_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

// =============================================================================
// BYTE ORDER: ALL MULTI-BYTE HEADER FIELDS ARE LITTLE-ENDIAN
// Example: 0x11131719 is stored as [0x19, 0x17, 0x13, 0x11]
// =============================================================================

namespace fenrom {

/** @brief Size of one data row (one page on the device) */
constexpr size_t ROW_SIZE = 96;

/** @brief Total flash size, 16 MiB */
constexpr size_t FLASH_SIZE = 16 * 1024 * 1024;

/** @brief Size of the trailing config sector (one erase block) */
constexpr size_t CONFIG_SECTOR_SIZE = 0x1000;

/** @brief Magic number at the start of the config sector */
constexpr uint32_t ROM_MAGIC = 0x11131719;

/** @brief Number of content type slots in the config sector */
constexpr size_t CONTENT_TYPE_SLOTS = 4;

/** @brief Bytes of the config sector used by fields; the rest is zero */
constexpr size_t CONFIG_STRUCT_SIZE = 36;

/**
 * @brief Content kinds the device firmware knows how to render
 */
enum class ContentType : uint8_t {
    UNUSED       = 0,
    TEXT         = 1,
    RAW_IMAGE    = 2,
    SENSORS      = 3,
    CHESS_PUZZLE = 4
};

/**
 * @brief Flash dimensions
 *
 * The defaults describe the real device. Smaller geometries are only useful
 * for exercising the capacity cut-off without allocating 16 MiB.
 */
struct RomGeometry {
    size_t flashSize = FLASH_SIZE;
    size_t configSectorSize = CONFIG_SECTOR_SIZE;
    size_t rowSize = ROW_SIZE;

    constexpr size_t dataRegionSize() const noexcept { return flashSize - configSectorSize; }
    constexpr size_t maxPages() const noexcept { return dataRegionSize() / rowSize; }
};

/**
 * @brief Config sector fields
 *
 * Offset | Field            | Size
 * -------|------------------|-----
 * 0      | magic            | 4
 * 4      | num_pages        | 4
 * 8      | total_size       | 4
 * 12     | num_types        | 1
 * 13     | font_size        | 1
 * 14     | reserved         | 2
 * 16     | type[0..3]       | 4
 * 20     | size[0..3]       | 16
 * 36     | zero fill up to the sector size
 */
struct ConfigSector {
    uint32_t magic = ROM_MAGIC;
    uint32_t numPages = 0;
    uint32_t totalSize = 0;
    uint8_t numTypes = 1;
    uint8_t fontSize = 1;
    uint16_t reserved = 0;
    std::array<ContentType, CONTENT_TYPE_SLOTS> types{ContentType::CHESS_PUZZLE, ContentType::UNUSED,
                                                      ContentType::UNUSED, ContentType::UNUSED};
    std::array<uint32_t, CONTENT_TYPE_SLOTS> sizes{static_cast<uint32_t>(ROW_SIZE), 0, 0, 0};

    // Sector describing `pages` rows of `rowSize` bytes of chess puzzles.
    static ConfigSector forPages(uint32_t pages, size_t rowSize = ROW_SIZE);

    // Serialized sector, zero padded to sectorSize.
    std::vector<uint8_t> encode(size_t sectorSize = CONFIG_SECTOR_SIZE) const;

    // Reads the fields back from an encoded sector (at least CONFIG_STRUCT_SIZE bytes).
    static ConfigSector decode(const uint8_t* data);
};

inline void write_le32(std::vector<uint8_t>& out, uint32_t value) noexcept
{
    out.push_back(static_cast<uint8_t>(value & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 16) & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 24) & 0xFF));
}

constexpr inline uint32_t read_le32(const uint8_t* data) noexcept
{
    return static_cast<uint32_t>(data[0]) |
           (static_cast<uint32_t>(data[1]) << 8) |
           (static_cast<uint32_t>(data[2]) << 16) |
           (static_cast<uint32_t>(data[3]) << 24);
}

} // namespace fenrom

#endif // FENROM_ROM_FORMAT_HPP
