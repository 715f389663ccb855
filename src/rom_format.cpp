#include "rom_format.hpp"

namespace fenrom {

ConfigSector ConfigSector::forPages(uint32_t pages, size_t rowSize)
{
    ConfigSector sector;
    sector.numPages = pages;
    sector.totalSize = static_cast<uint32_t>(pages * rowSize);
    sector.sizes[0] = static_cast<uint32_t>(rowSize);
    return sector;
}

std::vector<uint8_t> ConfigSector::encode(size_t sectorSize) const
{
    std::vector<uint8_t> out;
    out.reserve(sectorSize);

    write_le32(out, magic);
    write_le32(out, numPages);
    write_le32(out, totalSize);
    out.push_back(numTypes);
    out.push_back(fontSize);
    out.push_back(static_cast<uint8_t>(reserved & 0xFF));
    out.push_back(static_cast<uint8_t>((reserved >> 8) & 0xFF));
    for (ContentType type : types) {
        out.push_back(static_cast<uint8_t>(type));
    }
    for (uint32_t size : sizes) {
        write_le32(out, size);
    }

    out.resize(sectorSize, 0);
    return out;
}

ConfigSector ConfigSector::decode(const uint8_t* data)
{
    ConfigSector sector;
    sector.magic = read_le32(data);
    sector.numPages = read_le32(data + 4);
    sector.totalSize = read_le32(data + 8);
    sector.numTypes = data[12];
    sector.fontSize = data[13];
    sector.reserved = static_cast<uint16_t>(data[14] | (data[15] << 8));
    for (size_t i = 0; i < CONTENT_TYPE_SLOTS; ++i) {
        sector.types[i] = static_cast<ContentType>(data[16 + i]);
        sector.sizes[i] = read_le32(data + 20 + 4 * i);
    }
    return sector;
}

} // namespace fenrom
