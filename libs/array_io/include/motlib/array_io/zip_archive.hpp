#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace motlib::array_io {

enum class ZipCompression : std::uint16_t { stored = 0, deflated = 8 };

struct ZipEntry {
  std::string name;
  std::uint16_t compressionMethod;
  std::uint32_t crc32;
  std::uint64_t compressedSize;
  std::uint64_t uncompressedSize;
  std::uint64_t localHeaderOffset;
};

// Reads the central directory of an in-memory zip archive. zip64 extra fields
// are honored for sizes and offsets, multi-disk archives are rejected.
bool readZipDirectory(std::span<char const> archive,
                      std::vector<ZipEntry>& outEntries);

// Extracts one stored or deflated member and verifies its CRC-32.
bool extractZipEntry(std::span<char const> archive, ZipEntry const& entry,
                     std::vector<char>& outData);

// Writes an archive with every member stored uncompressed.
bool writeStoredZip(
    std::vector<std::pair<std::string, std::vector<char>>> const& members,
    std::vector<char>& outArchive);

} /*namespace motlib::array_io*/
