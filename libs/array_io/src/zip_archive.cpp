#include <motlib/array_io/zip_archive.hpp>
#include <motlib/core/logging.hpp>

#include <tracy/Tracy.hpp>
#include <zlib.h>

#include <algorithm>
#include <climits>
#include <cstddef>
#include <limits>
#include <string>

namespace motlib::array_io {

namespace {

constexpr std::uint32_t localHeaderSignature = 0x04034b50;
constexpr std::uint32_t centralHeaderSignature = 0x02014b50;
constexpr std::uint32_t endOfCentralDirSignature = 0x06054b50;
constexpr std::uint32_t zip64EndOfCentralDirSignature = 0x06064b50;
constexpr std::uint32_t zip64LocatorSignature = 0x07064b50;
constexpr std::uint16_t zip64ExtraFieldId = 0x0001;

constexpr std::size_t localHeaderSize = 30;
constexpr std::size_t centralHeaderSize = 46;
constexpr std::size_t endOfCentralDirSize = 22;
constexpr std::size_t zip64LocatorSize = 20;
constexpr std::size_t zip64EndOfCentralDirSize = 56;
constexpr std::size_t maxCommentSize = 0xffff;

constexpr std::uint32_t zip64Marker32 = 0xffffffff;
constexpr std::uint16_t zip64Marker16 = 0xffff;

// 1980-01-01, the earliest MS-DOS date
constexpr std::uint16_t dosEpochDate = (0 << 9) | (1 << 5) | 1;

template <typename T>
bool readLE(std::span<char const> bytes, std::size_t offset, T& outValue) {
  if (offset > bytes.size() || bytes.size() - offset < sizeof(T)) {
    return false;
  }

  outValue = 0;
  for (std::size_t i = 0; i < sizeof(T); ++i) {
    outValue |= static_cast<T>(static_cast<unsigned char>(bytes[offset + i]))
                << (8 * i);
  }

  return true;
}

template <typename T> void writeLE(std::vector<char>& outBytes, T value) {
  for (std::size_t i = 0; i < sizeof(T); ++i) {
    outBytes.push_back(static_cast<char>((value >> (8 * i)) & 0xff));
  }
}

std::uint32_t computeCrc32(char const* data, std::size_t size) {
  uLong crc = crc32(0L, Z_NULL, 0);

  while (size) {
    uInt const chunk = static_cast<uInt>(
        std::min<std::size_t>(size, std::numeric_limits<uInt>::max()));
    crc = crc32(crc, reinterpret_cast<Bytef const*>(data), chunk);
    data += chunk;
    size -= chunk;
  }

  return static_cast<std::uint32_t>(crc);
}

bool findEndOfCentralDir(std::span<char const> archive,
                         std::size_t& outOffset) {
  if (archive.size() < endOfCentralDirSize) {
    return false;
  }

  std::size_t const lastCandidate = archive.size() - endOfCentralDirSize;
  std::size_t const firstCandidate =
      lastCandidate > maxCommentSize ? lastCandidate - maxCommentSize : 0;

  for (std::size_t offset = lastCandidate + 1; offset-- > firstCandidate;) {
    std::uint32_t signature;
    if (readLE(archive, offset, signature) &&
        signature == endOfCentralDirSignature) {
      outOffset = offset;
      return true;
    }
  }

  return false;
}

bool readZip64Extra(std::span<char const> extra, ZipEntry& entry,
                    bool needsUncompressed, bool needsCompressed,
                    bool needsOffset) {
  std::size_t offset = 0;

  while (offset + 4 <= extra.size()) {
    std::uint16_t headerId, dataSize;
    readLE(extra, offset, headerId);
    readLE(extra, offset + 2, dataSize);

    std::size_t fieldOffset = offset + 4;
    offset = fieldOffset + dataSize;

    if (headerId != zip64ExtraFieldId) {
      continue;
    }

    if (needsUncompressed) {
      if (!readLE(extra, fieldOffset, entry.uncompressedSize)) {
        return false;
      }
      fieldOffset += 8;
    }

    if (needsCompressed) {
      if (!readLE(extra, fieldOffset, entry.compressedSize)) {
        return false;
      }
      fieldOffset += 8;
    }

    if (needsOffset) {
      if (!readLE(extra, fieldOffset, entry.localHeaderOffset)) {
        return false;
      }
    }

    return true;
  }

  return !(needsUncompressed || needsCompressed || needsOffset);
}

bool inflateRaw(char const* src, std::size_t srcSize, std::size_t dstSize,
                std::vector<char>& outData) {
  ZoneScoped;

  if (srcSize > UINT_MAX || dstSize > UINT_MAX) {
    MOTLIB_LOG_ERR("Deflated zip member is too large.");
    return false;
  }

  outData.resize(dstSize);

  z_stream stream = {};
  if (inflateInit2(&stream, -MAX_WBITS) != Z_OK) {
    MOTLIB_LOG_ERR("Failed to initialize zlib inflate.");
    return false;
  }

  stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(src));
  stream.avail_in = static_cast<uInt>(srcSize);
  stream.next_out = reinterpret_cast<Bytef*>(outData.data());
  stream.avail_out = static_cast<uInt>(dstSize);

  int const result = inflate(&stream, Z_FINISH);
  uLong const totalOut = stream.total_out;
  inflateEnd(&stream);

  if (result != Z_STREAM_END || totalOut != dstSize) {
    MOTLIB_LOG_ERR("zlib inflate failed with code " + std::to_string(result));
    return false;
  }

  return true;
}

} /*namespace*/

bool readZipDirectory(std::span<char const> archive,
                      std::vector<ZipEntry>& outEntries) {
  ZoneScoped;

  std::size_t eocdOffset;
  if (!findEndOfCentralDir(archive, eocdOffset)) {
    MOTLIB_LOG_ERR("Zip end of central directory record not found.");
    return false;
  }

  std::uint16_t diskNumber, centralDirDisk, totalEntries16;
  std::uint32_t centralDirOffset32;
  readLE(archive, eocdOffset + 4, diskNumber);
  readLE(archive, eocdOffset + 6, centralDirDisk);
  readLE(archive, eocdOffset + 10, totalEntries16);
  readLE(archive, eocdOffset + 16, centralDirOffset32);

  std::uint64_t totalEntries = totalEntries16;
  std::uint64_t centralDirOffset = centralDirOffset32;

  if (totalEntries16 == zip64Marker16 || centralDirOffset32 == zip64Marker32) {
    std::uint32_t locatorSignature;
    std::uint64_t zip64EocdOffset;

    if (eocdOffset < zip64LocatorSize ||
        !readLE(archive, eocdOffset - zip64LocatorSize, locatorSignature) ||
        locatorSignature != zip64LocatorSignature ||
        !readLE(archive, eocdOffset - zip64LocatorSize + 8,
                zip64EocdOffset)) {
      MOTLIB_LOG_ERR("Zip64 end of central directory locator is missing.");
      return false;
    }

    std::uint32_t zip64Signature;
    if (!readLE(archive, zip64EocdOffset, zip64Signature) ||
        zip64Signature != zip64EndOfCentralDirSignature ||
        archive.size() - zip64EocdOffset < zip64EndOfCentralDirSize) {
      MOTLIB_LOG_ERR("Zip64 end of central directory record is corrupt.");
      return false;
    }

    readLE(archive, zip64EocdOffset + 32, totalEntries);
    readLE(archive, zip64EocdOffset + 48, centralDirOffset);
  } else if (diskNumber != 0 || centralDirDisk != 0) {
    MOTLIB_LOG_ERR("Multi-disk zip archives are not supported.");
    return false;
  }

  outEntries.clear();
  std::size_t offset = centralDirOffset;

  for (std::uint64_t i = 0; i < totalEntries; ++i) {
    std::uint32_t signature;
    if (!readLE(archive, offset, signature) ||
        signature != centralHeaderSignature ||
        archive.size() - offset < centralHeaderSize) {
      MOTLIB_LOG_ERR("Zip central directory entry " + std::to_string(i) +
                     " is corrupt.");
      return false;
    }

    std::uint16_t flags, nameLength, extraLength, commentLength;
    std::uint32_t compressedSize32, uncompressedSize32, localOffset32;

    ZipEntry entry = {};
    readLE(archive, offset + 8, flags);
    readLE(archive, offset + 10, entry.compressionMethod);
    readLE(archive, offset + 16, entry.crc32);
    readLE(archive, offset + 20, compressedSize32);
    readLE(archive, offset + 24, uncompressedSize32);
    readLE(archive, offset + 28, nameLength);
    readLE(archive, offset + 30, extraLength);
    readLE(archive, offset + 32, commentLength);
    readLE(archive, offset + 42, localOffset32);

    std::size_t const nameOffset = offset + centralHeaderSize;
    std::size_t const extraOffset = nameOffset + nameLength;
    std::size_t const nextOffset = extraOffset + extraLength + commentLength;

    if (nextOffset > archive.size()) {
      MOTLIB_LOG_ERR("Zip central directory is truncated.");
      return false;
    }

    if (flags & 0x1) {
      MOTLIB_LOG_ERR("Encrypted zip members are not supported.");
      return false;
    }

    entry.name.assign(archive.data() + nameOffset, nameLength);
    entry.compressedSize = compressedSize32;
    entry.uncompressedSize = uncompressedSize32;
    entry.localHeaderOffset = localOffset32;

    if (!readZip64Extra(archive.subspan(extraOffset, extraLength), entry,
                        uncompressedSize32 == zip64Marker32,
                        compressedSize32 == zip64Marker32,
                        localOffset32 == zip64Marker32)) {
      MOTLIB_LOG_ERR("Zip64 extra field of " + entry.name + " is corrupt.");
      return false;
    }

    outEntries.push_back(std::move(entry));
    offset = nextOffset;
  }

  return true;
}

bool extractZipEntry(std::span<char const> archive, ZipEntry const& entry,
                     std::vector<char>& outData) {
  ZoneScoped;

  std::uint32_t signature;
  std::uint16_t nameLength, extraLength;

  if (!readLE(archive, entry.localHeaderOffset, signature) ||
      signature != localHeaderSignature ||
      !readLE(archive, entry.localHeaderOffset + 26, nameLength) ||
      !readLE(archive, entry.localHeaderOffset + 28, extraLength)) {
    MOTLIB_LOG_ERR("Zip local header of " + entry.name + " is corrupt.");
    return false;
  }

  std::uint64_t const dataOffset =
      entry.localHeaderOffset + localHeaderSize + nameLength + extraLength;

  if (dataOffset > archive.size() ||
      archive.size() - dataOffset < entry.compressedSize) {
    MOTLIB_LOG_ERR("Zip member " + entry.name + " is truncated.");
    return false;
  }

  char const* const src = archive.data() + dataOffset;

  switch (static_cast<ZipCompression>(entry.compressionMethod)) {
  case ZipCompression::stored:
    if (entry.compressedSize != entry.uncompressedSize) {
      MOTLIB_LOG_ERR("Stored zip member " + entry.name +
                     " has inconsistent sizes.");
      return false;
    }
    outData.assign(src, src + entry.compressedSize);
    break;
  case ZipCompression::deflated:
    if (!inflateRaw(src, entry.compressedSize, entry.uncompressedSize,
                    outData)) {
      MOTLIB_LOG_ERR("Failed to inflate zip member " + entry.name);
      return false;
    }
    break;
  default:
    MOTLIB_LOG_ERR("Unsupported zip compression method " +
                   std::to_string(entry.compressionMethod) + " for " +
                   entry.name);
    return false;
  }

  if (computeCrc32(outData.data(), outData.size()) != entry.crc32) {
    MOTLIB_LOG_ERR("CRC mismatch in zip member " + entry.name);
    return false;
  }

  return true;
}

bool writeStoredZip(
    std::vector<std::pair<std::string, std::vector<char>>> const& members,
    std::vector<char>& outArchive) {
  ZoneScoped;

  constexpr std::uint16_t versionNeeded = 20;

  outArchive.clear();
  std::vector<char> centralDir;

  for (auto const& [name, data] : members) {
    if (name.size() > 0xffff || data.size() >= zip64Marker32 ||
        outArchive.size() >= zip64Marker32) {
      MOTLIB_LOG_ERR("Zip member " + name + " is too large to store.");
      return false;
    }

    std::uint32_t const crc = computeCrc32(data.data(), data.size());
    std::uint32_t const size = static_cast<std::uint32_t>(data.size());
    std::uint32_t const localOffset =
        static_cast<std::uint32_t>(outArchive.size());
    std::uint16_t const nameLength = static_cast<std::uint16_t>(name.size());

    writeLE(outArchive, localHeaderSignature);
    writeLE(outArchive, versionNeeded);
    writeLE(outArchive, std::uint16_t{0}); // flags
    writeLE(outArchive, static_cast<std::uint16_t>(ZipCompression::stored));
    writeLE(outArchive, std::uint16_t{0}); // time
    writeLE(outArchive, dosEpochDate);
    writeLE(outArchive, crc);
    writeLE(outArchive, size);
    writeLE(outArchive, size);
    writeLE(outArchive, nameLength);
    writeLE(outArchive, std::uint16_t{0}); // extra length
    outArchive.insert(outArchive.end(), name.cbegin(), name.cend());
    outArchive.insert(outArchive.end(), data.cbegin(), data.cend());

    writeLE(centralDir, centralHeaderSignature);
    writeLE(centralDir, versionNeeded); // made by
    writeLE(centralDir, versionNeeded);
    writeLE(centralDir, std::uint16_t{0}); // flags
    writeLE(centralDir, static_cast<std::uint16_t>(ZipCompression::stored));
    writeLE(centralDir, std::uint16_t{0}); // time
    writeLE(centralDir, dosEpochDate);
    writeLE(centralDir, crc);
    writeLE(centralDir, size);
    writeLE(centralDir, size);
    writeLE(centralDir, nameLength);
    writeLE(centralDir, std::uint16_t{0}); // extra length
    writeLE(centralDir, std::uint16_t{0}); // comment length
    writeLE(centralDir, std::uint16_t{0}); // disk number start
    writeLE(centralDir, std::uint16_t{0}); // internal attributes
    writeLE(centralDir, std::uint32_t{0}); // external attributes
    writeLE(centralDir, localOffset);
    centralDir.insert(centralDir.end(), name.cbegin(), name.cend());
  }

  if (members.size() >= zip64Marker16 ||
      outArchive.size() >= zip64Marker32) {
    MOTLIB_LOG_ERR("Too many zip members to store.");
    return false;
  }

  std::uint16_t const entryCount = static_cast<std::uint16_t>(members.size());
  std::uint32_t const centralDirOffset =
      static_cast<std::uint32_t>(outArchive.size());
  std::uint32_t const centralDirSize =
      static_cast<std::uint32_t>(centralDir.size());

  outArchive.insert(outArchive.end(), centralDir.cbegin(), centralDir.cend());

  writeLE(outArchive, endOfCentralDirSignature);
  writeLE(outArchive, std::uint16_t{0}); // disk number
  writeLE(outArchive, std::uint16_t{0}); // central directory disk
  writeLE(outArchive, entryCount);
  writeLE(outArchive, entryCount);
  writeLE(outArchive, centralDirSize);
  writeLE(outArchive, centralDirOffset);
  writeLE(outArchive, std::uint16_t{0}); // comment length

  return true;
}

} /*namespace motlib::array_io*/
