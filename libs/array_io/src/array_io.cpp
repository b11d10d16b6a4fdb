#include <motlib/array_io/array_io.hpp>
#include <motlib/array_io/zip_archive.hpp>
#include <motlib/core/logging.hpp>
#include <motlib/core/utils/file_utils.hpp>

#include <tracy/Tracy.hpp>

#include <charconv>
#include <cstdint>
#include <cstring>
#include <limits>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace motlib::array_io {

namespace {

constexpr std::size_t npyV1PreambleSize = npyMagicSize + 2 + 2;
constexpr std::size_t npyV2PreambleSize = npyMagicSize + 2 + 4;

std::uint32_t readLittleEndian(char const* data, std::size_t byteCount) {
  std::uint32_t value = 0;
  for (std::size_t i = 0; i < byteCount; ++i) {
    value |= static_cast<std::uint32_t>(static_cast<unsigned char>(data[i]))
             << (8 * i);
  }
  return value;
}

bool parseDescr(std::string_view descr, ScalarType& outScalarType) {
  if (descr.size() < 3) {
    return false;
  }

  char const byteOrder = descr[0];
  char const kind = descr[1];

  // Big-endian payloads are not produced by any of our writers.
  if (byteOrder != '<' && byteOrder != '|' && byteOrder != '=') {
    return false;
  }

  std::size_t size = 0;
  char const* const sizeEnd = descr.data() + descr.size();
  auto const [ptr, errorCode] =
      std::from_chars(descr.data() + 2, sizeEnd, size);
  if (errorCode != std::errc{} || ptr != sizeEnd) {
    return false;
  }

  outScalarType = ScalarType::unknown;

  switch (kind) {
  case 'f':
    if (size == 4)
      outScalarType = ScalarType::float32;
    else if (size == 8)
      outScalarType = ScalarType::float64;
    break;
  case 'i':
    if (size == 1)
      outScalarType = ScalarType::int8;
    else if (size == 2)
      outScalarType = ScalarType::int16;
    else if (size == 4)
      outScalarType = ScalarType::int32;
    else if (size == 8)
      outScalarType = ScalarType::int64;
    break;
  case 'u':
    if (size == 1)
      outScalarType = ScalarType::uint8;
    else if (size == 2)
      outScalarType = ScalarType::uint16;
    else if (size == 4)
      outScalarType = ScalarType::uint32;
    else if (size == 8)
      outScalarType = ScalarType::uint64;
    break;
  case 'b':
    if (size == 1)
      outScalarType = ScalarType::boolean;
    break;
  }

  return outScalarType != ScalarType::unknown;
}

char const* descrFor(ScalarType scalarType) {
  switch (scalarType) {
  case ScalarType::float32:
    return "<f4";
  case ScalarType::float64:
    return "<f8";
  case ScalarType::int8:
    return "|i1";
  case ScalarType::int16:
    return "<i2";
  case ScalarType::int32:
    return "<i4";
  case ScalarType::int64:
    return "<i8";
  case ScalarType::uint8:
    return "|u1";
  case ScalarType::uint16:
    return "<u2";
  case ScalarType::uint32:
    return "<u4";
  case ScalarType::uint64:
    return "<u8";
  case ScalarType::boolean:
    return "|b1";
  default:
    return nullptr;
  }
}

// Text following "'key':" in the header dict, leading blanks stripped.
bool findDictValue(std::string_view dict, std::string_view key,
                   std::string_view& outValue) {
  for (char const quote : {'\'', '"'}) {
    std::string const quotedKey = quote + std::string{key} + quote;

    std::size_t pos = dict.find(quotedKey);
    if (pos == std::string_view::npos) {
      continue;
    }

    pos = dict.find(':', pos + quotedKey.size());
    if (pos == std::string_view::npos) {
      return false;
    }

    pos = dict.find_first_not_of(" \t", pos + 1);
    if (pos == std::string_view::npos) {
      return false;
    }

    outValue = dict.substr(pos);
    return true;
  }

  return false;
}

bool parseQuotedString(std::string_view text, std::string_view& outValue) {
  if (text.empty() || (text[0] != '\'' && text[0] != '"')) {
    return false;
  }

  std::size_t const closing = text.find(text[0], 1);
  if (closing == std::string_view::npos) {
    return false;
  }

  outValue = text.substr(1, closing - 1);
  return true;
}

bool parseShape(std::string_view text, std::vector<std::size_t>& outShape) {
  if (text.empty() || text[0] != '(') {
    return false;
  }

  std::size_t const closing = text.find(')');
  if (closing == std::string_view::npos) {
    return false;
  }

  std::string_view tuple = text.substr(1, closing - 1);
  outShape.clear();

  while (!tuple.empty()) {
    std::size_t const comma = tuple.find(',');
    std::string_view token = tuple.substr(0, comma);
    tuple = comma == std::string_view::npos ? std::string_view{}
                                            : tuple.substr(comma + 1);

    std::size_t const first = token.find_first_not_of(" \t");
    if (first == std::string_view::npos) {
      continue;
    }
    token = token.substr(first, token.find_last_not_of(" \t") - first + 1);

    std::size_t dim = 0;
    char const* const tokenEnd = token.data() + token.size();
    auto const [ptr, errorCode] = std::from_chars(token.data(), tokenEnd, dim);
    if (errorCode != std::errc{} || ptr != tokenEnd) {
      return false;
    }

    outShape.push_back(dim);
  }

  return true;
}

template <typename T>
void widenValues(char const* src, std::size_t count,
                 std::vector<double>& outValues) {
  outValues.resize(count);

  for (std::size_t i = 0; i < count; ++i) {
    T value;
    std::memcpy(&value, src + i * sizeof(T), sizeof(T));
    outValues[i] = static_cast<double>(value);
  }
}

template <typename T>
void narrowValues(std::vector<double> const& values,
                  std::vector<char>& outBytes) {
  for (double const value : values) {
    T const narrowed = static_cast<T>(value);
    char buffer[sizeof(T)];
    std::memcpy(buffer, &narrowed, sizeof(T));
    outBytes.insert(outBytes.end(), buffer, buffer + sizeof(T));
  }
}

std::vector<double> fortranToCOrder(std::vector<double> const& values,
                                    std::vector<std::size_t> const& shape) {
  if (shape.size() < 2) {
    return values;
  }

  std::vector<std::size_t> fortranStrides(shape.size());
  std::size_t stride = 1;
  for (std::size_t axis = 0; axis < shape.size(); ++axis) {
    fortranStrides[axis] = stride;
    stride *= shape[axis];
  }

  std::vector<double> reordered(values.size());
  std::vector<std::size_t> index(shape.size(), 0);

  for (std::size_t cOffset = 0; cOffset < values.size(); ++cOffset) {
    std::size_t fortranOffset = 0;
    for (std::size_t axis = 0; axis < shape.size(); ++axis) {
      fortranOffset += index[axis] * fortranStrides[axis];
    }

    reordered[cOffset] = values[fortranOffset];

    for (std::size_t axis = shape.size(); axis-- > 0;) {
      if (++index[axis] < shape[axis]) {
        break;
      }
      index[axis] = 0;
    }
  }

  return reordered;
}

std::string shapeToTuple(std::vector<std::size_t> const& shape) {
  std::string tuple = "(";

  for (std::size_t i = 0; i < shape.size(); ++i) {
    if (i) {
      tuple += ", ";
    }
    tuple += std::to_string(shape[i]);
  }

  if (shape.size() == 1) {
    tuple += ",";
  }

  return tuple + ")";
}

} /*namespace*/

bool readArrayHeader(std::span<char const> bytes, ArrayHeader& outHeader) {
  if (bytes.size() < npyMagicSize + 2 ||
      std::memcmp(bytes.data(), npyMagic, npyMagicSize) != 0) {
    MOTLIB_LOG_ERR("Missing npy magic string.");
    return false;
  }

  outHeader.majorVersion = static_cast<unsigned char>(bytes[npyMagicSize]);
  outHeader.minorVersion = static_cast<unsigned char>(bytes[npyMagicSize + 1]);

  std::size_t preambleSize;
  std::size_t headerLength;

  switch (outHeader.majorVersion) {
  case 1:
    preambleSize = npyV1PreambleSize;
    if (bytes.size() < preambleSize) {
      MOTLIB_LOG_ERR("Truncated npy preamble.");
      return false;
    }
    headerLength = readLittleEndian(bytes.data() + npyMagicSize + 2, 2);
    break;
  case 2:
  case 3:
    preambleSize = npyV2PreambleSize;
    if (bytes.size() < preambleSize) {
      MOTLIB_LOG_ERR("Truncated npy preamble.");
      return false;
    }
    headerLength = readLittleEndian(bytes.data() + npyMagicSize + 2, 4);
    break;
  default:
    MOTLIB_LOG_ERR("Unsupported npy version " +
                   std::to_string(outHeader.majorVersion));
    return false;
  }

  if (bytes.size() - preambleSize < headerLength) {
    MOTLIB_LOG_ERR("Truncated npy header.");
    return false;
  }

  std::string_view const dict{bytes.data() + preambleSize, headerLength};

  std::string_view value;
  std::string_view descr;

  if (!findDictValue(dict, "descr", value) ||
      !parseQuotedString(value, descr)) {
    MOTLIB_LOG_ERR("npy header has no descr entry.");
    return false;
  }

  if (!parseDescr(descr, outHeader.scalarType)) {
    MOTLIB_LOG_ERR("Unsupported npy dtype " + std::string{descr});
    return false;
  }

  if (!findDictValue(dict, "fortran_order", value)) {
    MOTLIB_LOG_ERR("npy header has no fortran_order entry.");
    return false;
  }

  if (value.starts_with("True")) {
    outHeader.fortranOrder = true;
  } else if (value.starts_with("False")) {
    outHeader.fortranOrder = false;
  } else {
    MOTLIB_LOG_ERR("Malformed fortran_order entry in npy header.");
    return false;
  }

  if (!findDictValue(dict, "shape", value) ||
      !parseShape(value, outHeader.shape)) {
    MOTLIB_LOG_ERR("Malformed shape entry in npy header.");
    return false;
  }

  outHeader.dataOffset = preambleSize + headerLength;

  return true;
}

bool decodeArray(std::span<char const> bytes, NumericArray& outArray) {
  ZoneScoped;

  ArrayHeader header;
  if (!readArrayHeader(bytes, header)) {
    return false;
  }

  std::size_t count = 0;
  std::size_t const elementSize = scalarSize(header.scalarType);

  if (!elementSize || !elementCount(header.shape, count) ||
      count > std::numeric_limits<std::size_t>::max() / elementSize) {
    MOTLIB_LOG_ERR("npy shape " + shapeToTuple(header.shape) +
                   " is too large.");
    return false;
  }

  std::size_t const payloadSize = count * elementSize;

  if (bytes.size() - header.dataOffset < payloadSize) {
    MOTLIB_LOG_ERR("Truncated npy payload, expected " +
                   std::to_string(payloadSize) + " bytes.");
    return false;
  }

  char const* const src = bytes.data() + header.dataOffset;
  std::vector<double> values;

  switch (header.scalarType) {
  case ScalarType::float32:
    widenValues<float>(src, count, values);
    break;
  case ScalarType::float64:
    widenValues<double>(src, count, values);
    break;
  case ScalarType::int8:
    widenValues<std::int8_t>(src, count, values);
    break;
  case ScalarType::int16:
    widenValues<std::int16_t>(src, count, values);
    break;
  case ScalarType::int32:
    widenValues<std::int32_t>(src, count, values);
    break;
  case ScalarType::int64:
    widenValues<std::int64_t>(src, count, values);
    break;
  case ScalarType::uint8:
  case ScalarType::boolean:
    widenValues<std::uint8_t>(src, count, values);
    break;
  case ScalarType::uint16:
    widenValues<std::uint16_t>(src, count, values);
    break;
  case ScalarType::uint32:
    widenValues<std::uint32_t>(src, count, values);
    break;
  case ScalarType::uint64:
    widenValues<std::uint64_t>(src, count, values);
    break;
  default:
    return false;
  }

  outArray.scalarType = header.scalarType;
  outArray.values = header.fortranOrder ? fortranToCOrder(values, header.shape)
                                        : std::move(values);
  outArray.shape = std::move(header.shape);

  return true;
}

bool decodeArrayBundle(std::span<char const> bytes, ArrayBundle& outBundle) {
  ZoneScoped;

  std::vector<ZipEntry> entries;
  if (!readZipDirectory(bytes, entries)) {
    return false;
  }

  std::string_view const memberExt{bundleMemberExt};
  outBundle.arrays.clear();

  for (ZipEntry const& entry : entries) {
    if (!entry.name.ends_with(memberExt)) {
      MOTLIB_LOG_MSG("Skipping non-array bundle member " + entry.name);
      continue;
    }

    std::vector<char> memberBytes;
    if (!extractZipEntry(bytes, entry, memberBytes)) {
      return false;
    }

    NumericArray array;
    if (!decodeArray(memberBytes, array)) {
      MOTLIB_LOG_ERR("Failed to decode bundle member " + entry.name);
      return false;
    }

    std::string name =
        entry.name.substr(0, entry.name.size() - memberExt.size());
    outBundle.arrays.emplace(std::move(name), std::move(array));
  }

  return true;
}

bool encodeArray(NumericArray const& array, std::vector<char>& outBytes) {
  ZoneScoped;

  char const* const descr = descrFor(array.scalarType);
  if (!descr) {
    MOTLIB_LOG_ERR("Cannot encode array with unknown scalar type.");
    return false;
  }

  std::size_t count = 0;
  if (!elementCount(array.shape, count) || count != array.values.size()) {
    MOTLIB_LOG_ERR("Array shape does not match its value count.");
    return false;
  }

  std::string header = std::string{"{'descr': '"} + descr +
                       "', 'fortran_order': False, 'shape': " +
                       shapeToTuple(array.shape) + ", }";

  unsigned char majorVersion = 1;
  std::size_t preambleSize = npyV1PreambleSize;

  // Padded length including the terminating newline.
  auto const paddedLength = [&header](std::size_t preamble) {
    std::size_t const unpadded = preamble + header.size() + 1;
    return unpadded + (npyHeaderAlignment - unpadded % npyHeaderAlignment) %
                          npyHeaderAlignment -
           preamble;
  };

  if (paddedLength(npyV1PreambleSize) > 0xffff) {
    majorVersion = 2;
    preambleSize = npyV2PreambleSize;
  }

  std::size_t const headerLength = paddedLength(preambleSize);
  header.resize(headerLength - 1, ' ');
  header.push_back('\n');

  outBytes.clear();
  outBytes.insert(outBytes.end(), npyMagic, npyMagic + npyMagicSize);
  outBytes.push_back(static_cast<char>(majorVersion));
  outBytes.push_back(0);

  std::size_t const lengthBytes = preambleSize - npyMagicSize - 2;
  for (std::size_t i = 0; i < lengthBytes; ++i) {
    outBytes.push_back(static_cast<char>((headerLength >> (8 * i)) & 0xff));
  }

  outBytes.insert(outBytes.end(), header.cbegin(), header.cend());

  switch (array.scalarType) {
  case ScalarType::float32:
    narrowValues<float>(array.values, outBytes);
    break;
  case ScalarType::float64:
    narrowValues<double>(array.values, outBytes);
    break;
  case ScalarType::int8:
    narrowValues<std::int8_t>(array.values, outBytes);
    break;
  case ScalarType::int16:
    narrowValues<std::int16_t>(array.values, outBytes);
    break;
  case ScalarType::int32:
    narrowValues<std::int32_t>(array.values, outBytes);
    break;
  case ScalarType::int64:
    narrowValues<std::int64_t>(array.values, outBytes);
    break;
  case ScalarType::uint8:
    narrowValues<std::uint8_t>(array.values, outBytes);
    break;
  case ScalarType::uint16:
    narrowValues<std::uint16_t>(array.values, outBytes);
    break;
  case ScalarType::uint32:
    narrowValues<std::uint32_t>(array.values, outBytes);
    break;
  case ScalarType::uint64:
    narrowValues<std::uint64_t>(array.values, outBytes);
    break;
  case ScalarType::boolean:
    for (double const value : array.values) {
      outBytes.push_back(value != 0.0 ? 1 : 0);
    }
    break;
  default:
    return false;
  }

  return true;
}

bool loadArrayFromFile(fs::path const& path, NumericArray& outArray) {
  ZoneScoped;

  std::vector<char> bytes;
  if (!core::utils::readFileBytes(path, bytes)) {
    return false;
  }

  if (!decodeArray(bytes, outArray)) {
    MOTLIB_LOG_ERR("Failed to decode array file " + path.string());
    return false;
  }

  return true;
}

bool loadArrayBundleFromFile(fs::path const& path, ArrayBundle& outBundle) {
  ZoneScoped;

  std::vector<char> bytes;
  if (!core::utils::readFileBytes(path, bytes)) {
    return false;
  }

  if (!decodeArrayBundle(bytes, outBundle)) {
    MOTLIB_LOG_ERR("Failed to decode array bundle file " + path.string());
    return false;
  }

  return true;
}

bool saveArrayToFile(fs::path const& path, NumericArray const& array) {
  std::vector<char> bytes;
  if (!encodeArray(array, bytes)) {
    return false;
  }

  return core::utils::writeFileAtomically(path, bytes);
}

bool saveArrayBundleToFile(fs::path const& path, ArrayBundle const& bundle) {
  std::vector<std::pair<std::string, std::vector<char>>> members;

  for (auto const& [name, array] : bundle.arrays) {
    std::vector<char> bytes;
    if (!encodeArray(array, bytes)) {
      MOTLIB_LOG_ERR("Failed to encode bundle member " + name);
      return false;
    }
    members.emplace_back(name + bundleMemberExt, std::move(bytes));
  }

  std::vector<char> archive;
  if (!writeStoredZip(members, archive)) {
    return false;
  }

  return core::utils::writeFileAtomically(path, archive);
}

} /*namespace motlib::array_io*/
