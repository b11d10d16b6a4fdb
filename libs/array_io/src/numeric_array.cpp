#include <motlib/array_io/numeric_array.hpp>

#include <limits>

namespace motlib::array_io {

std::size_t scalarSize(ScalarType scalarType) {
  switch (scalarType) {
  case ScalarType::int8:
  case ScalarType::uint8:
  case ScalarType::boolean:
    return 1;
  case ScalarType::int16:
  case ScalarType::uint16:
    return 2;
  case ScalarType::float32:
  case ScalarType::int32:
  case ScalarType::uint32:
    return 4;
  case ScalarType::float64:
  case ScalarType::int64:
  case ScalarType::uint64:
    return 8;
  default:
    return 0;
  }
}

bool elementCount(std::vector<std::size_t> const& shape,
                  std::size_t& outCount) {
  std::size_t count = 1;

  for (std::size_t const extent : shape) {
    if (extent && count > std::numeric_limits<std::size_t>::max() / extent) {
      return false;
    }
    count *= extent;
  }

  outCount = count;

  return true;
}

NumericArray const* findArray(ArrayBundle const& bundle,
                              std::initializer_list<std::string_view> names) {
  for (std::string_view name : names) {
    auto const arrayIter = bundle.arrays.find(std::string{name});

    if (arrayIter != bundle.arrays.cend()) {
      return &arrayIter->second;
    }
  }

  return nullptr;
}

} /*namespace motlib::array_io*/
