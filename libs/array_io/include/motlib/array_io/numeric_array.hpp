#pragma once

#include <cstddef>
#include <initializer_list>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace motlib::array_io {

enum class ScalarType {
  unknown,
  float32,
  float64,
  int8,
  int16,
  int32,
  int64,
  uint8,
  uint16,
  uint32,
  uint64,
  boolean
};

// Values are widened to double and kept in C (row-major) order regardless of
// the on-disk layout. scalarType records the on-disk element type.
struct NumericArray {
  ScalarType scalarType = ScalarType::float64;
  std::vector<std::size_t> shape;
  std::vector<double> values;
};

// Named arrays of an .npz archive, keyed by member name without ".npy".
struct ArrayBundle {
  std::map<std::string, NumericArray> arrays;
};

std::size_t scalarSize(ScalarType scalarType);

// Product of the extents. False if it does not fit in std::size_t.
bool elementCount(std::vector<std::size_t> const& shape,
                  std::size_t& outCount);

// Returns the first array present under any of the given names, in order.
NumericArray const* findArray(ArrayBundle const& bundle,
                              std::initializer_list<std::string_view> names);

} /*namespace motlib::array_io*/
