#pragma once

#include <motlib/array_io/numeric_array.hpp>

#include <cstddef>
#include <filesystem>
#include <span>
#include <vector>

namespace motlib::array_io {

constexpr char const* npyMagic = "\x93NUMPY";
constexpr std::size_t npyMagicSize = 6;
constexpr std::size_t npyHeaderAlignment = 64;
constexpr char const* bundleMemberExt = ".npy";

struct ArrayHeader {
  unsigned char majorVersion = 0;
  unsigned char minorVersion = 0;
  ScalarType scalarType = ScalarType::unknown;
  bool fortranOrder = false;
  std::vector<std::size_t> shape;
  std::size_t dataOffset = 0;
};

bool readArrayHeader(std::span<char const> bytes, ArrayHeader& outHeader);

bool decodeArray(std::span<char const> bytes, NumericArray& outArray);

// Decodes every .npy member of an .npz archive. Members with other extensions
// are skipped.
bool decodeArrayBundle(std::span<char const> bytes, ArrayBundle& outBundle);

// Serializes array as a version 1.0 .npy stream (2.0 if the header does not
// fit), converting values to array.scalarType.
bool encodeArray(NumericArray const& array, std::vector<char>& outBytes);

bool loadArrayFromFile(std::filesystem::path const& path,
                       NumericArray& outArray);

bool loadArrayBundleFromFile(std::filesystem::path const& path,
                             ArrayBundle& outBundle);

bool saveArrayToFile(std::filesystem::path const& path,
                     NumericArray const& array);

// Members are stored uncompressed.
bool saveArrayBundleToFile(std::filesystem::path const& path,
                           ArrayBundle const& bundle);

} /*namespace motlib::array_io*/
