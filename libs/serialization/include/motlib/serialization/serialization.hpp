#pragma once

#include <nlohmann/json.hpp>

#include <array>
#include <cstring>
#include <filesystem>
#include <string>

namespace motlib::serialization {

template <typename VectorType,
          std::size_t arrSize = sizeof(VectorType) / sizeof(float)>
std::array<float, arrSize> vecToArray(VectorType const& v) {
  std::array<float, arrSize> outArray;
  std::memcpy(outArray.data(), &v.x, sizeof(VectorType));
  return outArray;
}

// Throws nlohmann::json::exception if arrayJson is too short or not numeric.
template <typename VectorType>
VectorType arrayToVector(nlohmann::json const& arrayJson, VectorType& result) {
  constexpr std::size_t numberOfElements = sizeof(VectorType) / sizeof(float);

  for (std::size_t i = 0; i < numberOfElements; ++i) {
    result[i] = arrayJson.at(i).get<float>();
  }

  return result;
}

// UTC, second precision, e.g. "2024-05-01T08:30:00Z".
std::string toIsoTimestamp(std::filesystem::file_time_type fileTime);

} /*namespace motlib::serialization*/
