#include <motlib/serialization/serialization.hpp>

#include <chrono>
#include <ctime>

namespace fs = std::filesystem;

namespace motlib::serialization {

std::string toIsoTimestamp(fs::file_time_type fileTime) {
  using namespace std::chrono;

  auto const systemTime = time_point_cast<system_clock::duration>(
      fs::file_time_type::clock::to_sys(fileTime));

  std::time_t const time = system_clock::to_time_t(systemTime);

  std::tm utcTime = {};
  gmtime_r(&time, &utcTime);

  char buffer[32];
  std::size_t const length =
      std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &utcTime);

  return std::string{buffer, length};
}

} /*namespace motlib::serialization*/
