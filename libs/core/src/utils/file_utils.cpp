#include <motlib/core/logging.hpp>
#include <motlib/core/utils/file_utils.hpp>

#include <tracy/Tracy.hpp>

#include <exception>
#include <fstream>
#include <ios>
#include <system_error>

namespace fs = std::filesystem;

namespace motlib::core::utils {

bool readFileBytes(fs::path const& path, std::vector<char>& outBytes) {
  ZoneScoped;

  std::ifstream inputFileStream;
  inputFileStream.exceptions(std::ios::failbit | std::ios::badbit);

  try {
    inputFileStream.open(path, std::ios_base::in | std::ios_base::binary |
                                   std::ios_base::ate);

    std::streamsize const size = inputFileStream.tellg();
    inputFileStream.seekg(0);

    outBytes.resize(static_cast<std::size_t>(size));
    inputFileStream.read(outBytes.data(), size);
  } catch (std::ios_base::failure const& e) {
    MOTLIB_LOG_ERR("Failed to read file " + path.string() + ": " + e.what());
    return false;
  }

  return true;
}

fs::path partialWritePath(fs::path const& path) {
  return path.parent_path() / ("." + path.filename().string() + ".partial");
}

bool writeFileAtomically(fs::path const& path, std::span<char const> bytes) {
  ZoneScoped;

  fs::path const tempPath = partialWritePath(path);

  try {
    fs::path const directoryPath = path.parent_path();
    if (!directoryPath.empty() && !fs::exists(directoryPath)) {
      fs::create_directories(directoryPath);
    }

    std::ofstream outputFileStream;
    outputFileStream.exceptions(std::ios_base::failbit |
                                std::ios_base::badbit);
    outputFileStream.open(tempPath, std::ios_base::out |
                                        std::ios_base::binary |
                                        std::ios_base::trunc);
    outputFileStream.write(bytes.data(),
                           static_cast<std::streamsize>(bytes.size()));
    outputFileStream.close();

    fs::rename(tempPath, path);
  } catch (std::exception const& e) {
    MOTLIB_LOG_ERR("Failed to write file " + path.string() + ": " + e.what());

    std::error_code errorCode;
    fs::remove(tempPath, errorCode);

    return false;
  }

  return true;
}

} /*namespace motlib::core::utils*/
