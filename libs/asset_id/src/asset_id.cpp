#include <motlib/asset_id/asset_id.hpp>
#include <motlib/core/utils/path_utils.hpp>

#include <openssl/evp.h>
#include <openssl/md5.h>

#include <algorithm>
#include <iomanip>
#include <new>
#include <sstream>

namespace fs = std::filesystem;

namespace motlib::asset_id {

AssetId idFromString(std::string_view relativePath) {
  unsigned char digest[MD5_DIGEST_LENGTH];
  unsigned int digestSize = 0;

  // Only fails on allocation failure inside OpenSSL.
  if (!EVP_Digest(relativePath.data(), relativePath.size(), digest,
                  &digestSize, EVP_md5(), nullptr)) {
    throw std::bad_alloc{};
  }

  std::ostringstream hex;
  for (std::size_t i = 0; i < idLength / 2; ++i) {
    hex << std::hex << std::setw(2) << std::setfill('0')
        << static_cast<int>(digest[i]);
  }

  return hex.str();
}

AssetId idFromRelativePath(fs::path const& relativePath) {
  // Same rendering as genericRelativePath() on the listing side. A
  // backslash is an ordinary file name character here.
  return idFromString(relativePath.lexically_normal().generic_string());
}

AssetId idFromAbsolutePath(fs::path const& absolutePath,
                           fs::path const& rootPath) {
  std::string const relativePath =
      core::utils::genericRelativePath(absolutePath, rootPath);

  if (relativePath.empty()) {
    return {};
  }

  return idFromString(relativePath);
}

bool isWellFormedId(std::string_view id) {
  return id.size() == idLength &&
         std::all_of(id.cbegin(), id.cend(), [](char c) {
           return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
         });
}

} /*namespace motlib::asset_id*/
