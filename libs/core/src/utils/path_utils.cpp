#include <motlib/core/utils/path_utils.hpp>

#include <algorithm>
#include <iterator>

namespace fs = std::filesystem;

fs::path motlib::core::utils::findDirInParentTree(fs::path const& startDir,
                                                  std::string const& dirName) {
  fs::path currentPath = startDir;

  while (!currentPath.empty()) {

    fs::path targetPath = currentPath / dirName;

    if (fs::exists(targetPath) && fs::is_directory(targetPath)) {
      return targetPath;
    }

    fs::path const parentPath = currentPath.parent_path();
    currentPath = (parentPath == currentPath) ? "" : parentPath;
  }

  return {};
}

fs::path motlib::core::utils::normalizedDirPath(fs::path const& dirPath) {
  fs::path normalDir = dirPath.lexically_normal();

  if (!normalDir.has_filename() && normalDir != normalDir.root_path()) {
    normalDir = normalDir.parent_path();
  }

  return normalDir;
}

std::string
motlib::core::utils::genericRelativePath(fs::path const& absolutePath,
                                         fs::path const& rootPath) {
  fs::path const normalPath = absolutePath.lexically_normal();
  fs::path const normalRoot = normalizedDirPath(rootPath);

  if (!isLexicallyWithin(normalPath, normalRoot)) {
    return {};
  }

  fs::path const relativePath = normalPath.lexically_relative(normalRoot);

  if (relativePath == ".") {
    return {};
  }

  return relativePath.generic_string();
}

bool motlib::core::utils::isLexicallyWithin(fs::path const& path,
                                            fs::path const& dirPath) {
  fs::path const normalPath = path.lexically_normal();
  fs::path const normalDir = dirPath.lexically_normal();

  auto pathIter = normalPath.begin();

  for (fs::path const& dirComponent : normalDir) {
    // "a/b/" normalizes with a trailing empty component
    if (dirComponent.empty()) {
      continue;
    }

    if (pathIter == normalPath.end() || *pathIter != dirComponent) {
      return false;
    }

    ++pathIter;
  }

  return std::none_of(pathIter, normalPath.end(),
                      [](fs::path const& c) { return c == ".."; });
}

bool motlib::core::utils::isPlainFileName(std::string const& name) {
  if (name.empty() || name == "." || name == "..") {
    return false;
  }

  return name.find('/') == std::string::npos &&
         name.find('\\') == std::string::npos &&
         name.find('\0') == std::string::npos;
}
