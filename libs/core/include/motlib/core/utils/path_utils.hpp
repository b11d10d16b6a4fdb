#pragma once

#include <filesystem>
#include <string>

namespace motlib::core::utils {

// Recursively searches the directory tree from startDir to the root dir for a
// directory with name dirName and returns its path
std::filesystem::path findDirInParentTree(std::filesystem::path const& startDir,
                                          std::string const& dirName);

// dirPath lexically normalized without a trailing separator, so that
// "/srv/models/" and "/srv/models" compare equal.
std::filesystem::path normalizedDirPath(std::filesystem::path const& dirPath);

// Path of absolutePath relative to rootPath, lexically normalized and rendered
// with forward slashes. Returns an empty string if absolutePath is not inside
// rootPath.
std::string genericRelativePath(std::filesystem::path const& absolutePath,
                                std::filesystem::path const& rootPath);

// True if path, after lexical normalization, is dirPath itself or lies
// inside it. Both paths are expected to be absolute.
bool isLexicallyWithin(std::filesystem::path const& path,
                       std::filesystem::path const& dirPath);

// A single path component usable as a file or directory name: not empty, not
// "." or "..", no separators.
bool isPlainFileName(std::string const& name);

} /*namespace motlib::core::utils*/
