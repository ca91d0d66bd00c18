#pragma once

#include <string>

namespace ink {

bool FileExists(const std::string& path);
bool DirectoryExists(const std::string& path);

// Parent directory of a path ("." for a bare file name)
std::string DirName(const std::string& path);

// Last path component
std::string BaseName(const std::string& path);

// Extension including the dot, lower-cased ("" when there is none)
std::string FileExtension(const std::string& path);

// Replaces (or appends) the extension; `extension` includes the dot
std::string ChangeExtension(const std::string& path, const std::string& extension);

// Absolute form of an existing path, the input unchanged when it cannot be
// resolved
std::string AbsolutePath(const std::string& path);

// file:// URL for an absolute path, with the characters URLs can not carry
// percent-encoded
std::string FileUrl(const std::string& absolute_path);

// Whole-file helpers. Both return false on I/O errors.
bool ReadFile(const std::string& path, std::string* contents);
bool WriteFile(const std::string& path, const std::string& contents);

// Recursively deletes a directory. Returns false and fills `error` on the
// first failure.
bool RemoveTree(const std::string& path, std::string* error);

}  // namespace ink
