#pragma once
#include <string>

#include "kernel/host.hpp"

// Reads FILE for editing. A file that does not exist yet yields an empty
// document and `exists` is set to false. Paths that cannot be examined
// (too long, unsearchable parent) raise ie::IoError.
std::string load_edit_source(ie::FileSystem& fsys, const std::string& path, bool& exists);

// True when `path` names an existing file. Throws ie::IoError instead of
// std::filesystem_error.
bool edit_target_exists(const std::string& path);
