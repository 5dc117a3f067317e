// FILE: src/cli/load_edit_source.cpp
#include "cli/load_edit_source.hpp"

#include <system_error>

using namespace ie;

bool edit_target_exists(const std::string& path) {
    std::error_code ec;
    bool found = fs::exists(path, ec);
    if (ec) throw IoError(path, "Cannot access file (" + ec.message() + ")");
    return found;
}

std::string load_edit_source(FileSystem& fsys, const std::string& path, bool& exists) {
    exists = edit_target_exists(path);
    if (!exists) return std::string();
    return fsys.read_file(path);
}
