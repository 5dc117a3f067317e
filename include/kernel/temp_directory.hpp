// interedit kernel: per-invocation temporary directory
#pragma once

#include <string>

#include "ie_types.hpp"

namespace ie {

class FileSystem;
class EditEventService;

// Owns one directory created through a FileSystem and removes it, with
// everything inside, when it goes out of scope. A failed removal is recorded
// in `events` (when given) and never thrown from the destructor.
class INTEREDIT_API ScopedTempDirectory {
public:
    ScopedTempDirectory(FileSystem& fs, const std::string& prefix,
                        EditEventService* events = nullptr);
    ~ScopedTempDirectory();

    ScopedTempDirectory(const ScopedTempDirectory&) = delete;
    ScopedTempDirectory& operator=(const ScopedTempDirectory&) = delete;

    const fs::path& path() const { return path_; }

private:
    FileSystem& fs_;
    EditEventService* events_;
    fs::path path_;
};

} // namespace ie
