// interedit kernel: collaborators an edit session runs against
#pragma once

#include <optional>
#include <string>

#include "ie_types.hpp"
#include "kernel/invocation_rules.hpp"

namespace ie {

class INTEREDIT_API FileSystem {
public:
    virtual ~FileSystem() = default;

    // Creates a new, uniquely named, writable directory. Throws IoError.
    virtual fs::path create_temporary_directory(const std::string& prefix) = 0;
    // Byte-for-byte. Throws IoError.
    virtual void write_file(const fs::path& path, const std::string& bytes) = 0;
    virtual std::string read_file(const fs::path& path) = 0;
    // Throws IoError when the tree could not be removed.
    virtual void remove_recursive(const fs::path& path) = 0;
};

class INTEREDIT_API Environment {
public:
    virtual ~Environment() = default;

    virtual std::optional<std::string> get(const std::string& name) const = 0;
    virtual bool lookup_executable(const std::string& name) const = 0;
};

class INTEREDIT_API ProcessLauncher {
public:
    virtual ~ProcessLauncher() = default;

    // Runs `invocation` with the caller's stdin/stdout/stderr and blocks until
    // it exits. Returns the exit status; throws EditError(Spawn) when no
    // process could be created.
    virtual int spawn_foreground(const EditorInvocation& invocation) = 0;
};

} // namespace ie
