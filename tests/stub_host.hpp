// In-memory collaborators for driving an edit session without a terminal.
#pragma once

#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "kernel/host.hpp"

namespace ie::stubs {

class StubFileSystem : public FileSystem {
 public:
  fs::path create_temporary_directory(const std::string& prefix) override {
    ++create_calls;
    if (fail_create) throw IoError("/stub", "stub: cannot create directory");
    fs::path dir = fs::path("/stub") / (prefix + std::to_string(create_calls));
    dirs.insert(dir);
    return dir;
  }

  void write_file(const fs::path& path, const std::string& bytes) override {
    ++write_calls;
    if (fail_write) throw IoError(path, "stub: disk full");
    if (!dirs.count(path.parent_path())) throw IoError(path, "stub: no such directory");
    files[path] = bytes;
  }

  std::string read_file(const fs::path& path) override {
    ++read_calls;
    if (fail_read) throw IoError(path, "stub: unreadable");
    auto it = files.find(path);
    if (it == files.end()) throw IoError(path, "stub: no such file");
    return it->second;
  }

  void remove_recursive(const fs::path& path) override {
    ++remove_calls;
    removed.push_back(path);
    if (fail_remove) throw IoError(path, "stub: busy");
    dirs.erase(path);
    for (auto it = files.begin(); it != files.end();) {
      if (it->first.parent_path() == path) {
        it = files.erase(it);
      } else {
        ++it;
      }
    }
  }

  bool exists(const fs::path& path) const {
    return dirs.count(path) > 0 || files.count(path) > 0;
  }

  std::set<fs::path> dirs;
  std::map<fs::path, std::string> files;
  std::vector<fs::path> removed;
  int create_calls = 0;
  int write_calls = 0;
  int read_calls = 0;
  int remove_calls = 0;
  bool fail_create = false;
  bool fail_write = false;
  bool fail_read = false;
  bool fail_remove = false;
};

class StubEnvironment : public Environment {
 public:
  std::optional<std::string> get(const std::string& name) const override {
    auto it = vars.find(name);
    if (it == vars.end()) return std::nullopt;
    return it->second;
  }
  bool lookup_executable(const std::string& name) const override {
    ++lookups;
    return executables.count(name) > 0;
  }

  std::map<std::string, std::string> vars;
  std::set<std::string> executables;
  mutable int lookups = 0;
};

class StubLauncher : public ProcessLauncher {
 public:
  int spawn_foreground(const EditorInvocation& invocation) override {
    ++calls;
    last = invocation;
    return behavior ? behavior(invocation) : 0;
  }

  std::function<int(const EditorInvocation&)> behavior;
  std::optional<EditorInvocation> last;
  int calls = 0;
};

}  // namespace ie::stubs
