#pragma once

#include <optional>
#include <string>
#include <utility>

#include "kernel/host.hpp"

namespace ie {

class INTEREDIT_API LocalFileSystem : public FileSystem {
 public:
  LocalFileSystem() = default;
  // Temporary directories are created under `base_dir` instead of the
  // system temp directory.
  explicit LocalFileSystem(fs::path base_dir) : base_dir_(std::move(base_dir)) {}

  fs::path create_temporary_directory(const std::string& prefix) override;
  void write_file(const fs::path& path, const std::string& bytes) override;
  std::string read_file(const fs::path& path) override;
  void remove_recursive(const fs::path& path) override;

  static LocalFileSystem& instance();

 private:
  fs::path base_dir_;
};

class INTEREDIT_API ProcessEnvironment : public Environment {
 public:
  std::optional<std::string> get(const std::string& name) const override;
  // Scans $PATH for an executable regular file called `name`. Names that
  // contain a '/' are checked directly.
  bool lookup_executable(const std::string& name) const override;

  static ProcessEnvironment& instance();
};

class INTEREDIT_API TerminalLauncher : public ProcessLauncher {
 public:
  // 127 when the program could not be executed, 128 + signo when the child
  // was killed by a signal.
  int spawn_foreground(const EditorInvocation& invocation) override;

  static TerminalLauncher& instance();
};

}  // namespace ie
