#include "kernel/services/local_host.hpp"

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>
#include <vector>

#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace ie {

namespace {

// While the editor owns the terminal, ^C and ^\ belong to it; the parent
// ignores them until the child is gone.
class TerminalSignalGuard {
 public:
  TerminalSignalGuard() {
    struct sigaction ignore;
    std::memset(&ignore, 0, sizeof(ignore));
    ignore.sa_handler = SIG_IGN;
    sigemptyset(&ignore.sa_mask);
    sigaction(SIGINT, &ignore, &old_int_);
    sigaction(SIGQUIT, &ignore, &old_quit_);
  }
  ~TerminalSignalGuard() {
    sigaction(SIGINT, &old_int_, nullptr);
    sigaction(SIGQUIT, &old_quit_, nullptr);
  }
  TerminalSignalGuard(const TerminalSignalGuard&) = delete;
  TerminalSignalGuard& operator=(const TerminalSignalGuard&) = delete;

  // Called in the child: the editor inherits whatever the caller had.
  void restore_in_child() const {
    sigaction(SIGINT, &old_int_, nullptr);
    sigaction(SIGQUIT, &old_quit_, nullptr);
  }

 private:
  struct sigaction old_int_;
  struct sigaction old_quit_;
};

bool is_executable_file(const fs::path& p) {
  struct stat st;
  if (::stat(p.c_str(), &st) != 0) return false;
  if (!S_ISREG(st.st_mode)) return false;
  return ::access(p.c_str(), X_OK) == 0;
}

}  // namespace

fs::path LocalFileSystem::create_temporary_directory(const std::string& prefix) {
  fs::path base = base_dir_;
  if (base.empty()) {
    std::error_code ec;
    base = fs::temp_directory_path(ec);
    if (ec) {
      throw IoError("$TMPDIR", "Cannot determine temporary directory (" +
                                   ec.message() + ")");
    }
  }
  std::string tmpl = (base / (prefix + "XXXXXX")).string();
  std::vector<char> buf(tmpl.begin(), tmpl.end());
  buf.push_back('\0');
  if (::mkdtemp(buf.data()) == nullptr) {
    throw IoError(tmpl, std::string("Failed to create temporary directory (") +
                            std::strerror(errno) + ")");
  }
  return fs::path(buf.data());
}

void LocalFileSystem::write_file(const fs::path& path, const std::string& bytes) {
  std::ofstream fout(path, std::ios::binary | std::ios::trunc);
  if (!fout) {
    throw IoError(path, "Failed to open file for writing");
  }
  fout.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
  fout.close();
  if (!fout) {
    throw IoError(path, "Failed to write file");
  }
}

std::string LocalFileSystem::read_file(const fs::path& path) {
  std::ifstream fin(path, std::ios::binary);
  if (!fin) {
    throw IoError(path, "Failed to open file for reading");
  }
  std::ostringstream ss;
  ss << fin.rdbuf();
  if (fin.bad()) {
    throw IoError(path, "Failed to read file");
  }
  return ss.str();
}

void LocalFileSystem::remove_recursive(const fs::path& path) {
  std::error_code ec;
  fs::remove_all(path, ec);
  if (ec) {
    throw IoError(path, "Failed to remove (" + ec.message() + ")");
  }
}

LocalFileSystem& LocalFileSystem::instance() {
  static LocalFileSystem fs_impl;
  return fs_impl;
}

std::optional<std::string> ProcessEnvironment::get(const std::string& name) const {
  const char* v = std::getenv(name.c_str());
  if (v == nullptr) return std::nullopt;
  return std::string(v);
}

bool ProcessEnvironment::lookup_executable(const std::string& name) const {
  if (name.empty()) return false;
  if (name.find('/') != std::string::npos) return is_executable_file(name);

  auto path_var = get("PATH");
  if (!path_var) return false;
  std::istringstream iss(*path_var);
  std::string dir;
  while (std::getline(iss, dir, ':')) {
    // An empty entry means the current directory.
    fs::path candidate = dir.empty() ? fs::path(name) : fs::path(dir) / name;
    if (is_executable_file(candidate)) return true;
  }
  return false;
}

ProcessEnvironment& ProcessEnvironment::instance() {
  static ProcessEnvironment env;
  return env;
}

int TerminalLauncher::spawn_foreground(const EditorInvocation& invocation) {
  std::vector<std::string> args = invocation.argv();
  std::vector<char*> argv;
  argv.reserve(args.size() + 1);
  for (auto& a : args) argv.push_back(const_cast<char*>(a.c_str()));
  argv.push_back(nullptr);

  TerminalSignalGuard guard;

  pid_t pid = ::fork();
  if (pid < 0) {
    throw EditError(EditErrc::Spawn, "Failed to start '" + invocation.program +
                                         "': " + std::strerror(errno));
  }
  if (pid == 0) {
    // Child: stdio is inherited as-is. Put back the caller's signal
    // dispositions before handing the terminal to the editor.
    guard.restore_in_child();
    ::execvp(argv[0], argv.data());
    ::_exit(127);
  }

  int status = 0;
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      throw EditError(EditErrc::Spawn, "Failed to wait for '" +
                                           invocation.program + "': " +
                                           std::strerror(errno));
    }
  }
  if (WIFEXITED(status)) return WEXITSTATUS(status);
  if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
  return 1;
}

TerminalLauncher& TerminalLauncher::instance() {
  static TerminalLauncher launcher;
  return launcher;
}

}  // namespace ie
