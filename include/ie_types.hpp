#pragma once
#include <filesystem>
#include <stdexcept>
#include <string>

namespace ie {
namespace fs = std::filesystem;

#if defined(_WIN32)
    #if defined(INTEREDIT_LIB_BUILD)
        #define INTEREDIT_API __declspec(dllexport)
    #else
        #define INTEREDIT_API __declspec(dllimport)
    #endif
#else // Non-Windows platforms
    #if defined(INTEREDIT_LIB_BUILD)
        #define INTEREDIT_API __attribute__((visibility("default")))
    #else
        #define INTEREDIT_API
    #endif
#endif

enum class EditErrc {
    Unknown = 1, Io, EditorExit, Spawn, InvalidConfig,
};

struct INTEREDIT_API EditError : public std::runtime_error {
    explicit EditError(const std::string& what)
        : std::runtime_error(what), code_(EditErrc::Unknown) {}
    EditError(EditErrc code, const std::string& what)
        : std::runtime_error(what), code_(code) {}
    EditErrc code() const noexcept { return code_; }
private:
    EditErrc code_;
};

// Filesystem trouble: creating, writing, reading or removing temp state.
struct INTEREDIT_API IoError : public EditError {
    IoError(const fs::path& path, const std::string& what)
        : EditError(EditErrc::Io, what + ": " + path.string()), path_(path) {}
    const fs::path& path() const noexcept { return path_; }
private:
    fs::path path_;
};

// The editor ran and exited non-zero. Callers usually treat this as
// "edit cancelled".
struct INTEREDIT_API EditorExitError : public EditError {
    explicit EditorExitError(int exit_code)
        : EditError(EditErrc::EditorExit,
                    "Editor exited with an error code (#" + std::to_string(exit_code) + ")."),
          exit_code_(exit_code) {}
    int exit_code() const noexcept { return exit_code_; }
private:
    int exit_code_;
};

INTEREDIT_API const char* errc_name(EditErrc code);

} // namespace ie
