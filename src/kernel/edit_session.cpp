#include "kernel/edit_session.hpp"

#include <cctype>
#include <climits>
#include <utility>

#include "kernel/services/local_host.hpp"
#include "kernel/temp_directory.hpp"

namespace ie {

std::string sanitize_name(const std::string& name) {
    std::string out;
    out.reserve(name.size());
    for (char c : name) {
        bool keep = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                    (c >= '0' && c <= '9') || c == '.' || c == '_' || c == '-';
        if (keep) out += c;
    }
    return out;
}

int coerce_line_offset(const std::string& text) {
    size_t i = 0;
    while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i]))) ++i;
    bool negative = false;
    if (i < text.size() && (text[i] == '+' || text[i] == '-')) {
        negative = text[i] == '-';
        ++i;
    }
    long long value = 0;
    for (; i < text.size() && std::isdigit(static_cast<unsigned char>(text[i])); ++i) {
        value = value * 10 + (text[i] - '0');
        if (value > static_cast<long long>(INT_MAX) + 1) break;
    }
    if (negative) value = -value;
    if (value > INT_MAX) return INT_MAX;
    if (value < INT_MIN) return INT_MIN;
    return static_cast<int>(value);
}

InteractiveEditSession::InteractiveEditSession(std::string content)
    : InteractiveEditSession(std::move(content), LocalFileSystem::instance(),
                             ProcessEnvironment::instance(),
                             TerminalLauncher::instance()) {}

InteractiveEditSession::InteractiveEditSession(std::string content,
                                               FileSystem& fs,
                                               Environment& env,
                                               ProcessLauncher& launcher,
                                               EditEventService* events)
    : content_(std::move(content)),
      fs_(fs),
      env_(env),
      launcher_(launcher),
      events_(events ? events : &own_events_) {}

InteractiveEditSession& InteractiveEditSession::set_name(const std::string& name) {
    name_ = sanitize_name(name);
    return *this;
}

std::string InteractiveEditSession::name() const {
    // "." and ".." pass the filter but would not name a file in the temp dir.
    if (name_.empty() || name_ == "." || name_ == "..") return kUntitled;
    return name_;
}

InteractiveEditSession& InteractiveEditSession::set_line_offset(int offset) {
    line_offset_ = offset;
    return *this;
}

InteractiveEditSession& InteractiveEditSession::set_line_offset(const std::string& offset) {
    line_offset_ = coerce_line_offset(offset);
    return *this;
}

InteractiveEditSession& InteractiveEditSession::set_content(const std::string& content) {
    content_ = content;
    return *this;
}

InteractiveEditSession& InteractiveEditSession::set_fallback_editor(const std::string& editor) {
    fallback_editor_ = editor;
    return *this;
}

InteractiveEditSession& InteractiveEditSession::set_temp_prefix(const std::string& prefix) {
    temp_prefix_ = sanitize_name(prefix);
    if (temp_prefix_.empty()) temp_prefix_ = kDefaultTempPrefix;
    return *this;
}

InteractiveEditSession& InteractiveEditSession::set_rules(EditorInvocationRules rules) {
    rules_ = std::move(rules);
    return *this;
}

std::string InteractiveEditSession::resolve_editor_command() const {
    auto editor = env_.get("EDITOR");
    if (editor && !editor->empty()) return *editor;

    // Some systems provide an `editor` alternative linked to something sensible.
    if (env_.lookup_executable("editor")) return "editor";

    return fallback_editor_;
}

EditorInvocation InteractiveEditSession::build_invocation(const fs::path& path) const {
    return rules_.build(resolve_editor_command(), line_offset_, path);
}

const std::string& InteractiveEditSession::edit_interactively() {
    std::string result;
    {
        // Every way out of this scope removes the directory.
        ScopedTempDirectory tmp(fs_, temp_prefix_, events_);
        const fs::path path = tmp.path() / name();

        fs_.write_file(path, content_);

        EditorInvocation invocation = build_invocation(path);
        events_->push(EditEventService::Kind::EditorLaunched, invocation.display());
        int err = launcher_.spawn_foreground(invocation);
        events_->push(EditEventService::Kind::EditorExited, std::to_string(err));
        if (err != 0) {
            throw EditorExitError(err);
        }

        result = fs_.read_file(path);
    }
    content_ = std::move(result);
    return content_;
}

} // namespace ie
