// interedit kernel: hand a document to the user's $EDITOR and take it back
#pragma once

#include <string>

#include "ie_types.hpp"
#include "kernel/host.hpp"
#include "kernel/invocation_rules.hpp"
#include "kernel/services/edit_event_service.hpp"

namespace ie {

// Edit a document interactively by launching the user's editor on a
// temporary copy:
//
//   ie::InteractiveEditSession session(document);
//   std::string result = session.set_name("shopping_list")
//                            .set_line_offset(15)
//                            .edit_interactively();
//
// The session holds no resources between calls. Each edit_interactively()
// creates its own temporary directory and removes it before returning or
// throwing.
class INTEREDIT_API InteractiveEditSession {
public:
    static constexpr const char* kUntitled = "untitled";
    static constexpr const char* kDefaultFallbackEditor = "nano";
    static constexpr const char* kDefaultTempPrefix = "edit.";

    // Runs against the local filesystem, process environment and terminal.
    explicit InteractiveEditSession(std::string content);
    InteractiveEditSession(std::string content, FileSystem& fs,
                           Environment& env, ProcessLauncher& launcher,
                           EditEventService* events = nullptr);

    InteractiveEditSession(const InteractiveEditSession&) = delete;
    InteractiveEditSession& operator=(const InteractiveEditSession&) = delete;

    // Only [A-Za-z0-9._-] is kept. The name becomes the temp file's basename,
    // so editors can pick a mode from its extension.
    InteractiveEditSession& set_name(const std::string& name);
    std::string name() const;

    // Line the cursor is placed on when the editor opens. The string form
    // takes the leading integer ("12abc" -> 12, "abc" -> 0).
    InteractiveEditSession& set_line_offset(int offset);
    InteractiveEditSession& set_line_offset(const std::string& offset);
    int line_offset() const { return line_offset_; }

    InteractiveEditSession& set_content(const std::string& content);
    const std::string& content() const { return content_; }

    // Used when $EDITOR is unset and there is no `editor` on the PATH.
    InteractiveEditSession& set_fallback_editor(const std::string& editor);
    const std::string& fallback_editor() const { return fallback_editor_; }

    InteractiveEditSession& set_temp_prefix(const std::string& prefix);
    const std::string& temp_prefix() const { return temp_prefix_; }

    InteractiveEditSession& set_rules(EditorInvocationRules rules);
    const EditorInvocationRules& rules() const { return rules_; }

    // $EDITOR, else `editor` if it is on the PATH, else the fallback.
    // Evaluated again on every call.
    std::string resolve_editor_command() const;

    // The command line edit_interactively() would run against `path`.
    EditorInvocation build_invocation(const fs::path& path) const;

    // Throws IoError when the document cannot be written or read back and
    // EditorExitError when the editor exits non-zero. content() only changes
    // when the whole edit succeeds.
    const std::string& edit_interactively();

    // Events recorded by this session. Cleanup failures land here.
    EditEventService& events() { return *events_; }

private:
    std::string content_;
    std::string name_;
    int line_offset_ = 0;
    std::string fallback_editor_ = kDefaultFallbackEditor;
    std::string temp_prefix_ = kDefaultTempPrefix;
    EditorInvocationRules rules_ = EditorInvocationRules::defaults();

    FileSystem& fs_;
    Environment& env_;
    ProcessLauncher& launcher_;
    EditEventService own_events_;
    EditEventService* events_;
};

// Keeps only [A-Za-z0-9._-].
INTEREDIT_API std::string sanitize_name(const std::string& name);
// Leading-integer coercion used by set_line_offset(const std::string&).
INTEREDIT_API int coerce_line_offset(const std::string& text);

} // namespace ie
