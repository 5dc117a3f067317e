// interedit kernel: editor command line construction
#pragma once

#include <string>
#include <vector>

#include "ie_types.hpp"

namespace ie {

// A fully built editor command line. Each element of argv() reaches the
// child process as exactly one argument; nothing is re-split by a shell.
struct INTEREDIT_API EditorInvocation {
    std::string program;
    std::vector<std::string> args;

    std::vector<std::string> argv() const;
    // Shell-quoted rendering for messages. Never executed.
    std::string display() const;
};

// `pattern` is matched (ECMAScript) against the start of the editor command.
// Each element of `arg_template` becomes one argument after `{line}` and
// `{path}` are substituted.
struct INTEREDIT_API EditorInvocationRule {
    std::string pattern;
    std::vector<std::string> arg_template;
};

class INTEREDIT_API EditorInvocationRules {
public:
    // Built-in table: TextMate's `mate` takes `-l <line>`; everything else
    // falls through to the `+<line>` convention.
    static EditorInvocationRules defaults();

    // Custom rules are consulted before the ones already present.
    EditorInvocationRules& add_rule(const EditorInvocationRule& rule);

    const std::vector<EditorInvocationRule>& rules() const { return rules_; }

    // Returns the rule that applies to `editor`, or nullptr for the fallback.
    const EditorInvocationRule* match(const std::string& editor) const;

    EditorInvocation build(const std::string& editor, int line_offset,
                           const fs::path& path) const;

private:
    std::vector<EditorInvocationRule> rules_;
    std::vector<std::string> fallback_template_{"+{line}", "{path}"};
};

// Splits an editor command such as "emacsclient -t" on whitespace.
INTEREDIT_API std::vector<std::string> split_editor_command(const std::string& editor);

INTEREDIT_API std::string shell_quote(const std::string& arg);

} // namespace ie
