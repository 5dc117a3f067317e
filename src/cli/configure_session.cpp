// FILE: src/cli/configure_session.cpp
#include "cli/configure_session.hpp"

void configure_session(ie::InteractiveEditSession& session, const CliConfig& config) {
    auto rules = ie::EditorInvocationRules::defaults();
    // add_rule puts each rule in front, so walk backwards to keep file order.
    for (auto it = config.editor_rules.rbegin(); it != config.editor_rules.rend(); ++it) {
        rules.add_rule(*it);
    }
    session.set_rules(rules)
        .set_fallback_editor(config.fallback_editor)
        .set_temp_prefix(config.temp_prefix)
        .set_line_offset(config.default_line_offset);
    if (!config.default_name.empty()) session.set_name(config.default_name);
}
