#pragma once

#include "cli_config.hpp"
#include "kernel/edit_session.hpp"

// Applies the configured defaults to `session`. Throws ie::EditError when an
// editor rule is invalid.
void configure_session(ie::InteractiveEditSession& session, const CliConfig& config);
