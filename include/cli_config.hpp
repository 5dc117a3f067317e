// interedit CLI configuration definition and I/O declarations
#pragma once

#include <string>
#include <vector>

#include "kernel/invocation_rules.hpp"

struct CliConfig {
    std::string loaded_config_path;
    std::string fallback_editor = "nano";
    std::string default_name = "";
    int default_line_offset = 0;
    std::string temp_prefix = "edit.";
    bool show_summary = false;
    bool confirm_write = false;
    // Consulted before the built-in rules, in file order.
    std::vector<ie::EditorInvocationRule> editor_rules;
};

// Persist the configuration to a YAML file at `path`.
// Returns true on success.
bool write_config_to_file(const CliConfig& config, const std::string& path);

// Load `config_path` into `config` if it exists. Returns false when the file
// is missing or cannot be parsed; `config` keeps its defaults in that case.
bool load_config(const std::string& config_path, CliConfig& config);

// ~/.interedit.yaml, or .interedit.yaml when no home directory is known.
std::string default_config_path();
