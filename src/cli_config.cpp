// CLI configuration YAML read/write implementation
#include "cli_config.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <yaml-cpp/yaml.h>

#include <pwd.h>
#include <unistd.h>

#include "ie_types.hpp" // for ie::fs alias

using namespace ie; // for fs

bool write_config_to_file(const CliConfig& config, const std::string& path) {
    YAML::Node root;
    root["_comment1"] = "interedit configuration.";
    root["fallback_editor"] = config.fallback_editor;
    root["default_name"] = config.default_name;
    root["default_line_offset"] = config.default_line_offset;
    root["temp_prefix"] = config.temp_prefix;
    root["show_summary"] = config.show_summary;
    root["confirm_write"] = config.confirm_write;

    YAML::Node rules(YAML::NodeType::Sequence);
    for (const auto& rule : config.editor_rules) {
        YAML::Node r;
        r["match"] = rule.pattern;
        r["args"] = rule.arg_template;
        rules.push_back(r);
    }
    root["editor_rules"] = rules;

    try {
        std::ofstream fout(path);
        if (!fout) return false;
        fout << root;
        return static_cast<bool>(fout);
    } catch (const std::exception&) {
        return false;
    }
}

bool load_config(const std::string& config_path, CliConfig& config) {
    std::error_code ec;
    if (!fs::exists(config_path, ec) || ec) return false;

    CliConfig loaded = config;
    try {
        YAML::Node root = YAML::LoadFile(config_path);
        if (root["fallback_editor"]) loaded.fallback_editor = root["fallback_editor"].as<std::string>();
        if (root["default_name"]) loaded.default_name = root["default_name"].as<std::string>();
        if (root["default_line_offset"]) loaded.default_line_offset = root["default_line_offset"].as<int>();
        if (root["temp_prefix"]) loaded.temp_prefix = root["temp_prefix"].as<std::string>();
        if (root["show_summary"]) loaded.show_summary = root["show_summary"].as<bool>();
        if (root["confirm_write"]) loaded.confirm_write = root["confirm_write"].as<bool>();

        if (root["editor_rules"] && root["editor_rules"].IsSequence()) {
            loaded.editor_rules.clear();
            for (const auto& r : root["editor_rules"]) {
                EditorInvocationRule rule;
                rule.pattern = r["match"].as<std::string>();
                rule.arg_template = r["args"].as<std::vector<std::string>>();
                loaded.editor_rules.push_back(rule);
            }
        }
        loaded.loaded_config_path = fs::absolute(config_path).string();
    } catch (const std::exception& e) {
        std::cerr << "Warning: Could not parse config file '" << config_path
                  << "'. Using default settings. Error: " << e.what() << std::endl;
        return false;
    }
    config = loaded;
    return true;
}

std::string default_config_path() {
    const char* home = getenv("HOME");
    if (home == nullptr) {
        struct passwd* pw = getpwuid(getuid());
        if (pw) {
            home = pw->pw_dir;
        }
    }
    if (home == nullptr || *home == '\0') {
        return ".interedit.yaml"; // fallback to current dir
    }
    return (fs::path(home) / ".interedit.yaml").string();
}
